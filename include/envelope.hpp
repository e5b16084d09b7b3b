// Envelope: the fixed-size record exchanged between processes
//
// Overview:
// - `Envelope` has a constant size and fixed field offsets so a transport can
//   place it directly in a pre-allocated shared-memory slot
// - Topic and body are zero-padded byte arrays with explicit lengths; bytes
//   past the declared length carry no meaning and are never read
// - `encode_envelope()` validates bounds before any buffer is written
// - `decode_envelope()` validates lengths and UTF-8 before building strings,
//   since the slot may have been written by another (untrusted) process
#ifndef ENVELOPE_HPP
#define ENVELOPE_HPP
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>

// Capacities of the two variable-content fields, in bytes.
#define MAX_TOPIC_SIZE 64
#define MAX_BODY_SIZE 4096

// Name the payload type is registered under by peers.
#define ENVELOPE_TYPE_NAME "AmadeusMessage"

// Default service every publisher and subscriber attaches to.
#define DEFAULT_SERVICE_NAME "Amadeus/Message/Service"

// C layout with natural alignment; identical to the peers' repr(C) record.
// Alignment padding (offset 4161 and 4165..4167) is zeroed by the encoder
// and ignored by the decoder.
struct Envelope {
  uint8_t topic[MAX_TOPIC_SIZE];
  uint8_t topic_length;
  uint8_t body[MAX_BODY_SIZE];
  uint16_t body_length;
  uint8_t priority;
  uint64_t timestamp;
};

static_assert(std::is_trivially_copyable<Envelope>::value, "Envelope must be trivially copyable");
static_assert(offsetof(Envelope, topic_length) == 64, "topic_length offset");
static_assert(offsetof(Envelope, body) == 65, "body offset");
static_assert(offsetof(Envelope, body_length) == 4162, "body_length offset");
static_assert(offsetof(Envelope, priority) == 4164, "priority offset");
static_assert(offsetof(Envelope, timestamp) == 4168, "timestamp offset");
static_assert(sizeof(Envelope) == 4176, "Envelope size must stay constant");

// Logical view of an envelope after validation.
struct DecodedEnvelope {
  std::string topic;
  std::string body;
  uint8_t priority = 1;
  uint64_t timestamp = 0;
};

// Build an envelope. Throws IpcError TOPIC_TOO_LONG / BODY_TOO_LONG when a
// field exceeds its capacity, MALFORMED_TEXT when input is not UTF-8.
Envelope encode_envelope(const std::string& topic, const std::string& body, uint8_t priority, uint64_t timestamp);
// Same, stamped with the current wall-clock time in milliseconds.
Envelope encode_envelope(const std::string& topic, const std::string& body, uint8_t priority);

// Encode in place into a caller-owned slot (e.g. a loaned transport buffer).
// The slot is left untouched when validation fails.
void encode_envelope_into(Envelope& slot, const std::string& topic, const std::string& body, uint8_t priority, uint64_t timestamp);

// Throws IpcError LENGTH_OUT_OF_RANGE if a declared length exceeds capacity,
// MALFORMED_TEXT if the declared bytes are not valid UTF-8.
DecodedEnvelope decode_envelope(const Envelope& envelope);

// Parse a body as JSON. Never throws: malformed input yields
// {"error": "Invalid JSON payload"} and sets *parsed_ok to false.
nlohmann::json decode_body_json(const std::string& body, bool* parsed_ok = nullptr);

// One-line human readable summary, safe on malformed envelopes.
std::string describe_envelope(const Envelope& envelope);

// "Amadeus/Message/<topic>" with spaces replaced by '_'.
std::string service_name_for_topic(const std::string& topic);
#endif
