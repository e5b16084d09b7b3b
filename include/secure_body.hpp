#pragma once
// Secure body adapter: decides from field presence whether an envelope body
// is plaintext, hybrid-encrypted or legacy RSA-encrypted, and opens it.
//
// Detection order is Hybrid, Legacy, Plaintext:
// - `secure_key` + `iv` + `secure_payload` (all strings)  -> HYBRID
// - `secure_key` without the other two, or a non-string
//   secure field                                          -> MALFORMED
// - `secure_payload` without `secure_key`                 -> LEGACY
// - anything else, including non-object JSON              -> PLAINTEXT
//
// Any `secure_key` + `secure_payload` pairing is taken to be intentional
// hybrid encryption; a MALFORMED body is a decryption error, never retried
// as legacy or delivered as plaintext.
#include "crypto.hpp"
#include "envelope.hpp"
#include "errors.hpp"
#include "transport.hpp"
#include <cstddef>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>

enum class BodyKind { PLAINTEXT, HYBRID, LEGACY, MALFORMED };

const char* body_kind_name(BodyKind kind);

BodyKind classify_body(const nlohmann::json& body);

// Fill `out` from a HYBRID or LEGACY body. False for the other kinds.
bool extract_secure_fields(const nlohmann::json& body, SecureFields& out);

// Outcome of opening one body. On failure `payload` is null and
// `error`/`error_code` describe the problem.
struct OpenedBody {
  BodyKind kind = BodyKind::PLAINTEXT;
  nlohmann::json payload;
  bool ok = false;
  std::string error;
  ErrorCode error_code = ErrorCode::CRYPTO_FAILURE;
};

// Never throws for bad input; an empty `private_key` turns encrypted bodies
// into errors.
OpenedBody open_body(const nlohmann::json& body, const RsaKey& private_key);

enum class SealMode { PLAINTEXT, HYBRID, LEGACY };

// "plaintext", "hybrid", "legacy".
bool parse_seal_mode(const std::string& name, SealMode& out);
const char* seal_mode_name(SealMode mode);

// Serialize `payload` and, unless mode is PLAINTEXT, encrypt it for
// `recipient`. Returns the body text to put in an envelope.
std::string seal_body(const nlohmann::json& payload, const RsaKey& recipient, SealMode mode, const RandomSource& random = openssl_random);

// seal_body + encode_envelope. Throws BODY_TOO_LONG when the sealed body
// does not fit (hybrid output is ~4/3 of the plaintext plus ~400 bytes).
Envelope seal_envelope(const std::string& topic, const nlohmann::json& payload, uint8_t priority, uint64_t timestamp, const RsaKey& recipient, SealMode mode,
                       const RandomSource& random = openssl_random);

// A decoded, opened envelope as delivered to the application.
struct ReceivedMessage {
  std::string topic;
  uint8_t priority = 1;
  uint64_t timestamp = 0;
  BodyKind kind = BodyKind::PLAINTEXT;
  nlohmann::json payload;
  bool ok = false;
  std::string error;
  ErrorCode error_code = ErrorCode::CRYPTO_FAILURE;
};

// Receive side of the protocol. Each failure affects only its own message.
class SecureReceiver {
  RsaKey private_key;
  size_t delivered_count = 0;
  size_t failed_count = 0;

public:
  // Without a key: plaintext only, encrypted bodies are reported as errors.
  SecureReceiver() = default;
  explicit SecureReceiver(RsaKey key);

  bool can_decrypt() const {
    return !private_key.empty() && private_key.has_private();
  }

  // Decode, parse and open one envelope.
  ReceivedMessage receive(const Envelope& envelope);

  // Poll `subscriber` until it reports no message, passing every result
  // (failed ones included) to `handler`. Returns the number handled.
  size_t drain(Subscriber& subscriber, const std::function<void(const ReceivedMessage&)>& handler);

  size_t delivered() const {
    return delivered_count;
  }
  size_t failed() const {
    return failed_count;
  }
};
