#include "envelope.hpp"
#include "errors.hpp"
#include "priority.hpp"
#include "util.hpp"
#include <algorithm>
#include <cstring>
#include <sstream>

static void validate_fields(const std::string& topic, const std::string& body) {
  if (topic.size() > MAX_TOPIC_SIZE) {
    throw IpcError(ErrorCode::TOPIC_TOO_LONG, "topic is " + std::to_string(topic.size()) + " bytes, max " + std::to_string(MAX_TOPIC_SIZE));
  }
  if (body.size() > MAX_BODY_SIZE) {
    throw IpcError(ErrorCode::BODY_TOO_LONG, "body is " + std::to_string(body.size()) + " bytes, max " + std::to_string(MAX_BODY_SIZE));
  }
  if (!is_valid_utf8(topic)) {
    throw IpcError(ErrorCode::MALFORMED_TEXT, "topic is not valid UTF-8");
  }
  if (!is_valid_utf8(body)) {
    throw IpcError(ErrorCode::MALFORMED_TEXT, "body is not valid UTF-8");
  }
}

void encode_envelope_into(Envelope& slot, const std::string& topic, const std::string& body, uint8_t priority, uint64_t timestamp) {
  validate_fields(topic, body);

  // Zero the whole record, alignment padding included.
  std::memset(&slot, 0, sizeof(Envelope));
  std::memcpy(slot.topic, topic.data(), topic.size());
  slot.topic_length = static_cast<uint8_t>(topic.size());
  std::memcpy(slot.body, body.data(), body.size());
  slot.body_length = static_cast<uint16_t>(body.size());
  slot.priority = priority;
  slot.timestamp = timestamp;
}

Envelope encode_envelope(const std::string& topic, const std::string& body, uint8_t priority, uint64_t timestamp) {
  Envelope envelope;
  encode_envelope_into(envelope, topic, body, priority, timestamp);
  return envelope;
}

Envelope encode_envelope(const std::string& topic, const std::string& body, uint8_t priority) {
  return encode_envelope(topic, body, priority, now_millis());
}

DecodedEnvelope decode_envelope(const Envelope& envelope) {
  // Copy the scalar fields once; another process may still be writing the slot.
  const uint8_t topic_length = envelope.topic_length;
  const uint16_t body_length = envelope.body_length;

  if (topic_length > MAX_TOPIC_SIZE) {
    throw IpcError(ErrorCode::LENGTH_OUT_OF_RANGE, "topic_length " + std::to_string(topic_length) + " exceeds " + std::to_string(MAX_TOPIC_SIZE));
  }
  if (body_length > MAX_BODY_SIZE) {
    throw IpcError(ErrorCode::LENGTH_OUT_OF_RANGE, "body_length " + std::to_string(body_length) + " exceeds " + std::to_string(MAX_BODY_SIZE));
  }

  // Validate the copies, not the slot, so what is checked is what is returned.
  DecodedEnvelope out;
  out.topic.assign(reinterpret_cast<const char*>(envelope.topic), topic_length);
  out.body.assign(reinterpret_cast<const char*>(envelope.body), body_length);
  out.priority = envelope.priority;
  out.timestamp = envelope.timestamp;

  if (!is_valid_utf8(out.topic)) {
    throw IpcError(ErrorCode::MALFORMED_TEXT, "topic is not valid UTF-8");
  }
  if (!is_valid_utf8(out.body)) {
    throw IpcError(ErrorCode::MALFORMED_TEXT, "body is not valid UTF-8");
  }
  return out;
}

nlohmann::json decode_body_json(const std::string& body, bool* parsed_ok) {
  nlohmann::json parsed = nlohmann::json::parse(body, nullptr, false);
  if (parsed_ok)
    *parsed_ok = !parsed.is_discarded();
  if (parsed.is_discarded()) {
    return nlohmann::json{{"error", "Invalid JSON payload"}};
  }
  return parsed;
}

std::string describe_envelope(const Envelope& envelope) {
  std::ostringstream oss;
  try {
    DecodedEnvelope decoded = decode_envelope(envelope);
    oss << "Envelope { timestamp: " << decoded.timestamp << ", topic='" << decoded.topic << "', priority=" << priority_name(decoded.priority) << ", body='" << decoded.body
        << "' }";
  } catch (const IpcError& e) {
    oss << "Envelope { error: " << e.what() << " }";
  }
  return oss.str();
}

std::string service_name_for_topic(const std::string& topic) {
  std::string name = topic;
  std::replace(name.begin(), name.end(), ' ', '_');
  return "Amadeus/Message/" + name;
}
