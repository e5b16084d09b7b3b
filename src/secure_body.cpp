#include "secure_body.hpp"
#include "logger.hpp"
#include <utility>

static const char* const kSecureKey = "secure_key";
static const char* const kIv = "iv";
static const char* const kSecurePayload = "secure_payload";

const char* body_kind_name(BodyKind kind) {
  switch (kind) {
    case BodyKind::PLAINTEXT:
      return "plaintext";
    case BodyKind::HYBRID:
      return "hybrid";
    case BodyKind::LEGACY:
      return "legacy";
    case BodyKind::MALFORMED:
      return "malformed";
  }
  return "malformed";
}

static bool has_string(const nlohmann::json& body, const char* field) {
  auto it = body.find(field);
  return it != body.end() && it->is_string();
}

BodyKind classify_body(const nlohmann::json& body) {
  if (!body.is_object())
    return BodyKind::PLAINTEXT;

  bool has_key = body.contains(kSecureKey);
  bool has_iv = body.contains(kIv);
  bool has_payload = body.contains(kSecurePayload);

  if (has_key) {
    if (has_iv && has_payload && has_string(body, kSecureKey) && has_string(body, kIv) && has_string(body, kSecurePayload))
      return BodyKind::HYBRID;
    return BodyKind::MALFORMED;
  }
  if (has_payload) {
    return has_string(body, kSecurePayload) ? BodyKind::LEGACY : BodyKind::MALFORMED;
  }
  return BodyKind::PLAINTEXT;
}

bool extract_secure_fields(const nlohmann::json& body, SecureFields& out) {
  BodyKind kind = classify_body(body);
  if (kind != BodyKind::HYBRID && kind != BodyKind::LEGACY)
    return false;

  out = SecureFields{};
  out.secure_payload = body.at(kSecurePayload).get<std::string>();
  if (kind == BodyKind::HYBRID) {
    out.hybrid = true;
    out.secure_key = body.at(kSecureKey).get<std::string>();
    out.iv = body.at(kIv).get<std::string>();
  }
  return true;
}

static OpenedBody failed_body(BodyKind kind, ErrorCode code, const std::string& msg) {
  OpenedBody opened;
  opened.kind = kind;
  opened.ok = false;
  opened.error = msg;
  opened.error_code = code;
  return opened;
}

OpenedBody open_body(const nlohmann::json& body, const RsaKey& private_key) {
  BodyKind kind = classify_body(body);

  if (kind == BodyKind::PLAINTEXT) {
    OpenedBody opened;
    opened.kind = kind;
    opened.payload = body;
    opened.ok = true;
    return opened;
  }

  if (kind == BodyKind::MALFORMED) {
    return failed_body(kind, ErrorCode::MALFORMED_SECURE_BODY, "secure fields are incomplete or not strings");
  }

  if (private_key.empty() || !private_key.has_private()) {
    return failed_body(kind, ErrorCode::INVALID_KEY, "encrypted body but no private key configured");
  }

  SecureFields fields;
  extract_secure_fields(body, fields);

  std::string plaintext;
  try {
    plaintext = decrypt_fields(fields, private_key);
  } catch (const IpcError& e) {
    return failed_body(kind, e.code(), e.what());
  }

  bool parsed_ok = false;
  nlohmann::json payload = decode_body_json(plaintext, &parsed_ok);
  if (!parsed_ok) {
    return failed_body(kind, ErrorCode::MALFORMED_TEXT, "decrypted payload is not valid JSON");
  }

  OpenedBody opened;
  opened.kind = kind;
  opened.payload = std::move(payload);
  opened.ok = true;
  return opened;
}

bool parse_seal_mode(const std::string& name, SealMode& out) {
  if (name == "plaintext")
    out = SealMode::PLAINTEXT;
  else if (name == "hybrid")
    out = SealMode::HYBRID;
  else if (name == "legacy")
    out = SealMode::LEGACY;
  else
    return false;
  return true;
}

const char* seal_mode_name(SealMode mode) {
  switch (mode) {
    case SealMode::PLAINTEXT:
      return "plaintext";
    case SealMode::HYBRID:
      return "hybrid";
    case SealMode::LEGACY:
      return "legacy";
  }
  return "plaintext";
}

std::string seal_body(const nlohmann::json& payload, const RsaKey& recipient, SealMode mode, const RandomSource& random) {
  std::string text;
  try {
    text = payload.dump();
  } catch (const nlohmann::json::type_error& e) {
    throw IpcError(ErrorCode::MALFORMED_TEXT, std::string("payload cannot be serialized: ") + e.what());
  }

  if (mode == SealMode::PLAINTEXT)
    return text;

  nlohmann::json sealed;
  if (mode == SealMode::HYBRID) {
    SecureFields fields = hybrid_encrypt(text, recipient, random);
    sealed[kSecureKey] = fields.secure_key;
    sealed[kIv] = fields.iv;
    sealed[kSecurePayload] = fields.secure_payload;
  } else {
    SecureFields fields = legacy_encrypt(text, recipient);
    sealed[kSecurePayload] = fields.secure_payload;
  }
  return sealed.dump();
}

Envelope seal_envelope(const std::string& topic, const nlohmann::json& payload, uint8_t priority, uint64_t timestamp, const RsaKey& recipient, SealMode mode,
                       const RandomSource& random) {
  return encode_envelope(topic, seal_body(payload, recipient, mode, random), priority, timestamp);
}

/* ============================================================
 *                        SecureReceiver
 * ============================================================ */

SecureReceiver::SecureReceiver(RsaKey key) : private_key(std::move(key)) {
  if (!can_decrypt()) {
    Logger::log(Logger::WARN, "receiver key has no private part; encrypted bodies will be rejected");
  }
}

ReceivedMessage SecureReceiver::receive(const Envelope& envelope) {
  ReceivedMessage msg;

  DecodedEnvelope decoded;
  try {
    decoded = decode_envelope(envelope);
  } catch (const IpcError& e) {
    msg.ok = false;
    msg.error = e.what();
    msg.error_code = e.code();
    ++failed_count;
    Logger::log(Logger::WARN, std::string("dropping envelope: ") + e.what());
    return msg;
  }

  msg.topic = decoded.topic;
  msg.priority = decoded.priority;
  msg.timestamp = decoded.timestamp;

  bool parsed_ok = false;
  nlohmann::json body = decode_body_json(decoded.body, &parsed_ok);
  if (!parsed_ok) {
    msg.payload = body;
    msg.ok = false;
    msg.error = "Invalid JSON payload";
    msg.error_code = ErrorCode::MALFORMED_TEXT;
    ++failed_count;
    Logger::log(Logger::WARN, Logger::with_topic(msg.topic, msg.priority, "body is not valid JSON"));
    return msg;
  }

  OpenedBody opened = open_body(body, private_key);
  msg.kind = opened.kind;
  msg.payload = std::move(opened.payload);
  msg.ok = opened.ok;
  msg.error = opened.error;
  msg.error_code = opened.error_code;

  if (msg.ok) {
    ++delivered_count;
    Logger::log(Logger::DEBUG, Logger::with_topic(msg.topic, msg.priority, std::string("delivered ") + body_kind_name(msg.kind) + " message"));
  } else {
    ++failed_count;
    Logger::log(Logger::WARN, Logger::with_topic(msg.topic, msg.priority, std::string("decryption failed (") + body_kind_name(msg.kind) + "): " + msg.error));
  }
  return msg;
}

size_t SecureReceiver::drain(Subscriber& subscriber, const std::function<void(const ReceivedMessage&)>& handler) {
  size_t handled = 0;
  Envelope envelope;
  while (subscriber.poll_one(envelope)) {
    ReceivedMessage msg = receive(envelope);
    if (handler)
      handler(msg);
    ++handled;
  }
  return handled;
}
