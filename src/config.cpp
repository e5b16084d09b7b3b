#include "config.hpp"
#include "errors.hpp"
#include <cstdlib>
#include <memory>

static const size_t kMaxLoopbackSlots = 1024;

static size_t parse_slot_count(const std::string& value) {
  size_t consumed = 0;
  unsigned long parsed = 0;
  try {
    parsed = std::stoul(value, &consumed);
  } catch (const std::exception&) {
    throw IpcError(ErrorCode::CONFIG_INVALID, "AMADEUS_LOOPBACK_SLOTS is not a number: " + value);
  }
  if (consumed != value.size() || parsed == 0 || parsed > kMaxLoopbackSlots) {
    throw IpcError(ErrorCode::CONFIG_INVALID, "AMADEUS_LOOPBACK_SLOTS must be 1.." + std::to_string(kMaxLoopbackSlots) + ", got " + value);
  }
  return static_cast<size_t>(parsed);
}

Config load_config(const EnvLookup& lookup) {
  Config config;

  if (const char* v = lookup("AMADEUS_PRIVATE_KEY"))
    config.private_key_path = v;
  if (const char* v = lookup("AMADEUS_PUBLIC_KEY"))
    config.public_key_path = v;
  if (const char* v = lookup("AMADEUS_KEYSTORE")) {
    if (*v == '\0')
      throw IpcError(ErrorCode::CONFIG_INVALID, "AMADEUS_KEYSTORE is empty");
    config.keystore_path = v;
  }
  if (const char* v = lookup("AMADEUS_SEAL_MODE")) {
    if (!parse_seal_mode(v, config.seal_mode))
      throw IpcError(ErrorCode::CONFIG_INVALID, std::string("AMADEUS_SEAL_MODE must be plaintext, hybrid or legacy, got ") + v);
  }
  if (const char* v = lookup("AMADEUS_SERVICE")) {
    if (*v == '\0')
      throw IpcError(ErrorCode::CONFIG_INVALID, "AMADEUS_SERVICE is empty");
    config.service_name = v;
  }
  if (const char* v = lookup("AMADEUS_LOOPBACK_SLOTS"))
    config.loopback_slots = parse_slot_count(v);
  if (const char* v = lookup("LOG_LEVEL")) {
    if (!Logger::parse_level(v, config.log_level))
      throw IpcError(ErrorCode::CONFIG_INVALID, std::string("LOG_LEVEL must be DEBUG, INFO, WARN or ERROR, got ") + v);
  }

  if (config.seal_mode != SealMode::PLAINTEXT && config.public_key_path.empty()) {
    Logger::log(Logger::INFO, std::string("seal mode ") + seal_mode_name(config.seal_mode) + " set without AMADEUS_PUBLIC_KEY; a key must be supplied per recipient");
  }
  return config;
}

Config load_config_from_env() {
  return load_config([](const char* name) { return std::getenv(name); });
}

void apply_config(const Config& config) {
  Logger::set_level(config.log_level);
}

SecureReceiver make_receiver(const Config& config) {
  if (config.private_key_path.empty()) {
    Logger::log(Logger::INFO, "no private key configured; receiver accepts plaintext only");
    return SecureReceiver();
  }
  return SecureReceiver(RsaKey::load_private_pem_file(config.private_key_path));
}

bool load_sender_key(const Config& config, RsaKey& out) {
  if (config.public_key_path.empty())
    return false;
  out = RsaKey::load_public_pem_file(config.public_key_path);
  return true;
}

std::unique_ptr<LoopbackChannel> make_loopback(const Config& config) {
  return std::make_unique<LoopbackChannel>(config.service_name, config.loopback_slots);
}
