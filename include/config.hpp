#pragma once
// Runtime configuration read from environment variables.
//
//   AMADEUS_PRIVATE_KEY     PEM file with the receiver's RSA private key
//   AMADEUS_PUBLIC_KEY      PEM file with the recipient's RSA public key
//   AMADEUS_KEYSTORE        SQLite file of named recipient keys
//   AMADEUS_SEAL_MODE       plaintext | hybrid | legacy
//   AMADEUS_SERVICE         transport service name
//   AMADEUS_LOOPBACK_SLOTS  slot count of the in-process channel (1..1024)
//   LOG_LEVEL               DEBUG | INFO | WARN | ERROR
//
// Unset variables keep their defaults; malformed values throw
// IpcError CONFIG_INVALID.
#include "crypto.hpp"
#include "envelope.hpp"
#include "logger.hpp"
#include "secure_body.hpp"
#include "transport.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

struct Config {
  std::string private_key_path;
  std::string public_key_path;
  std::string keystore_path = "./db/keys.db";
  SealMode seal_mode = SealMode::HYBRID;
  std::string service_name = DEFAULT_SERVICE_NAME;
  size_t loopback_slots = 16;
  Logger::Level log_level = Logger::INFO;
};

// Returns the value of a variable, or nullptr when unset.
using EnvLookup = std::function<const char*(const char*)>;

Config load_config(const EnvLookup& lookup);
Config load_config_from_env();

// Push config-level settings (log level) into the process.
void apply_config(const Config& config);

// Receiver with the configured private key, or a plaintext-only receiver
// when none is configured.
SecureReceiver make_receiver(const Config& config);

// Load the configured recipient public key. False when none is configured.
bool load_sender_key(const Config& config, RsaKey& out);

std::unique_ptr<LoopbackChannel> make_loopback(const Config& config);
