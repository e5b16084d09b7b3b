#include "config.hpp"
#include "errors.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <map>
#include <string>
#include <unistd.h>

namespace {

#define REQUIRE(cond, msg)      \
  do {                          \
    if (!(cond)) {              \
      std::cerr << msg << "\n"; \
      return false;             \
    }                           \
  } while (0)

using EnvMap = std::map<std::string, std::string>;

EnvLookup lookup_in(const EnvMap& env) {
  return [&env](const char* name) -> const char* {
    auto it = env.find(name);
    return it == env.end() ? nullptr : it->second.c_str();
  };
}

bool rejects(const EnvMap& env) {
  try {
    load_config(lookup_in(env));
  } catch (const IpcError& e) {
    return e.code() == ErrorCode::CONFIG_INVALID;
  }
  return false;
}

bool test_defaults() {
  EnvMap env;
  Config config = load_config(lookup_in(env));
  REQUIRE(config.private_key_path.empty() && config.public_key_path.empty(), "no key paths by default");
  REQUIRE(config.keystore_path == "./db/keys.db", "default key store path");
  REQUIRE(config.seal_mode == SealMode::HYBRID, "hybrid sealing by default");
  REQUIRE(config.service_name == DEFAULT_SERVICE_NAME, "default service name");
  REQUIRE(config.loopback_slots == 16, "default slot count");
  REQUIRE(config.log_level == Logger::INFO, "default log level");
  return true;
}

bool test_overrides() {
  EnvMap env = {
      {"AMADEUS_PRIVATE_KEY", "/etc/amadeus/priv.pem"},
      {"AMADEUS_PUBLIC_KEY", "/etc/amadeus/pub.pem"},
      {"AMADEUS_KEYSTORE", ":memory:"},
      {"AMADEUS_SEAL_MODE", "legacy"},
      {"AMADEUS_SERVICE", "Amadeus/Message/alerts"},
      {"AMADEUS_LOOPBACK_SLOTS", "1024"},
      {"LOG_LEVEL", "WARN"},
  };
  Config config = load_config(lookup_in(env));
  REQUIRE(config.private_key_path == "/etc/amadeus/priv.pem", "private key path");
  REQUIRE(config.public_key_path == "/etc/amadeus/pub.pem", "public key path");
  REQUIRE(config.keystore_path == ":memory:", "key store path");
  REQUIRE(config.seal_mode == SealMode::LEGACY, "seal mode");
  REQUIRE(config.service_name == "Amadeus/Message/alerts", "service name");
  REQUIRE(config.loopback_slots == 1024, "upper slot bound is inclusive");
  REQUIRE(config.log_level == Logger::WARN, "log level");
  return true;
}

bool test_invalid_values() {
  REQUIRE(rejects({{"AMADEUS_SEAL_MODE", "rot13"}}), "unknown seal mode");
  REQUIRE(rejects({{"AMADEUS_SEAL_MODE", ""}}), "empty seal mode");
  REQUIRE(rejects({{"AMADEUS_KEYSTORE", ""}}), "empty key store path");
  REQUIRE(rejects({{"AMADEUS_SERVICE", ""}}), "empty service name");
  REQUIRE(rejects({{"AMADEUS_LOOPBACK_SLOTS", "0"}}), "zero slots");
  REQUIRE(rejects({{"AMADEUS_LOOPBACK_SLOTS", "1025"}}), "too many slots");
  REQUIRE(rejects({{"AMADEUS_LOOPBACK_SLOTS", "8x"}}), "trailing garbage");
  REQUIRE(rejects({{"AMADEUS_LOOPBACK_SLOTS", "many"}}), "not a number");
  REQUIRE(rejects({{"LOG_LEVEL", "verbose"}}), "unknown log level");
  REQUIRE(!rejects({{"AMADEUS_LOOPBACK_SLOTS", "1"}}), "one slot is enough");
  return true;
}

bool test_keys_from_files() {
  const std::string base = "/tmp/amadeus_config_test_" + std::to_string(::getpid());
  const std::string pub_path = base + "_pub.pem";
  const std::string priv_path = base + "_priv.pem";
  RsaKey pair = generate_rsa_keypair();
  pair.save_public_pem_file(pub_path);
  pair.save_private_pem_file(priv_path);

  EnvMap env = {{"AMADEUS_PRIVATE_KEY", priv_path}, {"AMADEUS_PUBLIC_KEY", pub_path}};
  Config config = load_config(lookup_in(env));

  RsaKey sender;
  bool loaded = load_sender_key(config, sender);
  SecureReceiver receiver = make_receiver(config);
  std::remove(pub_path.c_str());
  std::remove(priv_path.c_str());

  REQUIRE(loaded && !sender.has_private(), "sender key is the public half");
  REQUIRE(receiver.can_decrypt(), "receiver holds the private half");

  Envelope env_out = seal_envelope("cfg", {{"ok", true}}, 1, 1, sender, config.seal_mode);
  ReceivedMessage msg = receiver.receive(env_out);
  REQUIRE(msg.ok && msg.kind == BodyKind::HYBRID && msg.payload["ok"] == true, "configured keys must pair up");

  Config bare;
  RsaKey none;
  REQUIRE(!load_sender_key(bare, none) && none.empty(), "no public key configured");
  REQUIRE(!make_receiver(bare).can_decrypt(), "no private key means plaintext only");

  bool threw = false;
  try {
    Config broken;
    broken.private_key_path = base + "_missing.pem";
    make_receiver(broken);
  } catch (const IpcError& e) {
    threw = e.code() == ErrorCode::INVALID_KEY;
  }
  REQUIRE(threw, "missing key file must fail with InvalidKey");
  return true;
}

bool test_loopback_from_config() {
  EnvMap env = {{"AMADEUS_SERVICE", "Amadeus/Message/cfg"}, {"AMADEUS_LOOPBACK_SLOTS", "3"}};
  Config config = load_config(lookup_in(env));
  auto channel = make_loopback(config);
  REQUIRE(channel->service_name() == "Amadeus/Message/cfg", "service name applied");
  REQUIRE(channel->capacity() == 3, "slot count applied");

  apply_config(config);
  return true;
}

}  // namespace

int main() {
  try {
    if (!test_defaults() || !test_overrides() || !test_invalid_values() || !test_keys_from_files() || !test_loopback_from_config()) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "Exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  std::cout << "config: ok\n";
  return EXIT_SUCCESS;
}
