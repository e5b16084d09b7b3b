#include "errors.hpp"
#include "key_store.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>
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

const RsaKey& alice() {
  static RsaKey key = generate_rsa_keypair();
  return key;
}

const RsaKey& bob() {
  static RsaKey key = generate_rsa_keypair();
  return key;
}

bool test_add_and_fetch() {
  KeyStore store(":memory:");
  REQUIRE(store.add_recipient("alice", alice()), "add must succeed");

  RsaKey fetched;
  REQUIRE(store.fetch_public_key("alice", fetched), "stored key must be found");
  REQUIRE(!fetched.has_private(), "only the public half is stored");
  REQUIRE(fetched.public_pem() == alice().public_pem(), "fetched key must match");

  SecureFields fields = hybrid_encrypt(R"({"to":"alice"})", fetched);
  REQUIRE(decrypt_fields(fields, alice()) == R"({"to":"alice"})", "fetched key must encrypt for its owner");

  RsaKey missing;
  REQUIRE(!store.fetch_public_key("carol", missing), "unknown name must report not found");
  REQUIRE(missing.empty(), "output untouched when not found");
  return true;
}

bool test_upsert_replaces_key() {
  KeyStore store(":memory:");
  REQUIRE(store.add_recipient("svc", alice()), "first add");
  REQUIRE(store.add_recipient("svc", bob()), "second add replaces");

  RsaKey fetched;
  REQUIRE(store.fetch_public_key("svc", fetched), "key must still be found");
  REQUIRE(fetched.public_pem() == bob().public_pem(), "latest key wins");
  REQUIRE(store.list_recipients().size() == 1, "upsert must not duplicate the name");
  return true;
}

bool test_list_and_remove() {
  KeyStore store(":memory:");
  store.add_recipient("zeta", bob());
  store.add_recipient("alpha", alice());

  auto records = store.list_recipients();
  REQUIRE(records.size() == 2, "two recipients");
  REQUIRE(records[0].name == "alpha" && records[1].name == "zeta", "records ordered by name");
  REQUIRE(records[0].public_pem == alice().public_pem(), "record carries the PEM");
  REQUIRE(records[0].added_ms > 0, "record carries the insert time");

  REQUIRE(store.remove_recipient("alpha"), "remove existing");
  REQUIRE(!store.remove_recipient("alpha"), "second remove finds nothing");
  REQUIRE(store.list_recipients().size() == 1, "one left");

  REQUIRE(store.delete_database(), "wipe must succeed");
  REQUIRE(store.list_recipients().empty(), "wipe removes all rows");
  REQUIRE(store.add_recipient("alpha", alice()), "schema survives the wipe");
  return true;
}

bool test_persists_across_reopen() {
  const std::string path = "/tmp/amadeus_keys_test_" + std::to_string(::getpid()) + ".db";
  {
    KeyStore store(path);
    REQUIRE(store.path() == path, "path accessor");
    REQUIRE(store.add_recipient("alice", alice()), "add to file store");
  }
  bool found = false;
  {
    KeyStore store(path);
    RsaKey fetched;
    found = store.fetch_public_key("alice", fetched);
  }
  std::remove(path.c_str());
  REQUIRE(found, "key must survive closing the store");
  return true;
}

bool test_unopenable_path() {
  bool threw = false;
  try {
    KeyStore store("/nonexistent-amadeus-dir/sub/keys.db");
  } catch (const IpcError& e) {
    threw = e.code() == ErrorCode::STORAGE_FAILURE;
  }
  REQUIRE(threw, "unopenable database must fail with StorageFailure");
  return true;
}

}  // namespace

int main() {
  try {
    if (!test_add_and_fetch() || !test_upsert_replaces_key() || !test_list_and_remove() || !test_persists_across_reopen() || !test_unopenable_path()) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "Exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  std::cout << "key_store: ok\n";
  return EXIT_SUCCESS;
}
