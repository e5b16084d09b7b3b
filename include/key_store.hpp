#pragma once
#ifndef KEY_STORE_H
#define KEY_STORE_H

// KeyStore API: wraps SQLite for recipient public keys
//
// Responsibilities:
// - Open/create a SQLite database file at the provided path
// - Ensure the schema exists (Recipients table)
// - Store, look up, list and remove named RSA public keys (PEM text)
// - Offer a data wipe that preserves the DB file and schema
//
// Notes:
// - Only public keys are stored; keys arrive out of band and this store
//   does not distribute or rotate them
// - All methods assume `init_tables()` has been called by the constructor
#include "crypto.hpp"
#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

struct RecipientRecord {
  std::string name;
  std::string public_pem;
  uint64_t added_ms = 0;
};

// Manages a SQLite database file and recipient records
class KeyStore {
private:
  sqlite3* db;
  std::string db_path;
  sqlite3_stmt* prepare(const char* sql);
  void init_tables();

public:
  // Open or create the database at `db_path` (":memory:" works) and ensure
  // the schema exists. Throws IpcError STORAGE_FAILURE if it cannot be opened.
  explicit KeyStore(const std::string& db_path);
  ~KeyStore();
  KeyStore(const KeyStore&) = delete;
  KeyStore& operator=(const KeyStore&) = delete;

  // Insert or replace the public key for `name`. Returns false on SQL error.
  bool add_recipient(const std::string& name, const RsaKey& public_key);

  // Load the key for `name` into `out`. False if no such recipient.
  // Throws IpcError INVALID_KEY if the stored PEM no longer parses.
  bool fetch_public_key(const std::string& name, RsaKey& out);

  // All records ordered by name.
  std::vector<RecipientRecord> list_recipients();

  // Remove by name. Returns true if a row was deleted.
  bool remove_recipient(const std::string& name);

  // Wipe all data from tables; keeps file and schema.
  // Returns: true on success, false if any SQL error occurs.
  bool delete_database();

  const std::string& path() const {
    return db_path;
  }
};

#endif // KEY_STORE_H
