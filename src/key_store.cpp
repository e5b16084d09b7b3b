#include "key_store.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "util.hpp"

KeyStore::KeyStore(const std::string& db_path) : db(nullptr), db_path(db_path) {
  if (sqlite3_open(db_path.c_str(), &db) != SQLITE_OK) {
    std::string err = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    db = nullptr;
    throw IpcError(ErrorCode::STORAGE_FAILURE, "cannot open key store " + db_path + ": " + err);
  }
  init_tables();
}

KeyStore::~KeyStore() {
  if (db) {
    sqlite3_close(db);
    db = nullptr;
  }
}

sqlite3_stmt* KeyStore::prepare(const char* sql) {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    Logger::log(Logger::ERROR, std::string("SQL prepare error: ") + sqlite3_errmsg(db));
    return nullptr;
  }
  return stmt;
}

static inline bool exec_sql(sqlite3* db, const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    if (err) {
      Logger::log(Logger::ERROR, std::string("SQL error: ") + err);
      sqlite3_free(err);
    }
    return false;
  }
  return true;
}

void KeyStore::init_tables() {
  const char* sql = "CREATE TABLE IF NOT EXISTS Recipients("
                    "id INTEGER PRIMARY KEY,"
                    "name TEXT UNIQUE NOT NULL,"
                    "public_pem TEXT NOT NULL,"
                    "added_ms INTEGER NOT NULL);";
  if (!exec_sql(db, sql)) {
    throw IpcError(ErrorCode::STORAGE_FAILURE, "cannot create schema in " + db_path);
  }
}

bool KeyStore::add_recipient(const std::string& name, const RsaKey& public_key) {
  std::string pem = public_key.public_pem();

  auto stmt = prepare("INSERT INTO Recipients(name, public_pem, added_ms) VALUES (?, ?, ?) "
                      "ON CONFLICT(name) DO UPDATE SET public_pem = excluded.public_pem, added_ms = excluded.added_ms");
  if (!stmt) {
    return false;
  }
  sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, pem.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(now_millis()));

  bool ok = sqlite3_step(stmt) == SQLITE_DONE;
  if (!ok) {
    Logger::log(Logger::ERROR, std::string("Insert failed: ") + sqlite3_errmsg(db));
  }
  sqlite3_finalize(stmt);
  return ok;
}

bool KeyStore::fetch_public_key(const std::string& name, RsaKey& out) {
  auto stmt = prepare("SELECT public_pem FROM Recipients WHERE name = ?");
  if (!stmt) {
    return false;
  }
  sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);

  std::string pem;
  bool found = false;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    const unsigned char* text = sqlite3_column_text(stmt, 0);
    int size = sqlite3_column_bytes(stmt, 0);
    pem.assign(reinterpret_cast<const char*>(text), static_cast<size_t>(size));
    found = true;
  }
  sqlite3_finalize(stmt);

  if (!found)
    return false;
  out = RsaKey::from_public_pem(pem);
  return true;
}

std::vector<RecipientRecord> KeyStore::list_recipients() {
  std::vector<RecipientRecord> records;
  auto stmt = prepare("SELECT name, public_pem, added_ms FROM Recipients ORDER BY name");
  if (!stmt) {
    return records;
  }

  while (sqlite3_step(stmt) == SQLITE_ROW) {
    RecipientRecord record;
    record.name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
    record.public_pem = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
    record.added_ms = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
    records.push_back(record);
  }
  sqlite3_finalize(stmt);
  return records;
}

bool KeyStore::remove_recipient(const std::string& name) {
  auto stmt = prepare("DELETE FROM Recipients WHERE name = ?");
  if (!stmt) {
    return false;
  }
  sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);

  bool ok = sqlite3_step(stmt) == SQLITE_DONE;
  if (!ok) {
    Logger::log(Logger::ERROR, std::string("Delete failed: ") + sqlite3_errmsg(db));
  }
  sqlite3_finalize(stmt);
  return ok && sqlite3_changes(db) > 0;
}

bool KeyStore::delete_database() {
  if (!exec_sql(db, "BEGIN TRANSACTION;"))
    return false;
  if (!exec_sql(db, "DELETE FROM Recipients;")) {
    if (!exec_sql(db, "ROLLBACK;"))
      Logger::log(Logger::ERROR, "rollback failed for " + db_path);
    return false;
  }
  if (!exec_sql(db, "COMMIT;"))
    return false;
  if (!exec_sql(db, "VACUUM;"))
    Logger::log(Logger::WARN, "VACUUM failed for " + db_path);
  return true;
}
