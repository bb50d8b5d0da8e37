#include "store/sqlite_store.hpp"
#include <boost/log/trivial.hpp>

namespace pastebox {
namespace store {

//=================================================
// RAII WRAPPER FOR PREPARED STATEMENTS
//=================================================

namespace {

struct Statement {
  sqlite3_stmt* stmt = nullptr;

  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
      std::string message = sqlite3_errmsg(db);
      sqlite3_finalize(stmt);
      throw StoreError("Sqlite store: Failed to prepare statement: " + message);
    }
  }

  ~Statement() {
    if (stmt) {
      sqlite3_finalize(stmt);
    }
  }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() { return stmt; }
};

void bind_text(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void bind_blob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

std::string column_text(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), sqlite3_column_bytes(st, col)) : "";
}

std::string column_blob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  return data ? std::string(static_cast<const char*>(data), sqlite3_column_bytes(st, col)) : "";
}

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SqliteStore::SqliteStore(const std::string& path) : path_(path) {
  BOOST_LOG_TRIVIAL(info) << "Sqlite store: Opening database: " << path_;

  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string message = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    BOOST_LOG_TRIVIAL(error) << "Sqlite store: Failed to open database: " << message;
    throw StoreError("Sqlite store: Failed to open database: " + message);
  }

  try {
    configure();
  } catch (const StoreError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
  BOOST_LOG_TRIVIAL(debug) << "Sqlite store: Database ready at: " << path_;
}

SqliteStore::~SqliteStore() {
  if (db_) sqlite3_close(db_);
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void SqliteStore::put(const std::string& key, const StoredRecord& record) {
  BOOST_LOG_TRIVIAL(info) << "Sqlite store: Storing record with key: " << key;
  std::lock_guard<std::mutex> lock(mutex_);

  Statement st(db_,
    "INSERT INTO documents (id, content, custom, syntax, upload, expiration, views) "
    "VALUES (?, ?, ?, ?, ?, ?, ?);");

  bind_text(st.get(), 1, key);
  bind_blob(st.get(), 2, record.content);
  bind_text(st.get(), 3, record.custom);
  bind_text(st.get(), 4, record.syntax);
  bind_text(st.get(), 5, record.upload);
  if (record.expiration) {
    bind_text(st.get(), 6, *record.expiration);
  } else {
    sqlite3_bind_null(st.get(), 6);
  }
  sqlite3_bind_int64(st.get(), 7, static_cast<sqlite3_int64>(record.views));

  check(sqlite3_step(st.get()), SQLITE_DONE, "insert");
}

StoredRecord SqliteStore::get(const std::string& key) {
  BOOST_LOG_TRIVIAL(debug) << "Sqlite store: Retrieving record for key: " << key;
  std::lock_guard<std::mutex> lock(mutex_);

  Statement st(db_,
    "SELECT content, custom, syntax, upload, expiration, views FROM documents WHERE id = ?;");
  bind_text(st.get(), 1, key);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) {
    throw NotFoundError(key);
  }
  check(rc, SQLITE_ROW, "select");

  StoredRecord record;
  record.content = column_blob(st.get(), 0);
  record.custom = column_text(st.get(), 1);
  record.syntax = column_text(st.get(), 2);
  record.upload = column_text(st.get(), 3);
  if (sqlite3_column_type(st.get(), 4) != SQLITE_NULL) {
    record.expiration = column_text(st.get(), 4);
  }
  record.views = sqlite3_column_int64(st.get(), 5);
  return record;
}

bool SqliteStore::increment_views(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement st(db_, "UPDATE documents SET views = views + 1 WHERE id = ?;");
  bind_text(st.get(), 1, key);
  check(sqlite3_step(st.get()), SQLITE_DONE, "update views");
  return sqlite3_changes(db_) > 0;
}

void SqliteStore::remove(const std::string& key) {
  BOOST_LOG_TRIVIAL(info) << "Sqlite store: Removing record with key: " << key;
  std::lock_guard<std::mutex> lock(mutex_);

  Statement st(db_, "DELETE FROM documents WHERE id = ?;");
  bind_text(st.get(), 1, key);
  check(sqlite3_step(st.get()), SQLITE_DONE, "delete");
  if (sqlite3_changes(db_) == 0) {
    throw NotFoundError(key);
  }
}

void SqliteStore::clear() {
  BOOST_LOG_TRIVIAL(info) << "Sqlite store: Clearing all records";
  std::lock_guard<std::mutex> lock(mutex_);
  exec("DELETE FROM documents;");
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool SqliteStore::has(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement st(db_, "SELECT 1 FROM documents WHERE id = ?;");
  bind_text(st.get(), 1, key);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) {
    return false;
  }
  check(rc, SQLITE_ROW, "exists");
  return true;
}


//==============================================
// DATABASE SUPPORT
//==============================================

void SqliteStore::exec(const std::string& sql) {
  char* err = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string message = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    BOOST_LOG_TRIVIAL(error) << "Sqlite store: " << message;
    throw StoreError("Sqlite store: " + message);
  }
}

void SqliteStore::configure() {
  // WAL lets readers proceed while a writer holds the lock
  exec("PRAGMA journal_mode=WAL;");
  exec("PRAGMA synchronous=NORMAL;");

  // wait for locks instead of failing immediately
  check(sqlite3_busy_timeout(db_, 5000), SQLITE_OK, "busy_timeout");

  exec(
    "CREATE TABLE IF NOT EXISTS documents ("
    "  id TEXT PRIMARY KEY,"
    "  content BLOB NOT NULL,"
    "  custom TEXT NOT NULL DEFAULT '',"
    "  syntax TEXT NOT NULL DEFAULT '',"
    "  upload TEXT NOT NULL,"
    "  expiration TEXT NULL,"
    "  views INTEGER NOT NULL DEFAULT 0"
    ");");
}

void SqliteStore::check(int rc, int expected, const char* what) const {
  if (rc != expected) {
    std::string message = std::string(what) + ": " + sqlite3_errmsg(db_);
    BOOST_LOG_TRIVIAL(error) << "Sqlite store: " << message;
    throw StoreError("Sqlite store: " + message);
  }
}

} // namespace store
} // namespace pastebox
