#ifndef PASTEBOX_STORE_SQLITE_STORE_HPP
#define PASTEBOX_STORE_SQLITE_STORE_HPP

#include <mutex>
#include <string>
#include <sqlite3.h>
#include "store/document_store.hpp"

namespace pastebox {
namespace store {

// Records in a single "documents" table of an SQLite database
class SqliteStore : public DocumentStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Opens or creates the database and its schema
  explicit SqliteStore(const std::string& path);
  ~SqliteStore() override;

  SqliteStore(const SqliteStore&) = delete;
  SqliteStore& operator=(const SqliteStore&) = delete;


  // ---- CORE STORAGE OPERATIONS ----
  void put(const std::string& key, const StoredRecord& record) override;
  StoredRecord get(const std::string& key) override;
  bool increment_views(const std::string& key) override;
  void remove(const std::string& key) override;
  void clear() override;


  // ---- QUERY OPERATIONS ----
  bool has(const std::string& key) override;

private:
  // ---- PARAMETERS ----
  sqlite3* db_ = nullptr;
  std::string path_;
  // Holds a statement together with the changes()/errmsg() read after it
  std::mutex mutex_;


  // ---- DATABASE SUPPORT ----
  // Execute a SQL string (pragmas and schema)
  void exec(const std::string& sql);
  // WAL journal, busy timeout and schema creation
  void configure();
  // Throws StoreError carrying sqlite's message when rc is not expected
  void check(int rc, int expected, const char* what) const;
};

} // namespace store
} // namespace pastebox

#endif // PASTEBOX_STORE_SQLITE_STORE_HPP
