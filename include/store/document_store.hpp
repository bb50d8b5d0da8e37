#ifndef PASTEBOX_STORE_DOCUMENT_STORE_HPP
#define PASTEBOX_STORE_DOCUMENT_STORE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include "store/store_error.hpp"

namespace pastebox {
namespace store {

// A document as persisted. Timestamps are "YYYY-MM-DD HH:MM:SS" UTC strings.
struct StoredRecord {
  std::string content;  // encrypted
  std::string custom;
  std::string syntax;
  std::string upload;
  std::optional<std::string> expiration;
  int64_t views = 0;
};

// Keyed record storage. Keys are hashed document identifiers.
class DocumentStore {
public:
  virtual ~DocumentStore() = default;

  // ---- CORE STORAGE OPERATIONS ----
  // Persists a new record, throws StoreError if the key is taken
  virtual void put(const std::string& key, const StoredRecord& record) = 0;
  // Throws NotFoundError for an unknown key
  virtual StoredRecord get(const std::string& key) = 0;
  // Returns false if the key no longer exists
  virtual bool increment_views(const std::string& key) = 0;
  // Throws NotFoundError for an unknown key
  virtual void remove(const std::string& key) = 0;
  // Removes all records
  virtual void clear() = 0;


  // ---- QUERY OPERATIONS ----
  virtual bool has(const std::string& key) = 0;
};

} // namespace store
} // namespace pastebox

#endif // PASTEBOX_STORE_DOCUMENT_STORE_HPP
