#ifndef PASTEBOX_STORE_FILE_STORE_HPP
#define PASTEBOX_STORE_FILE_STORE_HPP

#include <filesystem>
#include <mutex>
#include <string>
#include "store/document_store.hpp"

namespace pastebox {
namespace store {

// One file per record under a content addressed directory tree
class FileStore : public DocumentStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit FileStore(const std::string& base_path);


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
  // Root path for all stored records
  std::filesystem::path base_path_;
  // Serializes writers so a view update never interleaves with a removal
  std::mutex mutex_;


  // ---- CAS STORAGE SUPPORT ----
  // Keys must be 64 lowercase hex characters (SHA-256)
  void validate_key(const std::string& key) const;
  // {base_path}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}
  std::filesystem::path get_path_for_hash(const std::string& hash) const;


  // ---- RECORD FILE I/O ----
  StoredRecord read_record(const std::filesystem::path& file_path, const std::string& key) const;
  // Writes to a temporary sibling then renames over the target
  void write_record(const std::filesystem::path& file_path, const StoredRecord& record) const;
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Removes emptied prefix directories of a deleted record
  void prune_empty_directories(const std::filesystem::path& file_path) const;
};

} // namespace store
} // namespace pastebox

#endif // PASTEBOX_STORE_FILE_STORE_HPP
