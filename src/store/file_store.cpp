#include "store/file_store.hpp"
#include "store/record_codec.hpp"
#include <fstream>
#include <boost/log/trivial.hpp>

namespace pastebox {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileStore::FileStore(const std::string& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "File store: Initializing store with base path: " << base_path;
  try {
    check_directory_exists(base_path_);
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "File store: Failed to create base directory: " << e.what();
    throw StoreError("File store: Failed to create base directory: " + std::string(e.what()));
  }
  BOOST_LOG_TRIVIAL(debug) << "File store: Store directory created/verified at: " << base_path;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void FileStore::put(const std::string& key, const StoredRecord& record) {
  BOOST_LOG_TRIVIAL(info) << "File store: Storing record with key: " << key;
  validate_key(key);

  std::lock_guard<std::mutex> lock(mutex_);
  std::filesystem::path file_path = get_path_for_hash(key);
  if (std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(error) << "File store: Record already exists for key: " << key;
    throw StoreError("File store: Record already exists");
  }

  write_record(file_path, record);
  BOOST_LOG_TRIVIAL(info) << "File store: Successfully stored record with key: " << key;
}

StoredRecord FileStore::get(const std::string& key) {
  BOOST_LOG_TRIVIAL(debug) << "File store: Retrieving record for key: " << key;
  validate_key(key);

  std::lock_guard<std::mutex> lock(mutex_);
  return read_record(get_path_for_hash(key), key);
}

bool FileStore::increment_views(const std::string& key) {
  validate_key(key);

  std::lock_guard<std::mutex> lock(mutex_);
  std::filesystem::path file_path = get_path_for_hash(key);
  if (!std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(debug) << "File store: Skipping view update for missing key: " << key;
    return false;
  }

  StoredRecord record = read_record(file_path, key);
  record.views++;
  write_record(file_path, record);

  BOOST_LOG_TRIVIAL(debug) << "File store: Views for key " << key << " now " << record.views;
  return true;
}

void FileStore::remove(const std::string& key) {
  BOOST_LOG_TRIVIAL(info) << "File store: Removing record with key: " << key;
  validate_key(key);

  std::lock_guard<std::mutex> lock(mutex_);
  std::filesystem::path file_path = get_path_for_hash(key);

  std::error_code ec;
  if (!std::filesystem::remove(file_path, ec)) {
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "File store: Failed to remove record with key: " << key << ": " << ec.message();
      throw StoreError("File store: Failed to remove record: " + ec.message());
    }
    throw NotFoundError(key);
  }

  prune_empty_directories(file_path);
  BOOST_LOG_TRIVIAL(info) << "File store: Successfully removed record with key: " << key;
}

void FileStore::clear() {
  BOOST_LOG_TRIVIAL(info) << "File store: Clearing entire store at: " << base_path_;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& entry : std::filesystem::directory_iterator(base_path_)) {
    std::filesystem::remove_all(entry.path());
  }
  BOOST_LOG_TRIVIAL(info) << "File store: Store cleared successfully";
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool FileStore::has(const std::string& key) {
  validate_key(key);
  bool exists = std::filesystem::exists(get_path_for_hash(key));
  BOOST_LOG_TRIVIAL(debug) << "File store: Key " << key << (exists ? " exists" : " not found");
  return exists;
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

void FileStore::validate_key(const std::string& key) const {
  bool valid = key.size() == 64;
  for (char c : key) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      valid = false;
      break;
    }
  }
  if (!valid) {
    BOOST_LOG_TRIVIAL(error) << "File store: Rejected malformed key: " << key;
    throw StoreError("File store: Malformed key");
  }
}

std::filesystem::path FileStore::get_path_for_hash(const std::string& hash) const {
  std::filesystem::path path = base_path_;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6);
  return path;
}


//==============================================
// RECORD FILE I/O
//==============================================

StoredRecord FileStore::read_record(const std::filesystem::path& file_path, const std::string& key) const {
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    if (!std::filesystem::exists(file_path)) {
      throw NotFoundError(key);
    }
    BOOST_LOG_TRIVIAL(error) << "File store: Failed to open file: " << file_path.string();
    throw StoreError("File store: Failed to open file: " + file_path.string());
  }
  return RecordCodec::deserialize(file);
}

void FileStore::write_record(const std::filesystem::path& file_path, const StoredRecord& record) const {
  try {
    check_directory_exists(file_path.parent_path());
  } catch (const std::filesystem::filesystem_error& e) {
    throw StoreError("File store: Failed to create directory: " + std::string(e.what()));
  }

  std::filesystem::path temp_path = file_path;
  temp_path += ".tmp";

  {
    // Open output file in binary mode for cross-platform consistency
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw StoreError("File store: Failed to create file: " + temp_path.string());
    }
    try {
      RecordCodec::serialize(record, file);
      file.flush();
      if (!file) {
        throw StoreError("File store: Failed to write file: " + temp_path.string());
      }
    } catch (const std::exception&) {
      file.close();
      std::error_code ec;
      std::filesystem::remove(temp_path, ec);
      throw;
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, file_path, ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    throw StoreError("File store: Failed to replace file: " + file_path.string());
  }
}

void FileStore::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

void FileStore::prune_empty_directories(const std::filesystem::path& file_path) const {
  std::error_code ec;
  auto current = file_path.parent_path();
  // Only the three prefix levels below base_path_ are ours to remove
  for (int depth = 0; depth < 3; ++depth) {
    if (!std::filesystem::is_empty(current, ec) || ec) {
      break;
    }
    std::filesystem::remove(current, ec);
    if (ec) {
      break;
    }
    current = current.parent_path();
  }
}

} // namespace store
} // namespace pastebox
