#ifndef PASTEBOX_STORE_RECORD_CODEC_HPP
#define PASTEBOX_STORE_RECORD_CODEC_HPP

#include <cstdint>
#include <iostream>
#include <string>
#include <boost/endian/conversion.hpp>
#include "store/document_store.hpp"

namespace pastebox {
namespace store {

// Binary record layout used by FileStore:
//   magic "PBX1"
//   u32 length + bytes  for content, custom, syntax, upload
//   u8 presence flag, then u32 length + bytes for expiration when set
//   i64 views
// All integers are big endian.
class RecordCodec {
public:
  static constexpr char MAGIC[4] = {'P', 'B', 'X', '1'};
  static constexpr uint32_t MAX_FIELD_SIZE = 64 * 1024 * 1024;

  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Returns number of bytes written
  static std::size_t serialize(const StoredRecord& record, std::ostream& output);
  // Throws StoreError on truncated or foreign data
  static StoredRecord deserialize(std::istream& input);

private:
  // ---- STREAM OPERATIONS ----
  static void write_bytes(std::ostream& output, const void* data, std::size_t size);
  static void read_bytes(std::istream& input, void* data, std::size_t size);
  static std::size_t write_field(std::ostream& output, const std::string& value);
  static std::string read_field(std::istream& input);
};

} // namespace store
} // namespace pastebox

#endif // PASTEBOX_STORE_RECORD_CODEC_HPP
