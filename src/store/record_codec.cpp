#include "store/record_codec.hpp"
#include <cstring>
#include <boost/log/trivial.hpp>

namespace pastebox {
namespace store {

//==============================================
// SERIALIZATION AND DESERIALIZATION
//==============================================

std::size_t RecordCodec::serialize(const StoredRecord& record, std::ostream& output) {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Record codec: Invalid output stream state";
    throw StoreError("Record codec: Invalid output stream");
  }

  std::size_t total_bytes = 0;

  write_bytes(output, MAGIC, sizeof(MAGIC));
  total_bytes += sizeof(MAGIC);

  total_bytes += write_field(output, record.content);
  total_bytes += write_field(output, record.custom);
  total_bytes += write_field(output, record.syntax);
  total_bytes += write_field(output, record.upload);

  uint8_t has_expiration = record.expiration ? 1 : 0;
  write_bytes(output, &has_expiration, sizeof(has_expiration));
  total_bytes += sizeof(has_expiration);
  if (record.expiration) {
    total_bytes += write_field(output, *record.expiration);
  }

  int64_t network_views = boost::endian::native_to_big(record.views);
  write_bytes(output, &network_views, sizeof(network_views));
  total_bytes += sizeof(network_views);

  BOOST_LOG_TRIVIAL(trace) << "Record codec: Serialized record of " << total_bytes << " bytes";
  return total_bytes;
}

StoredRecord RecordCodec::deserialize(std::istream& input) {
  char magic[sizeof(MAGIC)];
  read_bytes(input, magic, sizeof(magic));
  if (std::memcmp(magic, MAGIC, sizeof(MAGIC)) != 0) {
    BOOST_LOG_TRIVIAL(error) << "Record codec: Unknown record format";
    throw StoreError("Record codec: Unknown record format");
  }

  StoredRecord record;
  record.content = read_field(input);
  record.custom = read_field(input);
  record.syntax = read_field(input);
  record.upload = read_field(input);

  uint8_t has_expiration = 0;
  read_bytes(input, &has_expiration, sizeof(has_expiration));
  if (has_expiration > 1) {
    throw StoreError("Record codec: Invalid expiration flag");
  }
  if (has_expiration) {
    record.expiration = read_field(input);
  }

  int64_t network_views = 0;
  read_bytes(input, &network_views, sizeof(network_views));
  record.views = boost::endian::big_to_native(network_views);

  return record;
}


//==============================================
// STREAM OPERATIONS
//==============================================

void RecordCodec::write_bytes(std::ostream& output, const void* data, std::size_t size) {
  output.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
  if (!output.good()) {
    throw StoreError("Record codec: Failed to write to output stream");
  }
}

void RecordCodec::read_bytes(std::istream& input, void* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  input.read(static_cast<char*>(data), static_cast<std::streamsize>(size));
  if (input.gcount() != static_cast<std::streamsize>(size)) {
    throw StoreError("Record codec: Truncated record");
  }
}

std::size_t RecordCodec::write_field(std::ostream& output, const std::string& value) {
  if (value.size() > MAX_FIELD_SIZE) {
    throw StoreError("Record codec: Field too large");
  }
  uint32_t network_length = boost::endian::native_to_big(static_cast<uint32_t>(value.size()));
  write_bytes(output, &network_length, sizeof(network_length));
  write_bytes(output, value.data(), value.size());
  return sizeof(network_length) + value.size();
}

std::string RecordCodec::read_field(std::istream& input) {
  uint32_t network_length = 0;
  read_bytes(input, &network_length, sizeof(network_length));
  uint32_t length = boost::endian::big_to_native(network_length);
  if (length > MAX_FIELD_SIZE) {
    throw StoreError("Record codec: Field length out of range");
  }

  std::string value(length, '\0');
  read_bytes(input, &value[0], length);
  return value;
}

} // namespace store
} // namespace pastebox
