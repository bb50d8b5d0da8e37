#ifndef PASTEBOX_ENGINE_DOCUMENT_HPP
#define PASTEBOX_ENGINE_DOCUMENT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include "utils/timestamp.hpp"

namespace pastebox::engine {

// A hosted piece of text and its metadata
struct Document {
  // Assigned by DocumentEngine::store()
  std::string id;
  std::string content;
  std::string syntax;
  // Non-empty bypasses highlighting, content is stored escaped
  std::string custom;
  // Assigned by DocumentEngine::store(), whole seconds
  utils::TimePoint upload{};
  // Unset never expires, volatile_marker() deletes after the first read
  std::optional<utils::TimePoint> expiration;
  int64_t views = 0;

  // Expiration value that marks a view-once document
  static utils::TimePoint volatile_marker() { return utils::TimePoint{}; }

  // Anything at or before epoch + 1ns
  static bool is_volatile(utils::TimePoint expiration) {
    return expiration <= utils::TimePoint{} + std::chrono::nanoseconds(1);
  }
};

} // namespace pastebox::engine

#endif // PASTEBOX_ENGINE_DOCUMENT_HPP
