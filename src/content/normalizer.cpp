#include "content/normalizer.hpp"
#include "engine/engine_error.hpp"
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/log/trivial.hpp>

namespace pastebox::content {

std::string normalize_content(const std::string& text) {
  if (text.size() > MAX_CONTENT_SIZE) {
    BOOST_LOG_TRIVIAL(debug) << "Normalizer: Rejected content of " << text.size() << " bytes";
    throw engine::InputRejectedError("file is larger than " + std::to_string(MAX_CONTENT_SIZE) + " bytes");
  }

  std::string normalized = boost::algorithm::replace_all_copy(text, "\r\n", "\n");
  boost::algorithm::replace_all(normalized, "\r", "\n");
  boost::algorithm::trim_if(normalized, [](char c) { return c == '\n'; });
  normalized += '\n';

  // Don't accept binary files
  if (normalized.find('\0') != std::string::npos) {
    throw engine::InputRejectedError("file contains 0x00 bytes");
  }

  return normalized;
}

} // namespace pastebox::content
