#ifndef PASTEBOX_CONTENT_NORMALIZER_HPP
#define PASTEBOX_CONTENT_NORMALIZER_HPP

#include <cstddef>
#include <string>

namespace pastebox::content {

static constexpr size_t MAX_CONTENT_SIZE = 1024 * 1024; // 1MB

// Converts "\r\n" and "\r" to "\n", trims surrounding newlines and appends
// exactly one. Throws engine::InputRejectedError for oversized or binary
// (0x00 containing) content.
std::string normalize_content(const std::string& text);

} // namespace pastebox::content

#endif // PASTEBOX_CONTENT_NORMALIZER_HPP
