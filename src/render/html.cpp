#include "render/html.hpp"
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <unordered_map>

namespace pastebox::render {

namespace {

// Appends a code point as UTF-8
void append_utf8(std::string& out, uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

// Decodes the reference between '&' and ';', returns false if unknown
bool decode_entity(const std::string& name, std::string& out) {
  static const std::unordered_map<std::string, std::string> named = {
    {"amp", "&"}, {"lt", "<"}, {"gt", ">"}, {"quot", "\""},
    {"apos", "'"}, {"nbsp", "\xC2\xA0"}
  };

  if (name.size() > 1 && name[0] == '#') {
    const bool hex = name[1] == 'x' || name[1] == 'X';
    const std::string digits = name.substr(hex ? 2 : 1);
    // strtoul would also take leading whitespace and a sign
    if (digits.empty() || !(hex ? std::isxdigit(static_cast<unsigned char>(digits[0]))
                                : std::isdigit(static_cast<unsigned char>(digits[0])))) {
      return false;
    }
    char* end = nullptr;
    unsigned long cp = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
    if (*end != '\0' || cp == 0 || cp > 0x10FFFF) {
      return false;
    }
    // UTF-16 surrogates have no UTF-8 encoding
    if (cp >= 0xD800 && cp <= 0xDFFF) {
      return false;
    }
    append_utf8(out, static_cast<uint32_t>(cp));
    return true;
  }

  auto it = named.find(name);
  if (it == named.end()) {
    return false;
  }
  out += it->second;
  return true;
}

} // namespace

std::string escape_html(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':  out += "&amp;";  break;
      case '<':  out += "&lt;";   break;
      case '>':  out += "&gt;";   break;
      case '"':  out += "&#34;";  break;
      case '\'': out += "&#39;";  break;
      default:   out += c;
    }
  }
  return out;
}

std::string strip_html(const std::string& html) {
  std::string out;
  out.reserve(html.size());

  size_t i = 0;
  while (i < html.size()) {
    const char c = html[i];

    if (c == '<') {
      // Skip the whole tag, an unterminated one is kept as text
      size_t close = html.find('>', i);
      if (close == std::string::npos) {
        out.append(html, i, std::string::npos);
        break;
      }
      i = close + 1;
      continue;
    }

    if (c == '&') {
      size_t semi = html.find(';', i);
      if (semi != std::string::npos && semi - i <= 10 &&
          decode_entity(html.substr(i + 1, semi - i - 1), out)) {
        i = semi + 1;
        continue;
      }
    }

    out += c;
    ++i;
  }
  return out;
}

} // namespace pastebox::render
