#ifndef PASTEBOX_RENDER_HTML_HPP
#define PASTEBOX_RENDER_HTML_HPP

#include <string>

namespace pastebox::render {

// Escapes & < > " and '
std::string escape_html(const std::string& text);

// Drops tags and decodes character references back to plain text
std::string strip_html(const std::string& html);

} // namespace pastebox::render

#endif // PASTEBOX_RENDER_HTML_HPP
