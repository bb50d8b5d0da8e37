#include "render/highlighter.hpp"
#include "render/html.hpp"

namespace pastebox::render {

std::string EscapingHighlighter::highlight(const std::string& content, const std::string& /*syntax*/) {
  return escape_html(content);
}

} // namespace pastebox::render
