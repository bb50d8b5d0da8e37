#ifndef PASTEBOX_RENDER_HIGHLIGHTER_HPP
#define PASTEBOX_RENDER_HIGHLIGHTER_HPP

#include <stdexcept>
#include <string>

namespace pastebox::render {

class HighlightError : public std::runtime_error {
public:
  explicit HighlightError(const std::string& message) : std::runtime_error(message) {}
};

// Turns plain content into HTML for the given syntax hint
class Highlighter {
public:
  virtual ~Highlighter() = default;

  // Throws HighlightError if the content could not be highlighted
  virtual std::string highlight(const std::string& content, const std::string& syntax) = 0;
};

// Escapes the content without any markup, ignoring the hint
class EscapingHighlighter : public Highlighter {
public:
  std::string highlight(const std::string& content, const std::string& syntax) override;
};

} // namespace pastebox::render

#endif // PASTEBOX_RENDER_HIGHLIGHTER_HPP
