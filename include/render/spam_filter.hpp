#ifndef PASTEBOX_RENDER_SPAM_FILTER_HPP
#define PASTEBOX_RENDER_SPAM_FILTER_HPP

#include <optional>
#include <string>
#include <vector>
#include "engine/document.hpp"

namespace pastebox::render {

// Veto over a write, consulted after rendering
class SpamFilter {
public:
  virtual ~SpamFilter() = default;

  // Returns the rejection reason, or nothing if the document is acceptable
  virtual std::optional<std::string> check(const engine::Document& document, const std::string& rendered) = 0;
};

// Rejects rendered content containing any of the phrases, case-insensitive.
// An empty phrase list accepts everything.
class KeywordSpamFilter : public SpamFilter {
public:
  explicit KeywordSpamFilter(std::vector<std::string> phrases = {});

  std::optional<std::string> check(const engine::Document& document, const std::string& rendered) override;

private:
  std::vector<std::string> phrases_;
};

} // namespace pastebox::render

#endif // PASTEBOX_RENDER_SPAM_FILTER_HPP
