#include "render/spam_filter.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/find.hpp>
#include <boost/log/trivial.hpp>

namespace pastebox::render {

KeywordSpamFilter::KeywordSpamFilter(std::vector<std::string> phrases) {
  for (auto& phrase : phrases) {
    if (!phrase.empty()) {
      phrases_.push_back(boost::algorithm::to_lower_copy(phrase));
    }
  }
  BOOST_LOG_TRIVIAL(info) << "Spam filter: Initialized with " << phrases_.size() << " phrases";
}

std::optional<std::string> KeywordSpamFilter::check(const engine::Document& /*document*/, const std::string& rendered) {
  for (const auto& phrase : phrases_) {
    if (!boost::algorithm::ifind_first(rendered, phrase).empty()) {
      BOOST_LOG_TRIVIAL(debug) << "Spam filter: Matched phrase: " << phrase;
      return "blocked phrase \"" + phrase + "\"";
    }
  }
  return std::nullopt;
}

} // namespace pastebox::render
