#ifndef PASTEBOX_NAMES_NAME_GENERATOR_HPP
#define PASTEBOX_NAMES_NAME_GENERATOR_HPP

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>
#include "crypto/random_source.hpp"

namespace pastebox {
namespace names {

using WordList = std::vector<std::string>;

class NameError : public std::runtime_error {
public:
  explicit NameError(const std::string& message) : std::runtime_error(message) {}
};

// Reads newline separated words, lowercased and trimmed. Blank lines and
// lines starting with '#' are skipped. Throws NameError if nothing is left.
WordList load_words_file(const std::string& filename);

class NameGenerator {
public:
  static constexpr int DRAW_COUNT = 6;
  static constexpr int MAX_ATTEMPTS = 10;
  static constexpr const char* CHARACTERS = "abcdefghijklmnopqrstuvwxyz0123456789";

  // ---- CONSTRUCTOR ----
  NameGenerator(WordList words, crypto::RandomSource& random);


  // ---- NAME GENERATION ----
  // Produces a slug like "cornflake-peddling-bp0q", or "bp0qx7" without words.
  // Terminates the process if the random source keeps failing.
  std::string generate_name();
  // Repeats generate_name() until exists() reports the candidate as unused
  std::string generate_safe_name(const std::function<bool(const std::string&)>& exists);


  // ---- GETTERS ----
  const WordList& words() const { return words_; }

private:
  // ---- PARAMETERS ----
  const WordList words_;
  const WordList characters_;
  crypto::RandomSource& random_;


  // ---- RANDOM DRAWS ----
  // Picks a uniformly distributed element, retrying a failing source
  const std::string& random_element(const WordList& list);
  // Uniform index in [0, bound) by rejection sampling
  bool random_index(uint32_t bound, uint32_t& index);
};

} // namespace names
} // namespace pastebox

#endif // PASTEBOX_NAMES_NAME_GENERATOR_HPP
