#include "names/name_generator.hpp"
#include <exception>
#include <fstream>
#include <limits>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/log/trivial.hpp>

namespace pastebox {
namespace names {

//==============================================
// WORD LIST LOADING
//==============================================

WordList load_words_file(const std::string& filename) {
  std::ifstream file(filename);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Name generator: Failed to open words file: " << filename;
    throw NameError("Failed to open words file: " + filename);
  }

  WordList words;
  std::string line;
  while (std::getline(file, line)) {
    boost::algorithm::trim(line);
    boost::algorithm::to_lower(line);
    if (!line.empty() && line.front() != '#') {
      words.push_back(line);
    }
  }

  if (file.bad()) {
    throw NameError("Failed to read words file: " + filename);
  }
  if (words.empty()) {
    throw NameError("file doesn't contain any words");
  }

  BOOST_LOG_TRIVIAL(debug) << "Name generator: " << words.size() << " words loaded.";
  return words;
}


//==============================================
// CONSTRUCTOR
//==============================================

namespace {

WordList split_characters(const std::string& alphabet) {
  WordList characters;
  for (char c : alphabet) {
    characters.emplace_back(1, c);
  }
  return characters;
}

} // namespace

NameGenerator::NameGenerator(WordList words, crypto::RandomSource& random)
  : words_(std::move(words))
  , characters_(split_characters(CHARACTERS))
  , random_(random) {
  BOOST_LOG_TRIVIAL(info) << "Name generator: Initialized with " << words_.size() << " words";
}


//==============================================
// NAME GENERATION
//==============================================

std::string NameGenerator::generate_name() {
  const bool has_words = !words_.empty();
  std::string text;

  for (int i = 0; i < DRAW_COUNT; ++i) {
    const std::string& word = (i < 2 && has_words) ? random_element(words_) : random_element(characters_);

    if (i < 3 && has_words) {
      text += "-" + word;
    } else {
      text += word;
    }
  }

  if (!text.empty() && text.front() == '-') {
    text.erase(0, 1);
  }
  return text;
}

std::string NameGenerator::generate_safe_name(const std::function<bool(const std::string&)>& exists) {
  while (true) {
    std::string name = generate_name();
    if (!exists(name)) {
      return name;
    }
    BOOST_LOG_TRIVIAL(debug) << "Name generator: Collision on generated name, retrying";
  }
}


//==============================================
// RANDOM DRAWS
//==============================================

const std::string& NameGenerator::random_element(const WordList& list) {
  const auto bound = static_cast<uint32_t>(list.size());

  for (int attempt = 1; attempt <= MAX_ATTEMPTS; ++attempt) {
    uint32_t index = 0;
    if (random_index(bound, index)) {
      return list[index];
    }
    BOOST_LOG_TRIVIAL(warning) << "Name generator: Random source failed (attempt " << attempt << " of " << MAX_ATTEMPTS << ")";
  }

  // Identifiers are key derivation input, a weak fallback would weaken every key
  BOOST_LOG_TRIVIAL(fatal) << "Name generator: Random source failed " << MAX_ATTEMPTS
                           << " times in a row - something is probably extremely wrong!";
  std::terminate();
}

bool NameGenerator::random_index(uint32_t bound, uint32_t& index) {
  // Largest multiple of bound that fits, values above it are redrawn
  const uint32_t limit = std::numeric_limits<uint32_t>::max() - (std::numeric_limits<uint32_t>::max() % bound);

  uint32_t value = 0;
  do {
    if (!random_.fill(reinterpret_cast<uint8_t*>(&value), sizeof(value))) {
      return false;
    }
  } while (value >= limit);

  index = value % bound;
  return true;
}

} // namespace names
} // namespace pastebox
