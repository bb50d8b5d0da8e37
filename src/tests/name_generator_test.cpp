#include <gtest/gtest.h>
#include <regex>
#include <set>
#include "names/name_generator.hpp"
#include "test_utils.hpp"

using namespace pastebox::names;

class NameGeneratorTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;

  void SetUp() override {
    init_logging();
    test_dir = make_temp_dir("name_generator_test");
  }

  void TearDown() override {
    std::filesystem::remove_all(test_dir);
  }
};

TEST_F(NameGeneratorTest, WithoutWordsProducesSixCharacters) {
  pastebox::crypto::OpenSSLRandomSource random;
  NameGenerator generator({}, random);
  const std::regex pattern("^[a-z0-9]{6}$");

  for (int i = 0; i < 50; ++i) {
    std::string name = generator.generate_name();
    EXPECT_TRUE(std::regex_match(name, pattern)) << "Unexpected name: " << name;
  }
}

TEST_F(NameGeneratorTest, WithWordsProducesWordWordSuffix) {
  pastebox::crypto::OpenSSLRandomSource random;
  NameGenerator generator({"alpha", "bravo", "charlie"}, random);
  const std::regex pattern("^(alpha|bravo|charlie)-(alpha|bravo|charlie)-[a-z0-9]{4}$");

  for (int i = 0; i < 50; ++i) {
    std::string name = generator.generate_name();
    EXPECT_TRUE(std::regex_match(name, pattern)) << "Unexpected name: " << name;
  }
}

TEST_F(NameGeneratorTest, DrawsMapToWordsAndCharacters) {
  // 27 -> '1', 16 -> 'q', 26 -> '0'
  SequenceRandomSource random({0, 1, 1, 27, 16, 26});
  NameGenerator generator({"cornflake", "peddling"}, random);

  EXPECT_EQ(generator.generate_name(), "cornflake-peddling-b1q0");
}

TEST_F(NameGeneratorTest, DrawsWithoutWordsHaveNoSeparators) {
  SequenceRandomSource random({0, 1, 2, 35, 26, 25});
  NameGenerator generator({}, random);

  EXPECT_EQ(generator.generate_name(), "abc90z");
}

TEST_F(NameGeneratorTest, RecoversFromTransientSourceFailures) {
  FlakyRandomSource random(NameGenerator::MAX_ATTEMPTS - 1);
  NameGenerator generator({}, random);

  EXPECT_EQ(generator.generate_name(), "aaaaaa");
  EXPECT_EQ(random.calls(), NameGenerator::MAX_ATTEMPTS + 5);
}

TEST_F(NameGeneratorTest, PersistentSourceFailureTerminates) {
  GTEST_FLAG_SET(death_test_style, "threadsafe");
  EXPECT_DEATH({
    FlakyRandomSource random(NameGenerator::MAX_ATTEMPTS);
    NameGenerator generator({}, random);
    generator.generate_name();
  }, "");
}

TEST_F(NameGeneratorTest, SafeNameSkipsExistingNames) {
  pastebox::crypto::OpenSSLRandomSource random;
  NameGenerator generator({}, random);

  std::set<std::string> seen;
  int calls = 0;
  std::string name = generator.generate_safe_name([&](const std::string& candidate) {
    seen.insert(candidate);
    return ++calls < 4;
  });

  EXPECT_EQ(calls, 4);
  EXPECT_TRUE(seen.count(name));
}

TEST_F(NameGeneratorTest, LoadsWordsFile) {
  auto path = test_dir / "words.txt";
  write_file(path, "# adjectives\n  Cornflake \n\nPEDDLING\r\n#skip\n\t\nzebra");

  WordList words = load_words_file(path.string());
  EXPECT_EQ(words, (WordList{"cornflake", "peddling", "zebra"}));
}

TEST_F(NameGeneratorTest, RejectsEmptyWordsFile) {
  auto path = test_dir / "empty.txt";
  write_file(path, "# only comments\n\n   \n");

  EXPECT_THROW(load_words_file(path.string()), NameError);
}

TEST_F(NameGeneratorTest, RejectsMissingWordsFile) {
  EXPECT_THROW(load_words_file((test_dir / "missing.txt").string()), NameError);
}
