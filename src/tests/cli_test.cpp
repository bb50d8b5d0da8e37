#include <gtest/gtest.h>
#include <sstream>
#include "cli/cli.hpp"
#include "store/file_store.hpp"
#include "test_utils.hpp"

using namespace pastebox;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;

class CLITest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<store::FileStore> file_store;
  crypto::OpenSSLRandomSource random;
  std::unique_ptr<names::NameGenerator> generator;
  render::EscapingHighlighter highlighter;
  NiceMock<MockSpamFilter> spam_filter;
  std::unique_ptr<engine::DocumentEngine> engine;

  void SetUp() override {
    init_logging();
    test_dir = make_temp_dir("cli_test");
    file_store = std::make_unique<store::FileStore>((test_dir / "store").string());
    generator = std::make_unique<names::NameGenerator>(names::WordList{}, random);
    engine = std::make_unique<engine::DocumentEngine>(*file_store, *generator, highlighter, spam_filter, random);
    write_file(test_dir / "snippet.txt", "x < y\r\n");
  }

  void TearDown() override {
    engine.reset();
    file_store.reset();
    std::filesystem::remove_all(test_dir);
  }

  // Feeds the commands to a fresh shell and returns everything it printed
  std::string run_commands(const std::string& commands) {
    std::istringstream input(commands);
    std::ostringstream output;
    cli::CLI shell(*engine, input, output);
    shell.run();
    return output.str();
  }

  // The id printed by a single store command
  std::string store_snippet(const std::string& command = "store") {
    std::string output = run_commands(command + " " + (test_dir / "snippet.txt").string() + "\nquit\n");
    const std::string prompt = "pastebox> ";
    std::string id = output.substr(prompt.size());
    return id.substr(0, id.find('\n'));
  }
};

TEST_F(CLITest, HelpListsCommands) {
  std::string output = run_commands("help\nquit\n");
  EXPECT_THAT(output, HasSubstr("store <file> [syntax]"));
  EXPECT_THAT(output, HasSubstr("burn <file> [syntax]"));
  EXPECT_THAT(output, HasSubstr("delete <id>"));
}

TEST_F(CLITest, UnknownCommand) {
  EXPECT_THAT(run_commands("frobnicate\nread\nquit\n"), HasSubstr("Unknown command or invalid arguments"));
}

TEST_F(CLITest, StorePrintsIdThatCanBeRead) {
  std::string id = store_snippet();
  ASSERT_EQ(id.size(), 6u) << "Unexpected id: " << id;

  EXPECT_THAT(run_commands("read " + id + "\nquit\n"), HasSubstr("x &lt; y\n"));
  EXPECT_THAT(run_commands("raw " + id + "\nquit\n"), HasSubstr("x < y\n"));
}

TEST_F(CLITest, MissingFileIsReported) {
  EXPECT_THAT(run_commands("store /nonexistent/file.txt\nquit\n"), HasSubstr("Error opening file"));
}

TEST_F(CLITest, BurnedDocumentIsReadOnce) {
  std::string id = store_snippet("burn");

  EXPECT_THAT(run_commands("raw " + id + "\nquit\n"), HasSubstr("x < y\n"));
  engine->wait_for_background();
  EXPECT_THAT(run_commands("raw " + id + "\nquit\n"), HasSubstr("Document not found: " + id));
}

TEST_F(CLITest, InvalidExpirationIsReported) {
  std::string output = run_commands("expire soon " + (test_dir / "snippet.txt").string() + "\nquit\n");
  EXPECT_THAT(output, HasSubstr("Invalid expiration: soon"));
  EXPECT_TRUE(std::filesystem::is_empty(test_dir / "store"));
}

TEST_F(CLITest, DeleteRemovesDocument) {
  std::string id = store_snippet();

  EXPECT_THAT(run_commands("delete " + id + "\nquit\n"), HasSubstr("Document deleted successfully"));
  EXPECT_THAT(run_commands("delete " + id + "\nquit\n"), HasSubstr("Document not found: " + id));
}

TEST_F(CLITest, SpamRejectionIsDisplayed) {
  EXPECT_CALL(spam_filter, check(_, _)).WillOnce(::testing::Return(std::optional<std::string>("bad")));

  std::string output = run_commands("store " + (test_dir / "snippet.txt").string() + "\nquit\n");
  EXPECT_THAT(output, HasSubstr("Error storing file: spam: bad"));
}

TEST_F(CLITest, ExpirationBeyondLimitIsRejected) {
  const std::string file = (test_dir / "snippet.txt").string();

  std::string output = run_commands("expire 9300000000 " + file + "\nquit\n");
  EXPECT_THAT(output, HasSubstr("Invalid expiration: 9300000000"));
  output = run_commands("expire " + std::to_string(cli::CLI::MAX_EXPIRATION_SECONDS + 1) + " " + file + "\nquit\n");
  EXPECT_THAT(output, HasSubstr("Invalid expiration"));
  EXPECT_TRUE(std::filesystem::is_empty(test_dir / "store"));
}

TEST_F(CLITest, LongExpirationSurvivesReads) {
  std::string output = run_commands("expire " + std::to_string(cli::CLI::MAX_EXPIRATION_SECONDS) + " " +
                                    (test_dir / "snippet.txt").string() + "\nquit\n");
  const std::string prompt = "pastebox> ";
  std::string id = output.substr(prompt.size());
  id = id.substr(0, id.find('\n'));
  ASSERT_EQ(id.size(), 6u) << "Unexpected output: " << output;

  EXPECT_THAT(run_commands("raw " + id + "\nquit\n"), HasSubstr("x < y\n"));
  engine->wait_for_background();
  EXPECT_THAT(run_commands("raw " + id + "\nquit\n"), HasSubstr("x < y\n"));
}
