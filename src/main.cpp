#include "cli/cli.hpp"
#include "crypto/random_source.hpp"
#include "engine/document_engine.hpp"
#include "logger/logger.hpp"
#include "names/name_generator.hpp"
#include "render/highlighter.hpp"
#include "render/spam_filter.hpp"
#include "store/file_store.hpp"
#include "store/sqlite_store.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

struct ProgramOptions {
  std::string words_file;
  std::string store_dir;
  std::string db_file;
  std::string spam_file;
  std::string log_file{"pastebox.log"};
  pastebox::logger::severity_level log_level{boost::log::trivial::info};
  bool strict{false};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " (-s <dir> | -d <file>) [options]\n"
        << "Storage (exactly one):\n"
        << "  -s, --store <dir>    Store documents as files under <dir>\n"
        << "  -d, --db <file>      Store documents in the SQLite database <file>\n"
        << "Options:\n"
        << "  -w, --words <file>   Word list used for document names\n"
        << "  --spam <file>        Phrases rejected by the spam filter\n"
        << "  -l, --log <file>     Log file (default: pastebox.log)\n"
        << "  -v, --level <level>  trace, debug, info, warning, error or fatal\n"
        << "  --strict             Never serve unencrypted legacy content\n"
        << "Example: " << program_name << " -s ./documents -w words.txt\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> value_flags = {
    "-w", "--words", "-s", "--store", "-d", "--db",
    "--spam", "-l", "--log", "-v", "--level"
  };

  ProgramOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "--strict") {
      options.strict = true;
      continue;
    }

    if (value_flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    const std::string value(argv[++i]);

    if (flag == "-w" || flag == "--words") {
      options.words_file = value;
    } else if (flag == "-s" || flag == "--store") {
      options.store_dir = value;
    } else if (flag == "-d" || flag == "--db") {
      options.db_file = value;
    } else if (flag == "--spam") {
      options.spam_file = value;
    } else if (flag == "-l" || flag == "--log") {
      options.log_file = value;
    } else if (flag == "-v" || flag == "--level") {
      if (!pastebox::logger::parse_level(value, options.log_level)) {
        std::cerr << "Error: Invalid log level: " << value << '\n';
        print_usage(argv[0]);
        return options;
      }
    }
  }

  if (options.store_dir.empty() == options.db_file.empty()) {
    std::cerr << "Error: Exactly one of --store and --db is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  try {
    pastebox::logger::init_logging(options.log_file, options.log_level);

    pastebox::names::WordList words;
    if (!options.words_file.empty()) {
      words = pastebox::names::load_words_file(options.words_file);
    }

    std::vector<std::string> phrases;
    if (!options.spam_file.empty()) {
      phrases = pastebox::names::load_words_file(options.spam_file);
    }

    std::unique_ptr<pastebox::store::DocumentStore> store;
    if (!options.store_dir.empty()) {
      store = std::make_unique<pastebox::store::FileStore>(options.store_dir);
    } else {
      store = std::make_unique<pastebox::store::SqliteStore>(options.db_file);
    }

    pastebox::crypto::OpenSSLRandomSource random;
    pastebox::names::NameGenerator names(std::move(words), random);
    pastebox::render::EscapingHighlighter highlighter;
    pastebox::render::KeywordSpamFilter spam_filter(std::move(phrases));

    pastebox::engine::EngineOptions engine_options;
    engine_options.allow_legacy_plaintext = !options.strict;

    pastebox::engine::DocumentEngine engine(*store, names, highlighter, spam_filter, random, engine_options);
    pastebox::cli::CLI cli(engine);
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start pastebox: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
