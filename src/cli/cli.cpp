#include "cli/cli.hpp"
#include <fstream>
#include <sstream>
#include <boost/log/trivial.hpp>
#include "store/store_error.hpp"

namespace pastebox {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================
  
CLI::CLI(engine::DocumentEngine& engine, std::istream& input, std::ostream& output)
  : running_(false)
  , engine_(engine)
  , input_(input)
  , output_(output) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  output_ << "pastebox> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    std::istringstream iss(line);
    std::string command;
    std::vector<std::string> args;

    iss >> command;
    for (std::string arg; iss >> arg;) {
      args.push_back(arg);
    }

    if (command == "quit") {
      running_ = false;
      continue;
    }
    if (!command.empty()) {
      process_command(command, args);
    }

    if (running_) {
      output_ << "pastebox> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}


//==============================================
// COMMAND PROCESSING 
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  if (command == "help" && args.empty()) {
    handle_help_command();
  }
  else if (command == "store" && (args.size() == 1 || args.size() == 2)) {
    handle_store_command(args, std::nullopt);
  }
  else if (command == "burn" && (args.size() == 1 || args.size() == 2)) {
    handle_store_command(args, engine::Document::volatile_marker());
  }
  else if (command == "expire" && (args.size() == 2 || args.size() == 3)) {
    handle_expire_command(args);
  }
  else if ((command == "read" || command == "raw") && args.size() == 1) {
    handle_read_command(args[0], command == "raw");
  }
  else if (command == "delete" && args.size() == 1) {
    handle_delete_command(args[0]);
  }
  else {
    output_ << "Unknown command or invalid arguments" << std::endl;
  }
}

void CLI::handle_store_command(const std::vector<std::string>& args, std::optional<utils::TimePoint> expiration) {
  const std::string& filename = args[0];
  std::ifstream file(filename, std::ios::binary);
  if (!file) {
    output_ << "Error opening file: " << filename << std::endl;
    return;
  }

  std::ostringstream content;
  content << file.rdbuf();

  engine::Document document;
  document.content = content.str();
  document.syntax = args.size() > 1 ? args[1] : "";
  document.expiration = expiration;

  try {
    engine_.store(document);
    output_ << document.id << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error storing file", e.what());
  }
}

void CLI::handle_expire_command(const std::vector<std::string>& args) {
  long seconds = 0;
  try {
    size_t consumed = 0;
    seconds = std::stol(args[0], &consumed);
    if (consumed != args[0].size() || seconds <= 0 || seconds > MAX_EXPIRATION_SECONDS) {
      throw std::invalid_argument(args[0]);
    }
  } catch (const std::exception&) {
    output_ << "Invalid expiration: " << args[0] << " (expected 1 to " << MAX_EXPIRATION_SECONDS << " seconds)" << std::endl;
    return;
  }

  std::vector<std::string> store_args(args.begin() + 1, args.end());
  handle_store_command(store_args, utils::Clock::now() + std::chrono::seconds(seconds));
}

void CLI::handle_read_command(const std::string& id, bool raw) {
  try {
    engine::Document document = engine_.request(id, raw);
    output_ << document.content << std::flush;
  } catch (const store::NotFoundError&) {
    output_ << "Document not found: " << id << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading document", e.what());
  }
}

void CLI::handle_delete_command(const std::string& id) {
  try {
    engine_.remove(id);
    output_ << "Document deleted successfully" << std::endl;
  } catch (const store::NotFoundError&) {
    output_ << "Document not found: " << id << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error deleting document", e.what());
  }
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                            Display this help message" << std::endl;
  output_ << "  store <file> [syntax]           Store <file>, prints its id" << std::endl;
  output_ << "  burn <file> [syntax]            Store <file>, deleted after the first read" << std::endl;
  output_ << "  expire <secs> <file> [syntax]   Store <file>, expires after <secs> seconds" << std::endl;
  output_ << "  read <id>                       Print the rendered document" << std::endl;
  output_ << "  raw <id>                        Print the document as plain text" << std::endl;
  output_ << "  delete <id>                     Delete the document" << std::endl;
  output_ << "  quit                            Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace pastebox
