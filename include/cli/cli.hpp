#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "engine/document_engine.hpp"

namespace pastebox {
namespace cli {

class CLI {
public:
    // Upper bound for "expire", 100 years
    static constexpr long MAX_EXPIRATION_SECONDS = 100L * 365 * 24 * 60 * 60;

    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(engine::DocumentEngine& engine, std::istream& input = std::cin, std::ostream& output = std::cout);


    // ---- STARTUP ----
    void run();

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    engine::DocumentEngine& engine_;
    std::istream& input_;
    std::ostream& output_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::vector<std::string>& args);
    void handle_store_command(const std::vector<std::string>& args, std::optional<utils::TimePoint> expiration);
    void handle_expire_command(const std::vector<std::string>& args);
    void handle_read_command(const std::string& id, bool raw);
    void handle_delete_command(const std::string& id);
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace pastebox
