#ifndef BLOBNET_CLI_CLI_HPP
#define BLOBNET_CLI_CLI_HPP

#include <iostream>
#include <optional>
#include <string>
#include "api/command_handler.hpp"

namespace blobnet {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(api::CommandHandler& handler, std::istream& in = std::cin, std::ostream& out = std::cout);


    // ---- STARTUP ----
    void run();

    // Turns one input line into a command object. Lines starting with '{'
    // are taken as JSON, everything else as a short form.
    // Returns nullopt and prints usage when the short form is malformed.
    std::optional<api::json> translate(const std::string& line);

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    api::CommandHandler& handler_;
    std::istream& in_;
    std::ostream& out_;


    // ---- COMMAND PROCESSING ----
    void process_line(const std::string& line);
    std::optional<api::json> translate_upload(std::istringstream& args);
    std::optional<api::json> translate_check(std::istringstream& args);
    std::optional<api::json> translate_download(std::istringstream& args);
    void handle_help_command();
};

} // namespace cli
} // namespace blobnet

#endif // BLOBNET_CLI_CLI_HPP
