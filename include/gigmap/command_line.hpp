#pragma once

#include <gigmap/argument.hpp>
#include <optional>
#include <string>

namespace gigmap
{

// Options every gigmap tool understands, split from the boundary arguments.
struct CommandLine
{
    RawParams                  params;   // --key value pairs, --params defaults merged in
    bool                       help = false;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
};

// Accepts "--key value" and "--key=value". A later repeat of a key wins.
// "--params FILE" loads a flat JSON object whose entries act as defaults.
// Throws ConfigError for a positional argument, a key without a value or an
// unreadable parameters file.
CommandLine parse_command_line(int argc, const char* const* argv);

// Flat JSON object -> raw parameters. Strings are taken as-is, numbers keep
// their source text, true/false become "true"/"false", null entries are
// skipped. Nested objects and arrays are rejected with a ConfigError.
RawParams parse_params_json(const std::string& text, const std::string& source = "<params>");

RawParams load_params_file(const std::string& path);

// Route log output as requested on the command line: console always, plus
// a file when given. Throws ConfigError for an unknown level name.
void configure_logging(const CommandLine& cmd);

}   // namespace gigmap
