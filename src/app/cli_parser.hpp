#pragma once
#include <string>
#include <vector>
#include "core/errors/wrap_errors.hpp"

namespace wrapmcp::app::cli {

    struct CliOptions {
        bool preserve_ansi = false;   // --ansi
        bool watch_binary = false;    // -w / --watch
        std::string command;
        std::vector<std::string> arguments;
    };

    inline constexpr const char* kUsage =
        "Usage: wrap-mcp [--ansi] [-w|--watch] -- <command> [args...]";

    wrapmcp::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);
}
