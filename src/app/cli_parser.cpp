#include "cli_parser.hpp"
#include <optional>

namespace wrapmcp::app::cli {

    using namespace wrapmcp::core::errors;

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        CliOptions options;
        std::optional<int> separator;

        // 1. Wrapper options: everything before "--"
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--") {
                separator = i;
                break;
            }
            if (arg == "--ansi") {
                options.preserve_ansi = true;
            } else if (arg == "-w" || arg == "--watch") {
                options.watch_binary = true;
            } else if (arg == "-h" || arg == "--help") {
                return WrapError{ErrorKind::Input, "Help requested.", "help_requested", kUsage};
            } else {
                return WrapError{ErrorKind::Input, "Unknown argument: " + arg, "unknown_argument", kUsage};
            }
        }

        // 2. Wrappee command line: passed through untouched
        if (!separator.has_value()) {
            return WrapError{ErrorKind::Input, "No wrappee command specified (missing '--').", "missing_command", kUsage};
        }
        if (*separator + 1 >= argc) {
            return WrapError{ErrorKind::Input, "No wrappee command after '--'.", "missing_command", kUsage};
        }

        options.command = argv[*separator + 1];
        if (options.command.empty()) {
            return WrapError{ErrorKind::Input, "Wrappee command is empty.", "missing_command", kUsage};
        }
        for (int i = *separator + 2; i < argc; ++i) {
            options.arguments.push_back(argv[i]);
        }

        return options;
    }

} // namespace wrapmcp::app::cli
