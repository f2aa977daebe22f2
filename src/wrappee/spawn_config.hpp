#pragma once

#include <string>
#include <vector>

namespace wrapmcp::wrappee {

    // How to launch the wrapped server. Captured once, reused by every restart.
    struct WrappeeSpawnConfig {
        std::string command;
        std::vector<std::string> arguments;
        bool disable_colors = true;
    };

} // namespace wrapmcp::wrappee
