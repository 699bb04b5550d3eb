#pragma once

#include <expected>
#include <string>
#include <vector>

namespace Exec {
    struct SResult {
        int         exitCode = -1;
        std::string out, err;
    };

    // run argv[0] (looked up in PATH) and wait for it. stdin receives `input` and is then closed,
    // stdout and stderr are captured. `input` is never copied.
    std::expected<SResult, std::string> run(const std::vector<std::string>& argv, const std::string& input = "");

    // run a program attached to our terminal and wait for it. Returns its exit code.
    std::expected<int, std::string> runInteractive(const std::string& program, const std::vector<std::string>& args);
}
