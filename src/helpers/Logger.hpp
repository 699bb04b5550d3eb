#pragma once

#include <hyprutils/cli/Logger.hpp>

#include <optional>
#include <string>

#include "Memory.hpp"

using Hyprutils::CLI::LOG_TRACE;
using Hyprutils::CLI::LOG_DEBUG;
using Hyprutils::CLI::LOG_WARN;
using Hyprutils::CLI::LOG_ERR;
using Hyprutils::CLI::LOG_CRIT;

inline UP<Hyprutils::CLI::CLogger> g_logger = makeUnique<Hyprutils::CLI::CLogger>();

namespace Log {
    // logging is off unless a file is given, stdout belongs to the terminal ui
    bool init(const std::optional<std::string>& logFile, bool verbose);
}
