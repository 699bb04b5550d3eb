#include "Logger.hpp"

#include <cstdio>

bool Log::init(const std::optional<std::string>& logFile, bool verbose) {
    g_logger->setEnableStdout(false);
    g_logger->setEnableColor(false);
    g_logger->setLogLevel(verbose ? LOG_TRACE : LOG_DEBUG);

    if (!logFile)
        return true;

    g_logger->setTime(true);

    if (const auto RET = g_logger->setOutputFile(*logFile); !RET) {
        // nowhere to report this but stderr, the terminal is not up yet
        std::fprintf(stderr, "vimgreet: can't open log file %s: %s\n", logFile->c_str(), RET.error().c_str());
        return false;
    }

    return true;
}
