#pragma once

#include <chrono>
#include <ctime>
#include <string>

class CTerminal;
class CGreeter;

namespace GreeterUi {
    void        draw(CTerminal& term, const CGreeter& greeter);

    // "Monday, March 02  14:05" in the local zone
    std::string clockText(std::chrono::system_clock::time_point now);
    // the same through localtime_r, for when the tz database can't be loaded
    std::string clockTextLibc(time_t now);
}
