#pragma once

#include <string>

// the transient line under the ui, cleared by the next key
struct SStatusMessage {
    std::string text;
    bool        isError = false;
};
