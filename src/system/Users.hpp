#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct SUser {
    std::string username;
    std::string displayName; // empty when the gecos name is missing or equals the username

    std::string label() const;
};

struct SUidRange {
    uint32_t min = 1000;
    uint32_t max = 60000;
};

namespace Users {
    // UID_MIN / UID_MAX out of a login.defs, defaults for what's missing
    SUidRange            parseLoginDefs(std::string_view content);

    // one passwd line. Rejects system, nologin and hidden accounts
    std::optional<SUser> parsePasswdLine(std::string_view line, const SUidRange& range);

    // sorted by username
    std::vector<SUser>   parsePasswd(std::string_view content, const SUidRange& range);

    std::vector<SUser>   discover();
}
