#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum eSessionType : uint8_t {
    SESSION_WAYLAND = 0,
    SESSION_X11,
};

struct SSession {
    std::string              name;
    std::string              slug;
    std::string              exec;
    std::vector<std::string> command;
    std::vector<std::string> desktopNames;
    eSessionType             type = SESSION_WAYLAND;

    std::vector<std::string> buildEnv() const;
};

namespace Sessions {
    // a `[Desktop Entry]` with Name and Exec that is neither Hidden nor NoDisplay
    std::optional<SSession> parseDesktopEntry(std::string_view content, const std::string& slug, eSessionType type);

    // wayland-sessions/ and xsessions/ under each data dir, sorted by name, one per slug
    std::vector<SSession>   discoverIn(const std::vector<std::string>& dataDirs);

    // $XDG_DATA_DIRS or /usr/local/share:/usr/share
    std::vector<SSession>   discover();
}
