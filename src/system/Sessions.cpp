#include "Sessions.hpp"
#include "../helpers/Logger.hpp"
#include "../helpers/Text.hpp"

#include <hyprutils/os/File.hpp>
#include <hyprutils/string/String.hpp>
#include <hyprutils/string/ConstVarList.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <unordered_set>

using namespace Hyprutils::String;

std::vector<std::string> SSession::buildEnv() const {
    std::vector<std::string> env = {std::format("XDG_SESSION_TYPE={}", type == SESSION_X11 ? "x11" : "wayland")};

    if (!desktopNames.empty())
        env.emplace_back(std::format("XDG_CURRENT_DESKTOP={}", Text::join(desktopNames, ":")));

    return env;
}

std::optional<SSession> Sessions::parseDesktopEntry(std::string_view content, const std::string& slug, eSessionType type) {
    std::optional<std::string> name, exec;
    std::string                desktopNames;
    bool                       inEntry = false, hidden = false;

    size_t                     pos = 0;
    while (pos <= content.size()) {
        auto end = content.find('\n', pos);
        if (end == std::string_view::npos)
            end = content.size();

        const auto LINE = trim(std::string{content.substr(pos, end - pos)});
        pos             = end + 1;

        if (LINE.empty() || LINE.starts_with('#'))
            continue;

        if (LINE.starts_with('[')) {
            inEntry = LINE == "[Desktop Entry]";
            continue;
        }

        if (!inEntry)
            continue;

        const auto EQ = LINE.find('=');
        if (EQ == std::string::npos)
            continue;

        const auto KEY   = trim(LINE.substr(0, EQ));
        const auto VALUE = trim(LINE.substr(EQ + 1));

        if (KEY == "Name")
            name = VALUE;
        else if (KEY == "Exec")
            exec = VALUE;
        else if (KEY == "DesktopNames")
            desktopNames = VALUE;
        else if ((KEY == "Hidden" || KEY == "NoDisplay") && VALUE == "true")
            hidden = true;
    }

    if (hidden || !name || !exec || exec->empty())
        return std::nullopt;

    SSession session{.name = *name, .slug = slug, .exec = *exec, .type = type};

    if (auto argv = Text::shellSplit(*exec); argv && !argv->empty())
        session.command = std::move(*argv);
    else
        session.command = {*exec};

    CConstVarList names(desktopNames, 0, ';', true);
    for (const auto& n : names) {
        session.desktopNames.emplace_back(n);
    }

    return session;
}

static void loadDir(const std::filesystem::path& dir, eSessionType type, std::vector<SSession>& out) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec))
        return;

    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.path().extension() != ".desktop")
            continue;

        const auto CONTENT = Hyprutils::File::readFileAsString(entry.path().string());
        if (!CONTENT) {
            g_logger->log(LOG_WARN, "sessions: can't read {}: {}", entry.path().string(), CONTENT.error());
            continue;
        }

        if (auto s = Sessions::parseDesktopEntry(*CONTENT, entry.path().stem().string(), type))
            out.emplace_back(std::move(*s));
    }

    if (ec)
        g_logger->log(LOG_WARN, "sessions: failed to list {}: {}", dir.string(), ec.message());
}

std::vector<SSession> Sessions::discoverIn(const std::vector<std::string>& dataDirs) {
    std::vector<SSession> sessions;

    for (const auto& d : dataDirs) {
        loadDir(std::filesystem::path{d} / "wayland-sessions", SESSION_WAYLAND, sessions);
        loadDir(std::filesystem::path{d} / "xsessions", SESSION_X11, sessions);
    }

    std::ranges::stable_sort(sessions, [](const auto& a, const auto& b) { return Text::lower(a.name) < Text::lower(b.name); });

    std::unordered_set<std::string> seen;
    std::erase_if(sessions, [&seen](const auto& s) { return !seen.emplace(s.slug).second; });

    g_logger->log(LOG_DEBUG, "sessions: found {}", sessions.size());

    return sessions;
}

std::vector<SSession> Sessions::discover() {
    const auto               ENV = getenv("XDG_DATA_DIRS");

    std::vector<std::string> dirs;
    CConstVarList            list(ENV && ENV[0] != '\0' ? std::string{ENV} : std::string{"/usr/local/share:/usr/share"}, 0, ':', true);
    for (const auto& d : list) {
        dirs.emplace_back(d);
    }

    return discoverIn(dirs);
}
