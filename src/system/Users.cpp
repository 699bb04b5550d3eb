#include "Users.hpp"
#include "../helpers/Logger.hpp"

#include <hyprutils/os/File.hpp>
#include <hyprutils/string/String.hpp>
#include <hyprutils/string/ConstVarList.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <format>

using namespace Hyprutils::String;

constexpr std::array<std::string_view, 3> HIDDEN_USERS = {"nobody", "nfsnobody", "greeter"};

static std::optional<uint32_t> parseUint(std::string_view str) {
    uint32_t   out = 0;
    const auto RES = std::from_chars(str.data(), str.data() + str.size(), out);
    if (RES.ec != std::errc{} || RES.ptr != str.data() + str.size())
        return std::nullopt;
    return out;
}

template <typename F>
static void forEachLine(std::string_view content, F&& fn) {
    size_t pos = 0;
    while (pos < content.size()) {
        auto end = content.find('\n', pos);
        if (end == std::string_view::npos)
            end = content.size();
        fn(content.substr(pos, end - pos));
        pos = end + 1;
    }
}

std::string SUser::label() const {
    if (displayName.empty())
        return username;
    return std::format("{} ({})", displayName, username);
}

SUidRange Users::parseLoginDefs(std::string_view content) {
    SUidRange range;

    forEachLine(content, [&range](std::string_view raw) {
        const auto LINE = trim(std::string{raw});
        if (LINE.empty() || LINE.starts_with('#'))
            return;

        const auto SPACE = LINE.find_first_of(" \t");
        if (SPACE == std::string::npos)
            return;

        const auto KEY   = LINE.substr(0, SPACE);
        const auto VALUE = parseUint(trim(LINE.substr(SPACE + 1)));
        if (!VALUE)
            return;

        if (KEY == "UID_MIN")
            range.min = *VALUE;
        else if (KEY == "UID_MAX")
            range.max = *VALUE;
    });

    return range;
}

std::optional<SUser> Users::parsePasswdLine(std::string_view line, const SUidRange& range) {
    CConstVarList fields(std::string{line}, 0, ':', false);
    if (fields.size() < 7)
        return std::nullopt;

    const auto UID = parseUint(fields[2]);
    if (!UID || *UID < range.min || *UID > range.max)
        return std::nullopt;

    const auto SHELL = fields[6];
    if (SHELL.contains("nologin") || SHELL.contains("false"))
        return std::nullopt;

    const auto USERNAME = std::string{fields[0]};
    if (std::ranges::find(HIDDEN_USERS, USERNAME) != HIDDEN_USERS.end())
        return std::nullopt;

    SUser      user{.username = USERNAME};

    const auto GECOS = fields[4];
    const auto NAME  = trim(std::string{GECOS.substr(0, GECOS.find(','))});
    if (!NAME.empty() && NAME != USERNAME)
        user.displayName = NAME;

    return user;
}

std::vector<SUser> Users::parsePasswd(std::string_view content, const SUidRange& range) {
    std::vector<SUser> users;

    forEachLine(content, [&](std::string_view line) {
        if (auto u = parsePasswdLine(line, range))
            users.emplace_back(std::move(*u));
    });

    std::ranges::sort(users, [](const auto& a, const auto& b) { return a.username < b.username; });
    return users;
}

std::vector<SUser> Users::discover() {
    SUidRange range;
    if (const auto DEFS = Hyprutils::File::readFileAsString("/etc/login.defs"); DEFS)
        range = parseLoginDefs(*DEFS);
    else
        g_logger->log(LOG_WARN, "users: can't read /etc/login.defs, using defaults");

    const auto PASSWD = Hyprutils::File::readFileAsString("/etc/passwd");
    if (!PASSWD) {
        g_logger->log(LOG_WARN, "users: can't read /etc/passwd: {}", PASSWD.error());
        return {};
    }

    auto users = parsePasswd(*PASSWD, range);
    g_logger->log(LOG_DEBUG, "users: found {} in uid range {}-{}", users.size(), range.min, range.max);
    return users;
}
