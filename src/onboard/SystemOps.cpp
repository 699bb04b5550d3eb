#include "SystemOps.hpp"
#include "../helpers/Text.hpp"

#include <hyprutils/string/String.hpp>

#include <format>

using namespace Hyprutils::String;

std::vector<std::string> SystemOps::createUserCommand(const std::string& username, const std::vector<std::string>& groups, const std::string& shell) {
    std::vector<std::string> argv = {"useradd", "-m", "-s", shell};

    if (!groups.empty()) {
        argv.emplace_back("-G");
        argv.emplace_back(Text::join(groups, ","));
    }

    argv.emplace_back(username);
    return argv;
}

std::vector<std::string> SystemOps::setLocaleCommand(const std::string& locale) {
    return {"localectl", "set-locale", std::format("LANG={}", locale)};
}

std::vector<std::string> SystemOps::setKeymapCommand(const std::string& keymap) {
    return {"localectl", "set-keymap", keymap};
}

std::vector<std::string> SystemOps::setTimezoneCommand(const std::string& timezone) {
    return {"timedatectl", "set-timezone", timezone};
}

std::vector<std::string> SystemOps::networkProbeCommand() {
    return {"ping", "-c", "1", "-W", "2", "1.1.1.1"};
}

std::string SystemOps::userShellCommand(const std::vector<std::string>& cmd, bool sudo) {
    std::vector<std::string> quoted;
    quoted.reserve(cmd.size());
    for (const auto& c : cmd) {
        quoted.emplace_back(Text::shellQuote(c));
    }

    const auto LINE = Text::join(quoted, " ");

    // -p '' keeps the prompt out of the captured output
    return sudo ? std::format("sudo -S -p '' {}", LINE) : LINE;
}

std::vector<std::string> SystemOps::lines(std::string_view output) {
    std::vector<std::string> out;

    size_t                   pos = 0;
    while (pos < output.size()) {
        auto end = output.find('\n', pos);
        if (end == std::string_view::npos)
            end = output.size();

        auto line = std::string{output.substr(pos, end - pos)};
        if (!trim(line).empty())
            out.emplace_back(std::move(line));

        pos = end + 1;
    }

    return out;
}

std::string SystemOps::filterSudoNoise(std::string_view output) {
    std::vector<std::string> kept;
    for (auto& l : lines(output)) {
        if (l.contains("[sudo]") || l.contains("password"))
            continue;
        kept.emplace_back(std::move(l));
    }
    return Text::join(kept, "\n");
}

std::string SystemOps::stripInitialSession(std::string_view config) {
    std::string out;
    bool        inInitial = false;

    size_t      pos = 0;
    while (pos < config.size()) {
        auto end = config.find('\n', pos);
        if (end == std::string_view::npos)
            end = config.size();

        const auto LINE    = config.substr(pos, end - pos);
        const auto TRIMMED = trim(std::string{LINE});
        pos                = end + 1;

        if (TRIMMED == "[initial_session]") {
            inInitial = true;
            continue;
        }

        if (inInitial) {
            if (!TRIMMED.starts_with('['))
                continue;
            inInitial = false;
        }

        out.append(LINE);
        out += '\n';
    }

    return out;
}
