#include "Command.hpp"
#include "../helpers/Text.hpp"

#include <hyprutils/string/String.hpp>

#include <array>
#include <format>
#include <utility>

using namespace Hyprutils::String;

template <typename T>
struct SKeyword {
    const char* word;
    T           value;
};

constexpr std::array LOGIN_KEYWORDS = {
    SKeyword<eLoginCommand>{"reboot", LOGIN_COMMAND_REBOOT},   SKeyword<eLoginCommand>{"rb", LOGIN_COMMAND_REBOOT},
    SKeyword<eLoginCommand>{"poweroff", LOGIN_COMMAND_POWEROFF}, SKeyword<eLoginCommand>{"shutdown", LOGIN_COMMAND_POWEROFF},
    SKeyword<eLoginCommand>{"po", LOGIN_COMMAND_POWEROFF},     SKeyword<eLoginCommand>{"session", LOGIN_COMMAND_SESSION},
    SKeyword<eLoginCommand>{"s", LOGIN_COMMAND_SESSION},       SKeyword<eLoginCommand>{"user", LOGIN_COMMAND_USER},
    SKeyword<eLoginCommand>{"u", LOGIN_COMMAND_USER},          SKeyword<eLoginCommand>{"login", LOGIN_COMMAND_LOGIN},
    SKeyword<eLoginCommand>{"l", LOGIN_COMMAND_LOGIN},         SKeyword<eLoginCommand>{"cancel", LOGIN_COMMAND_CANCEL},
    SKeyword<eLoginCommand>{"c", LOGIN_COMMAND_CANCEL},        SKeyword<eLoginCommand>{"help", LOGIN_COMMAND_HELP},
    SKeyword<eLoginCommand>{"h", LOGIN_COMMAND_HELP},          SKeyword<eLoginCommand>{"?", LOGIN_COMMAND_HELP},
    SKeyword<eLoginCommand>{"q", LOGIN_COMMAND_QUIT},          SKeyword<eLoginCommand>{"quit", LOGIN_COMMAND_QUIT},
    SKeyword<eLoginCommand>{"exit", LOGIN_COMMAND_QUIT},
};

constexpr std::array WIZARD_KEYWORDS = {
    SKeyword<eWizardCommand>{"start", WIZARD_COMMAND_START},      SKeyword<eWizardCommand>{"run", WIZARD_COMMAND_START},
    SKeyword<eWizardCommand>{"next", WIZARD_COMMAND_NEXT},        SKeyword<eWizardCommand>{"n", WIZARD_COMMAND_NEXT},
    SKeyword<eWizardCommand>{"skip", WIZARD_COMMAND_SKIP},        SKeyword<eWizardCommand>{"s", WIZARD_COMMAND_SKIP},
    SKeyword<eWizardCommand>{"cancel", WIZARD_COMMAND_CANCEL},    SKeyword<eWizardCommand>{"q", WIZARD_COMMAND_CANCEL},
    SKeyword<eWizardCommand>{"quit", WIZARD_COMMAND_CANCEL},      SKeyword<eWizardCommand>{"reboot", WIZARD_COMMAND_REBOOT},
    SKeyword<eWizardCommand>{"poweroff", WIZARD_COMMAND_POWEROFF}, SKeyword<eWizardCommand>{"shutdown", WIZARD_COMMAND_POWEROFF},
    SKeyword<eWizardCommand>{"help", WIZARD_COMMAND_HELP},        SKeyword<eWizardCommand>{"h", WIZARD_COMMAND_HELP},
    SKeyword<eWizardCommand>{"submit", WIZARD_COMMAND_SUBMIT},    SKeyword<eWizardCommand>{"create", WIZARD_COMMAND_SUBMIT},
    SKeyword<eWizardCommand>{"install", WIZARD_COMMAND_SUBMIT},   SKeyword<eWizardCommand>{"update", WIZARD_COMMAND_SUBMIT},
    SKeyword<eWizardCommand>{"finish", WIZARD_COMMAND_FINISH},    SKeyword<eWizardCommand>{"done", WIZARD_COMMAND_FINISH},
    SKeyword<eWizardCommand>{"login", WIZARD_COMMAND_FINISH},
};

// keyword and the rest of the line, both trimmed
static std::pair<std::string, std::string> splitKeyword(std::string_view input) {
    const auto TRIMMED = trim(std::string{input});
    const auto SPACE   = TRIMMED.find_first_of(" \t");

    if (SPACE == std::string::npos)
        return {TRIMMED, ""};

    return {TRIMMED.substr(0, SPACE), trim(TRIMMED.substr(SPACE + 1))};
}

template <typename T, size_t N>
static std::optional<T> lookup(const std::array<SKeyword<T>, N>& table, const std::string& keyword) {
    const auto LOWER = Text::lower(keyword);
    for (const auto& k : table) {
        if (LOWER == k.word)
            return k.value;
    }
    return std::nullopt;
}

std::expected<SLoginCommand, std::string> Command::parseLogin(std::string_view input) {
    const auto [keyword, arg] = splitKeyword(input);

    if (keyword.empty())
        return std::unexpected("Unknown command: empty command");

    const auto CMD = lookup(LOGIN_KEYWORDS, keyword);
    if (!CMD)
        return std::unexpected(std::format("Unknown command: {}", keyword));

    SLoginCommand result{.command = *CMD};
    if ((*CMD == LOGIN_COMMAND_SESSION || *CMD == LOGIN_COMMAND_USER) && !arg.empty())
        result.arg = arg;

    return result;
}

std::expected<eWizardCommand, std::string> Command::parseWizard(std::string_view input) {
    const auto [keyword, arg] = splitKeyword(input);

    if (keyword.empty())
        return std::unexpected("Unknown command: empty command");

    const auto CMD = lookup(WIZARD_KEYWORDS, keyword);
    if (!CMD)
        return std::unexpected(std::format("Unknown command: {}", Text::lower(keyword)));

    return *CMD;
}
