#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

enum eLoginCommand : uint8_t {
    LOGIN_COMMAND_REBOOT = 0,
    LOGIN_COMMAND_POWEROFF,
    LOGIN_COMMAND_SESSION,
    LOGIN_COMMAND_USER,
    LOGIN_COMMAND_LOGIN,
    LOGIN_COMMAND_CANCEL,
    LOGIN_COMMAND_HELP,
    LOGIN_COMMAND_QUIT,
};

struct SLoginCommand {
    eLoginCommand              command = LOGIN_COMMAND_HELP;
    std::optional<std::string> arg;

    bool                       operator==(const SLoginCommand&) const = default;
};

enum eWizardCommand : uint8_t {
    WIZARD_COMMAND_START = 0,
    WIZARD_COMMAND_NEXT,
    WIZARD_COMMAND_SKIP,
    WIZARD_COMMAND_CANCEL,
    WIZARD_COMMAND_REBOOT,
    WIZARD_COMMAND_POWEROFF,
    WIZARD_COMMAND_HELP,
    WIZARD_COMMAND_SUBMIT,
    WIZARD_COMMAND_FINISH,
};

namespace Command {
    // `keyword [argument]`, keyword is case-insensitive, the argument is kept verbatim
    std::expected<SLoginCommand, std::string>  parseLogin(std::string_view input);

    // the wizard takes no arguments, trailing words are ignored
    std::expected<eWizardCommand, std::string> parseWizard(std::string_view input);
}
