#pragma once

#include <string>
#include <string_view>
#include <vector>

// The command lines the live service runs.
namespace SystemOps {
    std::vector<std::string> createUserCommand(const std::string& username, const std::vector<std::string>& groups, const std::string& shell);
    std::vector<std::string> setLocaleCommand(const std::string& locale);
    std::vector<std::string> setKeymapCommand(const std::string& keymap);
    std::vector<std::string> setTimezoneCommand(const std::string& timezone);
    std::vector<std::string> networkProbeCommand();

    // the `su -l <user> -c` payload, sudo reads its password from stdin
    std::string              userShellCommand(const std::vector<std::string>& cmd, bool sudo);

    // drops lines that belong to sudo's password prompt
    std::string              filterSudoNoise(std::string_view output);

    // greetd config with the [initial_session] table removed
    std::string              stripInitialSession(std::string_view config);

    // non-empty lines of a command's output
    std::vector<std::string> lines(std::string_view output);
}
