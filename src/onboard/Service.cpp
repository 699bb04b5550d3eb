#include "Service.hpp"
#include "SystemOps.hpp"
#include "../helpers/Exec.hpp"
#include "../helpers/Logger.hpp"
#include "../helpers/Text.hpp"

#include <hyprutils/os/File.hpp>
#include <hyprutils/os/Process.hpp>
#include <hyprutils/string/String.hpp>

#include <openssl/crypto.h>

#include <format>
#include <fstream>

using namespace Hyprutils::OS;

// a query. Falls back to `fallback` when the tool isn't there or fails.
static std::vector<std::string> queryList(const std::vector<std::string>& argv, std::vector<std::string> fallback) {
    CProcess proc(argv.front(), {argv.begin() + 1, argv.end()});

    if (!proc.runSync() || proc.exitCode() != 0) {
        g_logger->log(LOG_WARN, "service: {} failed, using fallback", Text::join(argv, " "));
        return fallback;
    }

    auto out = SystemOps::lines(proc.stdOut());
    if (out.empty())
        return fallback;

    return out;
}

static std::expected<void, std::string> runChecked(const std::vector<std::string>& argv) {
    g_logger->log(LOG_DEBUG, "service: running {}", Text::join(argv, " "));

    const auto RESULT = Exec::run(argv);
    if (!RESULT)
        return std::unexpected(RESULT.error());

    if (RESULT->exitCode != 0) {
        const auto DETAIL = Hyprutils::String::trim(RESULT->err.empty() ? RESULT->out : RESULT->err);
        return std::unexpected(std::format("{} failed with code {}{}{}", argv.front(), RESULT->exitCode, DETAIL.empty() ? "" : ": ", DETAIL));
    }

    return {};
}

//
bool CLiveService::checkNetwork() {
    const auto ARGV = SystemOps::networkProbeCommand();
    CProcess   proc(ARGV.front(), {ARGV.begin() + 1, ARGV.end()});
    return proc.runSync() && proc.exitCode() == 0;
}

std::vector<std::string> CLiveService::listLocales() {
    return queryList({"localectl", "list-locales"}, {"en_US.UTF-8"});
}

std::vector<std::string> CLiveService::listKeymaps() {
    return queryList({"localectl", "list-keymaps"}, {"us"});
}

std::vector<std::string> CLiveService::listTimezones() {
    return queryList({"timedatectl", "list-timezones"}, {"UTC"});
}

std::expected<void, std::string> CLiveService::createUser(const std::string& username, const std::string& password, const std::vector<std::string>& groups,
                                                          const std::string& shell) {
    g_logger->log(LOG_DEBUG, "service: creating user {}", username);

    if (const auto RET = runChecked(SystemOps::createUserCommand(username, groups, shell)); !RET)
        return std::unexpected(std::format("User creation failed: {}", RET.error()));

    std::string input  = std::format("{}:{}\n", username, password);
    const auto  RESULT = Exec::run({"chpasswd"}, input);
    OPENSSL_cleanse(input.data(), input.size());

    if (!RESULT)
        return std::unexpected(std::format("User creation failed: {}", RESULT.error()));

    if (RESULT->exitCode != 0)
        return std::unexpected(std::format("User creation failed: chpasswd failed with code {}", RESULT->exitCode));

    return {};
}

std::expected<void, std::string> CLiveService::setLocale(const std::string& locale) {
    return runChecked(SystemOps::setLocaleCommand(locale));
}

std::expected<void, std::string> CLiveService::setKeymap(const std::string& keymap) {
    return runChecked(SystemOps::setKeymapCommand(keymap));
}

std::expected<void, std::string> CLiveService::setTimezone(const std::string& timezone) {
    return runChecked(SystemOps::setTimezoneCommand(timezone));
}

std::expected<std::string, std::string> CLiveService::runAsUser(const std::string& username, const std::vector<std::string>& cmd) {
    if (cmd.empty())
        return std::unexpected("Empty command");

    g_logger->log(LOG_DEBUG, "service: running as {}: {}", username, Text::join(cmd, " "));

    const auto RESULT = Exec::run({"su", "-l", username, "-c", SystemOps::userShellCommand(cmd, false)});
    if (!RESULT)
        return std::unexpected(RESULT.error());

    if (RESULT->exitCode != 0)
        return std::unexpected(std::format("Command failed: {}", Hyprutils::String::trim(RESULT->err.empty() ? RESULT->out : RESULT->err)));

    return RESULT->out;
}

std::expected<std::string, std::string> CLiveService::runAsUserWithSudo(const std::string& username, const std::vector<std::string>& cmd, const std::string& password) {
    if (cmd.empty())
        return std::unexpected("Empty command");

    g_logger->log(LOG_DEBUG, "service: running as {} with sudo: {}", username, Text::join(cmd, " "));

    std::string input  = password + "\n";
    const auto  RESULT = Exec::run({"su", "-l", username, "-c", SystemOps::userShellCommand(cmd, true)}, input);
    OPENSSL_cleanse(input.data(), input.size());

    if (!RESULT)
        return std::unexpected(RESULT.error());

    if (RESULT->exitCode != 0) {
        const auto FILTERED = SystemOps::filterSudoNoise(RESULT->err);
        return std::unexpected(std::format("Command failed: {}", FILTERED.empty() ? Hyprutils::String::trim(RESULT->out) : FILTERED));
    }

    return SystemOps::filterSudoNoise(RESULT->out);
}

std::expected<void, std::string> CLiveService::removeInitialSession(const std::string& greetdConfig) {
    const auto CONTENT = Hyprutils::File::readFileAsString(greetdConfig);
    if (!CONTENT)
        return std::unexpected(std::format("failed to read {}: {}", greetdConfig, CONTENT.error()));

    std::ofstream ofs(greetdConfig, std::ios::trunc);
    if (!ofs.good())
        return std::unexpected(std::format("failed to open {} for writing", greetdConfig));

    ofs << SystemOps::stripInitialSession(*CONTENT);
    ofs.close();

    if (ofs.fail())
        return std::unexpected(std::format("failed to write {}", greetdConfig));

    g_logger->log(LOG_DEBUG, "service: removed initial_session from {}", greetdConfig);
    return {};
}

//
bool CDryrunService::checkNetwork() {
    return true;
}

std::vector<std::string> CDryrunService::listLocales() {
    return {"en_US.UTF-8", "en_GB.UTF-8", "de_DE.UTF-8", "fr_FR.UTF-8", "es_ES.UTF-8", "it_IT.UTF-8", "pt_BR.UTF-8", "ja_JP.UTF-8", "zh_CN.UTF-8", "ko_KR.UTF-8"};
}

std::vector<std::string> CDryrunService::listKeymaps() {
    return {"us", "uk", "de", "fr", "es", "it", "pt", "ru", "jp", "cn", "dvorak", "colemak"};
}

std::vector<std::string> CDryrunService::listTimezones() {
    return {"UTC",           "America/New_York", "America/Chicago", "America/Denver", "America/Los_Angeles", "America/Sao_Paulo", "Europe/London",
            "Europe/Paris",  "Europe/Berlin",    "Asia/Tokyo",      "Asia/Shanghai",  "Asia/Kolkata",        "Australia/Sydney"};
}

std::expected<void, std::string> CDryrunService::createUser(const std::string& username, const std::string&, const std::vector<std::string>& groups, const std::string& shell) {
    g_logger->log(LOG_DEBUG, "dryrun: would run {}", Text::join(SystemOps::createUserCommand(username, groups, shell), " "));
    return {};
}

std::expected<void, std::string> CDryrunService::setLocale(const std::string& locale) {
    g_logger->log(LOG_DEBUG, "dryrun: would set locale {}", locale);
    return {};
}

std::expected<void, std::string> CDryrunService::setKeymap(const std::string& keymap) {
    g_logger->log(LOG_DEBUG, "dryrun: would set keymap {}", keymap);
    return {};
}

std::expected<void, std::string> CDryrunService::setTimezone(const std::string& timezone) {
    g_logger->log(LOG_DEBUG, "dryrun: would set timezone {}", timezone);
    return {};
}

std::expected<std::string, std::string> CDryrunService::runAsUser(const std::string& username, const std::vector<std::string>& cmd) {
    g_logger->log(LOG_DEBUG, "dryrun: would run as {}: {}", username, Text::join(cmd, " "));
    return std::string{};
}

std::expected<std::string, std::string> CDryrunService::runAsUserWithSudo(const std::string& username, const std::vector<std::string>& cmd, const std::string&) {
    g_logger->log(LOG_DEBUG, "dryrun: would run as {} with sudo: {}", username, Text::join(cmd, " "));
    return std::string{};
}

std::expected<void, std::string> CDryrunService::removeInitialSession(const std::string& greetdConfig) {
    g_logger->log(LOG_DEBUG, "dryrun: would edit {}", greetdConfig);
    return {};
}

UP<IOnboardService> makeOnboardService(bool dryrun) {
    if (dryrun)
        return makeUnique<CDryrunService>();
    return makeUnique<CLiveService>();
}
