#include "Power.hpp"
#include "../helpers/Logger.hpp"

#include <hyprutils/os/Process.hpp>

#include <format>

using namespace Hyprutils::OS;

static std::expected<void, std::string> systemctl(const std::string& verb) {
    g_logger->log(LOG_DEBUG, "power: systemctl {}", verb);

    CProcess proc("systemctl", {verb});
    if (!proc.runSync())
        return std::unexpected(std::format("Failed to run systemctl {}", verb));

    if (proc.exitCode() != 0) {
        g_logger->log(LOG_ERR, "power: systemctl {} exited with {}: {}", verb, proc.exitCode(), proc.stdErr());
        return std::unexpected(std::format("systemctl {} failed: {}", verb, proc.stdErr().empty() ? std::to_string(proc.exitCode()) : proc.stdErr()));
    }

    return {};
}

std::expected<void, std::string> CSystemdPower::reboot() {
    return systemctl("reboot");
}

std::expected<void, std::string> CSystemdPower::poweroff() {
    return systemctl("poweroff");
}

std::expected<void, std::string> CNoopPower::reboot() {
    g_logger->log(LOG_DEBUG, "power: dry run, not rebooting");
    return {};
}

std::expected<void, std::string> CNoopPower::poweroff() {
    g_logger->log(LOG_DEBUG, "power: dry run, not powering off");
    return {};
}

UP<IPowerControl> makePowerControl(bool dryrun) {
    if (dryrun)
        return makeUnique<CNoopPower>();
    return makeUnique<CSystemdPower>();
}
