#pragma once

#include <expected>
#include <string>

#include "../helpers/Memory.hpp"

class IPowerControl {
  public:
    virtual ~IPowerControl() = default;

    virtual std::expected<void, std::string> reboot()   = 0;
    virtual std::expected<void, std::string> poweroff() = 0;
};

// systemctl reboot / poweroff
class CSystemdPower : public IPowerControl {
  public:
    std::expected<void, std::string> reboot() override;
    std::expected<void, std::string> poweroff() override;
};

// dry runs: logs and does nothing
class CNoopPower : public IPowerControl {
  public:
    std::expected<void, std::string> reboot() override;
    std::expected<void, std::string> poweroff() override;
};

UP<IPowerControl> makePowerControl(bool dryrun);
