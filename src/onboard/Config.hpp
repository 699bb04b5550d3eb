#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

constexpr const char* DEFAULT_CONFIG_PATH = "/etc/vimgreet/onboard.json";

// member names are the json keys

struct SGeneralConfig {
    std::string title    = "System Setup";
    std::string subtitle = "Welcome to your new system";
    bool        dryrun   = false;
};

struct SNetworkConfig {
    bool                     enabled = true;
    std::string              program = "wifitui";
    std::vector<std::string> args;
    bool                     skipIfConnected = true;
};

struct SUserConfig {
    std::vector<std::string> groups            = {"wheel"};
    std::string              shell             = "/bin/bash";
    uint32_t                 minPasswordLength = 8;
};

struct SLocaleConfig {
    bool                     enabled       = true;
    std::string              defaultLocale = "en_US.UTF-8";
    std::vector<std::string> available;
};

struct SKeyboardConfig {
    bool                     enabled       = true;
    std::string              defaultLayout = "us";
    std::vector<std::string> available;
};

struct SPreferencesConfig {
    bool                     timezoneEnabled = true;
    std::string              defaultTimezone = "UTC";
    std::vector<std::string> available;
};

struct SCompletionConfig {
    std::string action               = "reboot";
    bool        removeInitialSession = true;
    std::string greetdConfig         = "/etc/greetd/config.toml";
};

struct SCommandConfig {
    std::string              name;
    std::vector<std::string> command;
    bool                     sudo = false;
};

struct SPackageConfig {
    std::string                 title;
    std::string                 description;
    std::optional<bool>         enabledByDefault;
    bool                        required = false;
    std::vector<SCommandConfig> commands;

    // required wins, then the package's own default, then the category's
    bool                        defaultEnabled(bool categoryDefault) const;
};

struct SUpdateCategory {
    std::string                 name;
    std::string                 description;
    bool                        enabledByDefault = false;
    std::vector<SPackageConfig> packages;
};

struct SOnboardConfig {
    SGeneralConfig               general;
    SNetworkConfig               network;
    SUserConfig                  user;
    SLocaleConfig                locale;
    SKeyboardConfig              keyboard;
    SPreferencesConfig           preferences;
    SCompletionConfig            completion;
    std::vector<SUpdateCategory> updates;
};

namespace Config {
    // a missing file gives the defaults, anything unreadable or malformed is an error
    std::expected<SOnboardConfig, std::string> load(const std::string& path);
    std::expected<SOnboardConfig, std::string> parse(const std::string& json);
}
