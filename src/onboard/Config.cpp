#include "Config.hpp"
#include "../helpers/Logger.hpp"

#include <hyprutils/os/File.hpp>

#include <glaze/glaze.hpp>

#include <filesystem>
#include <format>

bool SPackageConfig::defaultEnabled(bool categoryDefault) const {
    if (required)
        return true;
    return enabledByDefault.value_or(categoryDefault);
}

std::expected<SOnboardConfig, std::string> Config::parse(const std::string& json) {
    SOnboardConfig config;

    if (const auto ERR = glz::read<glz::opts{.error_on_unknown_keys = false}>(config, json); ERR)
        return std::unexpected(glz::format_error(ERR, json));

    return config;
}

std::expected<SOnboardConfig, std::string> Config::load(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        g_logger->log(LOG_DEBUG, "config: {} doesn't exist, using defaults", path);
        return SOnboardConfig{};
    }

    const auto CONTENT = Hyprutils::File::readFileAsString(path);
    if (!CONTENT)
        return std::unexpected(std::format("failed to read config {}: {}", path, CONTENT.error()));

    auto config = parse(*CONTENT);
    if (!config)
        return std::unexpected(std::format("malformed config {}: {}", path, config.error()));

    g_logger->log(LOG_DEBUG, "config: loaded {} with {} update categories", path, config->updates.size());

    return config;
}
