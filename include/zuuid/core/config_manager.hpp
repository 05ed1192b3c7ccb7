#pragma once

#include "zuuid/core/models.hpp"
#include "zuuid/platform/system_environment.hpp"
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>

namespace zuuid {
namespace core {

// Read-only configuration source. A file named on the command line must
// load; the file at the default location is optional and a broken one only
// costs a warning.
class ConfigManager {
public:
    ConfigManager(std::optional<std::filesystem::path> explicit_path,
                  const platform::EnvironmentLookup& env);
    ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    std::expected<void, ConfigError> load();

    const ApplicationConfig& get() const;
    const std::filesystem::path& path() const;

    // $XDG_CONFIG_HOME/zuuid/config.yaml or ~/.config/zuuid/config.yaml;
    // empty when neither variable is set.
    static std::filesystem::path default_config_path(const platform::EnvironmentLookup& env);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace core
} // namespace zuuid
