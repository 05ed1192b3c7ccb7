#include "zuuid/core/config_manager.hpp"
#include "zuuid/utils/config_validator.hpp"
#include "zuuid/utils/logger.hpp"
#include "zuuid/utils/yaml_config.hpp"

namespace zuuid {
namespace core {

namespace {
    std::string describe(const ApplicationConfig& config) {
        return "log_level=" + utils::to_string(config.log_level) +
               " uuid_version=" + to_string(config.uuid_version) +
               " uppercase=" + (config.uppercase ? "true" : "false") +
               " format=" + to_string(config.format) +
               " count=" + std::to_string(config.count) +
               " language=" + to_string(config.language);
    }
}

class ConfigManager::Impl {
public:
    Impl(std::optional<std::filesystem::path> explicit_path, const platform::EnvironmentLookup& env)
        : m_required(explicit_path.has_value()),
          m_config_path(explicit_path ? std::move(*explicit_path) : default_config_path(env)) {
        ZUUID_LOG_DEBUG("ConfigService", "Config path: " +
            (m_config_path.empty() ? std::string("<none>") : m_config_path.string()));
    }

    std::expected<void, ConfigError> load() {
        m_config = ApplicationConfig{};

        if (m_config_path.empty()) {
            ZUUID_LOG_DEBUG("ConfigService", "No config location, using defaults");
            return {};
        }

        auto result = utils::YamlConfigHelper::load_from_file(m_config_path);
        if (!result) {
            return fail_or_default(result.error());
        }

        const auto validation = utils::ConfigValidator::validate_application_config(*result);
        if (!validation.warnings.empty()) {
            ZUUID_LOG_WARNING("ConfigService", validation.get_warning_summary());
        }
        if (!validation.is_valid) {
            ZUUID_LOG_ERROR("ConfigService", "Invalid configuration: " + validation.get_error_summary());
            return fail_or_default(ConfigError::ValidationError);
        }

        m_config = *result;
        ZUUID_LOG_INFO("ConfigService", "Loaded " + m_config_path.string() + ": " + describe(m_config));
        return {};
    }

    const ApplicationConfig& get() const {
        return m_config;
    }

    const std::filesystem::path& path() const {
        return m_config_path;
    }

private:
    std::expected<void, ConfigError> fail_or_default(ConfigError error) {
        if (m_required) {
            return std::unexpected(error);
        }

        if (error != ConfigError::FileNotFound) {
            ZUUID_LOG_WARNING("ConfigService", "Ignoring " + m_config_path.string() + " (" +
                to_string(error) + "), using defaults");
        }
        m_config = ApplicationConfig{};
        return {};
    }

    bool m_required;
    std::filesystem::path m_config_path;
    ApplicationConfig m_config;
};

ConfigManager::ConfigManager(std::optional<std::filesystem::path> explicit_path,
                             const platform::EnvironmentLookup& env)
    : m_impl(std::make_unique<Impl>(std::move(explicit_path), env)) {}

ConfigManager::~ConfigManager() = default;

std::expected<void, ConfigError> ConfigManager::load() {
    return m_impl->load();
}

const ApplicationConfig& ConfigManager::get() const {
    return m_impl->get();
}

const std::filesystem::path& ConfigManager::path() const {
    return m_impl->path();
}

std::filesystem::path ConfigManager::default_config_path(const platform::EnvironmentLookup& env) {
    if (!env) {
        return {};
    }

    std::filesystem::path config_dir;
    if (auto xdg_config = env("XDG_CONFIG_HOME"); xdg_config && !xdg_config->empty()) {
        config_dir = std::filesystem::path(*xdg_config) / "zuuid";
    } else if (auto home = env("HOME"); home && !home->empty()) {
        config_dir = std::filesystem::path(*home) / ".config" / "zuuid";
    } else {
        return {};
    }

    return config_dir / "config.yaml";
}

} // namespace core
} // namespace zuuid
