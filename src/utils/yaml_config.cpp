#include "zuuid/utils/yaml_config.hpp"
#include "zuuid/utils/logger.hpp"
#include <stdexcept>

namespace zuuid {
namespace utils {

std::expected<core::ApplicationConfig, core::ConfigError>
YamlConfigHelper::load_from_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        ZUUID_LOG_DEBUG("YamlConfig", "File not found: " + path.string());
        return std::unexpected(core::ConfigError::FileNotFound);
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        if (!node.IsDefined() || node.IsNull()) {
            // Empty file
            return core::ApplicationConfig{};
        }
        if (!node.IsMap()) {
            ZUUID_LOG_ERROR("YamlConfig", "Top level of " + path.string() + " is not a mapping");
            return std::unexpected(core::ConfigError::InvalidFormat);
        }
        return from_yaml(node);
    } catch (const std::exception& e) {
        ZUUID_LOG_ERROR("YamlConfig", "Parse error: " + std::string(e.what()));
        return std::unexpected(core::ConfigError::InvalidFormat);
    }
}

core::ApplicationConfig YamlConfigHelper::from_yaml(const YAML::Node& node) {
    core::ApplicationConfig config;

    if (node["log_level"]) {
        config.log_level = parse_log_level(node["log_level"]);
    }
    if (node["log_file"]) {
        const auto log_file = node["log_file"].as<std::string>();
        if (!log_file.empty()) {
            config.log_file = std::filesystem::path(log_file);
        }
    }

    if (node["uuid_version"]) {
        config.uuid_version = parse_uuid_version(node["uuid_version"]);
    }
    if (node["uppercase"]) {
        config.uppercase = node["uppercase"].as<bool>();
    }
    if (node["format"]) {
        config.format = parse_format(node["format"]);
    }
    if (node["count"]) {
        config.count = node["count"].as<std::int64_t>();
    }

    if (node["language"]) {
        config.language = parse_language(node["language"]);
    }

    return config;
}

utils::LogLevel YamlConfigHelper::parse_log_level(const YAML::Node& node) {
    const auto text = node.as<std::string>();
    if (auto level = log_level_from_string(text)) {
        return *level;
    }
    throw std::invalid_argument("unknown log_level '" + text + "'");
}

core::UuidVersion YamlConfigHelper::parse_uuid_version(const YAML::Node& node) {
    // `uuid_version: 7` arrives as a scalar either way
    const auto text = node.as<std::string>();
    if (auto version = core::parse_uuid_version(text)) {
        return *version;
    }
    throw std::invalid_argument("unknown uuid_version '" + text + "'");
}

core::FormatStyle YamlConfigHelper::parse_format(const YAML::Node& node) {
    const auto text = node.as<std::string>();
    if (auto style = core::parse_format_style(text)) {
        return *style;
    }
    throw std::invalid_argument("unknown format '" + text + "'");
}

core::LanguageSetting YamlConfigHelper::parse_language(const YAML::Node& node) {
    const auto text = node.as<std::string>();
    if (auto setting = core::parse_language_setting(text)) {
        return *setting;
    }
    throw std::invalid_argument("unknown language '" + text + "'");
}

} // namespace utils
} // namespace zuuid
