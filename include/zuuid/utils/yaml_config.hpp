#pragma once

#include "zuuid/core/models.hpp"
#include <yaml-cpp/yaml.h>
#include <expected>
#include <filesystem>

namespace zuuid {
namespace utils {

class YamlConfigHelper {
public:
    // Load configuration from YAML file
    static std::expected<core::ApplicationConfig, core::ConfigError>
    load_from_file(const std::filesystem::path& path);

    // Keys missing from the node keep their defaults. Throws YAML::Exception
    // on wrongly typed values and std::invalid_argument on unknown names.
    static core::ApplicationConfig from_yaml(const YAML::Node& node);

private:
    static utils::LogLevel parse_log_level(const YAML::Node& node);
    static core::UuidVersion parse_uuid_version(const YAML::Node& node);
    static core::FormatStyle parse_format(const YAML::Node& node);
    static core::LanguageSetting parse_language(const YAML::Node& node);
};

} // namespace utils
} // namespace zuuid
