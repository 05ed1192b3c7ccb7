#include "zuuid/core/config_manager.hpp"
#include "zuuid/utils/config_validator.hpp"
#include "zuuid/utils/yaml_config.hpp"
#include "test_support.hpp"

#include <string>

using zuuid::core::ApplicationConfig;
using zuuid::core::ConfigError;
using zuuid::core::ConfigManager;
using zuuid::core::FormatStyle;
using zuuid::core::LanguageSetting;
using zuuid::core::UuidVersion;
using zuuid::utils::ConfigValidator;
using zuuid::utils::YamlConfigHelper;
using zuuid::test::TempDir;
using zuuid::test::fail;
using zuuid::test::make_environment;

namespace {

bool is_default(const ApplicationConfig& config) {
    const ApplicationConfig defaults;
    return config.log_level == defaults.log_level && !config.log_file &&
           config.uuid_version == defaults.uuid_version && config.uppercase == defaults.uppercase &&
           config.format == defaults.format && config.count == defaults.count &&
           config.language == defaults.language;
}

int test_default_config_path() {
    const auto xdg = ConfigManager::default_config_path(
        make_environment({{"XDG_CONFIG_HOME", "/xdg"}, {"HOME", "/home/me"}}));
    if (xdg != std::filesystem::path("/xdg/zuuid/config.yaml")) return fail("path_xdg");

    const auto home = ConfigManager::default_config_path(make_environment({{"HOME", "/home/me"}}));
    if (home != std::filesystem::path("/home/me/.config/zuuid/config.yaml")) return fail("path_home");

    const auto empty_xdg = ConfigManager::default_config_path(
        make_environment({{"XDG_CONFIG_HOME", ""}, {"HOME", "/home/me"}}));
    if (empty_xdg != home) return fail("path_empty_xdg");

    if (!ConfigManager::default_config_path(make_environment({})).empty()) return fail("path_none");
    if (!ConfigManager::default_config_path(zuuid::platform::EnvironmentLookup{}).empty()) {
        return fail("path_null_env");
    }
    return 0;
}

int test_yaml_loading() {
    TempDir dir("yaml");

    const auto missing = YamlConfigHelper::load_from_file(dir.path() / "absent.yaml");
    if (missing || missing.error() != ConfigError::FileNotFound) return fail("yaml_missing");

    // A directory is not a config file
    const auto directory = YamlConfigHelper::load_from_file(dir.path());
    if (directory || directory.error() != ConfigError::FileNotFound) return fail("yaml_directory");

    const auto full = YamlConfigHelper::load_from_file(dir.write("full.yaml",
        "log_level: debug\n"
        "log_file: /tmp/zuuid.log\n"
        "uuid_version: v7\n"
        "uppercase: true\n"
        "format: simple\n"
        "count: 3\n"
        "language: zh\n"));
    if (!full) return fail("yaml_full_load");
    if (full->log_level != zuuid::utils::LogLevel::Debug) return fail("yaml_log_level");
    if (full->log_file != std::filesystem::path("/tmp/zuuid.log")) return fail("yaml_log_file");
    if (full->uuid_version != UuidVersion::V7) return fail("yaml_version");
    if (!full->uppercase) return fail("yaml_uppercase");
    if (full->format != FormatStyle::Simple) return fail("yaml_format");
    if (full->count != 3) return fail("yaml_count");
    if (full->language != LanguageSetting::Chinese) return fail("yaml_language");

    const auto numeric = YamlConfigHelper::load_from_file(dir.write("numeric.yaml", "uuid_version: 7\n"));
    if (!numeric || numeric->uuid_version != UuidVersion::V7) return fail("yaml_numeric_version");

    const auto partial = YamlConfigHelper::load_from_file(dir.write("partial.yaml", "count: 2\n"));
    if (!partial || partial->count != 2 || partial->format != FormatStyle::Full) {
        return fail("yaml_partial");
    }

    const auto empty = YamlConfigHelper::load_from_file(dir.write("empty.yaml", ""));
    if (!empty || !is_default(*empty)) return fail("yaml_empty");
    return 0;
}

int test_yaml_rejects_bad_input() {
    TempDir dir("yaml_bad");
    const std::pair<const char*, const char*> cases[] = {
        {"broken.yaml", "count: [1, 2\n"},
        {"list.yaml", "- count\n- 2\n"},
        {"format.yaml", "format: fancy\n"},
        {"uppercase.yaml", "uppercase: maybe\n"},
        {"version.yaml", "uuid_version: 5\n"},
        {"language.yaml", "language: fr\n"},
        {"level.yaml", "log_level: loud\n"},
        {"count.yaml", "count: many\n"},
    };
    for (const auto& [name, content] : cases) {
        const auto result = YamlConfigHelper::load_from_file(dir.write(name, content));
        if (result || result.error() != ConfigError::InvalidFormat) return fail(name);
    }
    return 0;
}

int test_validator() {
    ApplicationConfig config;
    if (!ConfigValidator::validate_application_config(config).is_valid) return fail("validator_defaults");

    config.count = 0;
    auto result = ConfigValidator::validate_application_config(config);
    if (result.is_valid || result.errors.size() != 1 ||
        result.errors.front().first != zuuid::utils::ValidationError::InvalidCount) {
        return fail("validator_zero_count");
    }

    config.count = -4;
    if (ConfigValidator::validate_application_config(config).is_valid) return fail("validator_negative");

    config.count = ConfigValidator::kLargeCount + 1;
    result = ConfigValidator::validate_application_config(config);
    if (!result.is_valid || result.warnings.size() != 1) return fail("validator_large_count");

    TempDir dir("validator");
    config.count = 1;
    config.log_file = dir.path();
    result = ConfigValidator::validate_application_config(config);
    if (result.is_valid || result.errors.front().first != zuuid::utils::ValidationError::InvalidLogFile) {
        return fail("validator_log_dir");
    }
    if (result.get_error_summary().find("directory") == std::string::npos) return fail("validator_summary");
    return 0;
}

int test_manager() {
    TempDir dir("manager");
    const auto env = make_environment({{"XDG_CONFIG_HOME", dir.path().string()}});

    // Explicit file that does not exist is an error
    {
        ConfigManager manager(dir.path() / "missing.yaml", env);
        const auto loaded = manager.load();
        if (loaded || loaded.error() != ConfigError::FileNotFound) return fail("manager_explicit_missing");
        if (!is_default(manager.get())) return fail("manager_explicit_missing_defaults");
    }

    // Missing default file is silently skipped
    {
        ConfigManager manager(std::nullopt, env);
        if (!manager.load()) return fail("manager_default_missing");
        if (manager.path() != dir.path() / "zuuid" / "config.yaml") return fail("manager_default_path");
        if (!is_default(manager.get())) return fail("manager_default_missing_defaults");
    }

    // A broken default file only costs a warning
    dir.write("zuuid/config.yaml", "format: fancy\n");
    {
        ConfigManager manager(std::nullopt, env);
        if (!manager.load()) return fail("manager_default_invalid");
        if (!is_default(manager.get())) return fail("manager_default_invalid_defaults");
    }

    // The same content named explicitly is an error
    {
        ConfigManager manager(dir.path() / "zuuid" / "config.yaml", env);
        const auto loaded = manager.load();
        if (loaded || loaded.error() != ConfigError::InvalidFormat) return fail("manager_explicit_invalid");
    }

    {
        ConfigManager manager(dir.write("zero.yaml", "count: 0\n"), env);
        const auto loaded = manager.load();
        if (loaded || loaded.error() != ConfigError::ValidationError) return fail("manager_validation");
    }

    dir.write("zuuid/config.yaml", "uuid_version: 7\nformat: simple\ncount: 4\n");
    {
        ConfigManager manager(std::nullopt, env);
        if (!manager.load()) return fail("manager_default_valid");
        const auto& config = manager.get();
        if (config.uuid_version != UuidVersion::V7 || config.format != FormatStyle::Simple ||
            config.count != 4) {
            return fail("manager_default_values");
        }
    }

    // No location at all
    {
        ConfigManager manager(std::nullopt, make_environment({}));
        if (!manager.load() || !manager.path().empty()) return fail("manager_no_location");
    }
    return 0;
}

} // namespace

int main() {
    int failures = 0;
    failures += test_default_config_path();
    failures += test_yaml_loading();
    failures += test_yaml_rejects_bad_input();
    failures += test_validator();
    failures += test_manager();

    if (failures != 0) {
        return 1;
    }
    std::printf("config_test: OK\n");
    return 0;
}
