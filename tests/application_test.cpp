#include "zuuid/core/application.hpp"
#include "test_support.hpp"
#include "version.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using zuuid::core::Application;
using zuuid::core::UuidVersion;
using zuuid::test::TempDir;
using zuuid::test::fail;
using zuuid::test::make_environment;

namespace {

using Args = std::vector<std::string>;

constexpr const char* kFixedUuid = "550e8400-e29b-41d4-a716-446655440000";

// Hands out the same canonical text and remembers what was asked for.
class FixedUuidGenerator : public zuuid::services::UuidGenerator {
public:
    explicit FixedUuidGenerator(std::vector<UuidVersion>& requested) : m_requested(requested) {}

    std::string generate(UuidVersion version) override {
        m_requested.push_back(version);
        return kFixedUuid;
    }

private:
    std::vector<UuidVersion>& m_requested;
};

struct RunResult {
    int exit_code = 0;
    std::string out;
    std::string err;
    std::vector<UuidVersion> requested;
};

RunResult run_app(const Args& args,
                  std::map<std::string, std::string> env = {},
                  bool use_colors = false) {
    RunResult result;
    std::ostringstream out;
    std::ostringstream err;
    Application app(make_environment(std::move(env)),
                    std::make_unique<FixedUuidGenerator>(result.requested),
                    out, err, use_colors);
    result.exit_code = app.run(args);
    result.out = out.str();
    result.err = err.str();
    return result;
}

std::string repeat_line(const std::string& line, int times) {
    std::string text;
    for (int i = 0; i < times; ++i) {
        text += line + "\n";
    }
    return text;
}

int test_default_run() {
    const auto result = run_app({});
    if (result.exit_code != zuuid::core::kExitSuccess) return fail("default_exit");
    if (result.out != std::string(kFixedUuid) + "\n") return fail("default_out");
    if (!result.err.empty()) return fail("default_err");
    if (result.requested != std::vector<UuidVersion>{UuidVersion::V4}) return fail("default_version");
    return 0;
}

int test_options_shape_output() {
    const auto result = run_app({"-n", "5", "-s", "-U"});
    if (result.exit_code != 0) return fail("shape_exit");
    if (result.out != repeat_line("550E8400E29B41D4A716446655440000", 5)) return fail("shape_out");
    if (!result.err.empty()) return fail("shape_err");

    const auto v7 = run_app({"-V", "7", "-n", "2"});
    if (v7.requested != std::vector<UuidVersion>{UuidVersion::V7, UuidVersion::V7}) {
        return fail("v7_requested");
    }
    return 0;
}

int test_conflict_warning() {
    const auto full_first = run_app({"-fs"});
    if (full_first.exit_code != 0) return fail("conflict_exit");
    if (full_first.out != std::string(kFixedUuid) + "\n") return fail("conflict_full_out");
    if (full_first.err !=
        "Warning: Both -f (full) and -s (simple) format flags specified.\n"
        "Using -f (full format) based on argument order.\n") {
        return fail("conflict_full_err");
    }

    const auto simple_first = run_app({"-s", "-n", "2", "--full"});
    if (simple_first.out != repeat_line("550e8400e29b41d4a716446655440000", 2)) {
        return fail("conflict_simple_out");
    }
    if (simple_first.err.find("Using -s (simple format) based on argument order.") == std::string::npos) {
        return fail("conflict_simple_err");
    }

    const auto chinese = run_app({"-sf"}, {{"LANG", "zh_CN.UTF-8"}});
    if (chinese.out != "550e8400e29b41d4a716446655440000\n") return fail("conflict_chinese_out");
    if (chinese.err !=
        "警告：同时指定了 -f（完整）和 -s（简单）格式标志。\n"
        "根据参数顺序使用 -s（简单格式）。\n") {
        return fail("conflict_chinese_err");
    }

    const auto colored = run_app({"-sf"}, {}, true);
    if (colored.err.find("\033[33mWarning: Both") == std::string::npos) return fail("conflict_color");
    if (colored.out.find('\033') != std::string::npos) return fail("conflict_color_out");
    return 0;
}

int test_usage_errors() {
    const auto zero = run_app({"-n", "0"});
    if (zero.exit_code != zuuid::core::kExitUsageError) return fail("usage_zero_exit");
    if (!zero.out.empty() || !zero.requested.empty()) return fail("usage_zero_out");
    if (zero.err.find("Invalid count: 0") != 0) return fail("usage_zero_err");
    if (zero.err.find("For more information, try '--help'.") == std::string::npos) {
        return fail("usage_hint");
    }

    const auto unknown = run_app({"--bogus"});
    if (unknown.exit_code != 2 || unknown.err.find("Unknown option: --bogus") != 0) {
        return fail("usage_unknown");
    }

    const auto chinese = run_app({"-V", "9"}, {{"LC_ALL", "zh_TW"}});
    if (chinese.exit_code != 2 || chinese.err.find("用法") == std::string::npos) {
        return fail("usage_chinese");
    }
    return 0;
}

int test_help_and_version() {
    const auto help = run_app({"-h"});
    if (help.exit_code != 0) return fail("help_exit");
    if (help.out.find("Usage: zuuid [OPTIONS]") == std::string::npos) return fail("help_out");
    if (!help.requested.empty()) return fail("help_generates");

    const auto chinese_help = run_app({"--help"}, {{"LANG", "zh_CN.UTF-8"}});
    if (chinese_help.out.find("用法") == std::string::npos) return fail("help_chinese");

    const auto version = run_app({"--version"});
    if (version.exit_code != 0) return fail("version_exit");
    if (version.out != std::string("zuuid ") + ZUUID_VERSION_STRING + "\n") return fail("version_out");
    return 0;
}

int test_config_file() {
    TempDir dir("application");
    const auto config = dir.write("config.yaml",
        "uuid_version: 7\n"
        "uppercase: true\n"
        "format: simple\n"
        "count: 2\n");

    const auto from_file = run_app({"--config", config.string()});
    if (from_file.exit_code != 0) return fail("config_exit");
    if (from_file.out != repeat_line("550E8400E29B41D4A716446655440000", 2)) return fail("config_out");
    if (from_file.requested != std::vector<UuidVersion>{UuidVersion::V7, UuidVersion::V7}) {
        return fail("config_version");
    }

    // Command line wins over the file
    const auto overridden = run_app({"--config", config.string(), "-f", "-l", "-n", "1", "-V", "4"});
    if (overridden.out != std::string(kFixedUuid) + "\n") return fail("config_override_out");
    if (overridden.requested != std::vector<UuidVersion>{UuidVersion::V4}) return fail("config_override_version");
    if (!overridden.err.empty()) return fail("config_override_err");

    // The default location is picked up from XDG_CONFIG_HOME
    dir.write("zuuid/config.yaml", "count: 3\nlanguage: zh\n");
    const auto implicit = run_app({"-fs"}, {{"XDG_CONFIG_HOME", dir.path().string()}});
    if (implicit.out != repeat_line(kFixedUuid, 3)) return fail("config_default_location");
    if (implicit.err.find("警告") != 0) return fail("config_language");

    const auto missing = run_app({"--config", (dir.path() / "absent.yaml").string()});
    if (missing.exit_code != zuuid::core::kExitConfigError) return fail("config_missing_exit");
    if (!missing.out.empty()) return fail("config_missing_out");
    if (missing.err.find("Failed to load configuration") == std::string::npos ||
        missing.err.find("file not found") == std::string::npos) {
        return fail("config_missing_err");
    }

    // Help still works with a broken config
    const auto help = run_app({"--config", (dir.path() / "absent.yaml").string(), "-h"});
    if (help.exit_code != 0 || help.out.empty()) return fail("config_missing_help");
    return 0;
}

int test_log_level() {
    const auto debug = run_app({"--log-level", "debug"});
    if (debug.exit_code != 0) return fail("log_debug_exit");
    if (debug.out != std::string(kFixedUuid) + "\n") return fail("log_debug_out");
    if (debug.err.find("[DEBUG]") == std::string::npos) return fail("log_debug_err");

    const auto quiet = run_app({"--log-level", "none", "-fs"});
    if (quiet.err.find("[DEBUG]") != std::string::npos) return fail("log_none");
    // The conflict warning is user-facing text, not a log record
    if (quiet.err.find("Warning: Both") == std::string::npos) return fail("log_none_warning");

    const auto invalid = run_app({"--log-level", "loud"});
    if (invalid.exit_code != 2 || invalid.err.find("Invalid log level: loud") != 0) {
        return fail("log_invalid");
    }
    return 0;
}

int test_system_generator() {
    std::ostringstream out;
    std::ostringstream err;
    Application app(make_environment({}), zuuid::services::create_uuid_generator(), out, err);
    const Args args{"-n", "5", "-s", "-V", "7"};
    if (app.run(args) != 0) return fail("system_exit");
    if (!err.str().empty()) return fail("system_err");

    std::istringstream lines(out.str());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        ++count;
        const bool hex_only = std::all_of(line.begin(), line.end(), [](char c) {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        });
        if (line.size() != 32 || !hex_only) return fail("system_line_shape");
        if (line[12] != '7') return fail("system_line_version");
    }
    if (count != 5) return fail("system_line_count");
    return 0;
}

int test_config_logging() {
    TempDir dir("application_log");
    const auto config = dir.write("config.yaml", "format: simple\nlanguage: zh\ncount: 2\n");

    const auto info = run_app({"--config", config.string(), "--log-level", "info", "-f"});
    if (info.exit_code != 0) return fail("config_info_exit");
    if (info.err.find("[INFO] [ConfigService] Loaded " + config.string()) == std::string::npos) {
        return fail("config_info_record");
    }
    if (info.err.find("format=simple") == std::string::npos ||
        info.err.find("language=zh") == std::string::npos ||
        info.err.find("count=2") == std::string::npos) {
        return fail("config_info_values");
    }

    // Not shown at the default level
    const auto quiet = run_app({"--config", config.string(), "-f"});
    if (quiet.err.find("[INFO]") != std::string::npos) return fail("config_info_hidden");

    const auto large = dir.write("large.yaml", "count: 2000000\n");
    const auto warned = run_app({"--config", large.string(), "-n", "1"});
    if (warned.exit_code != 0 || warned.out != std::string(kFixedUuid) + "\n") return fail("config_large_run");
    if (warned.err.find("[WARN] [ConfigService] count of 2000000") == std::string::npos) {
        return fail("config_large_warning");
    }
    return 0;
}

int test_fatal_error_reported_once() {
    std::ostringstream err;
    auto logger = std::make_unique<zuuid::utils::Logger>(zuuid::utils::LogLevel::Warning);
    logger->add_sink(std::make_unique<zuuid::utils::ConsoleSink>(err, false));
    zuuid::utils::LoggerManager::set_instance(std::move(logger));

    const int code = zuuid::core::report_fatal_error(std::runtime_error("disk on fire"));
    zuuid::utils::LoggerManager::set_instance(zuuid::utils::LoggerManager::create_default_logger());

    if (code != zuuid::core::kExitFatalError) return fail("fatal_exit");
    const auto text = err.str();
    const auto first = text.find("disk on fire");
    if (first == std::string::npos) return fail("fatal_reported");
    if (text.find("disk on fire", first + 1) != std::string::npos) return fail("fatal_reported_twice");
    if (text.find("[ERROR] [Main]") != 0) return fail("fatal_record");
    return 0;
}

} // namespace

int main() {
    int failures = 0;
    failures += test_default_run();
    failures += test_options_shape_output();
    failures += test_conflict_warning();
    failures += test_usage_errors();
    failures += test_help_and_version();
    failures += test_config_file();
    failures += test_log_level();
    failures += test_system_generator();
    failures += test_config_logging();
    failures += test_fatal_error_reported_once();

    if (failures != 0) {
        return 1;
    }
    std::printf("application_test: OK\n");
    return 0;
}
