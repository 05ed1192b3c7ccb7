#pragma once

#include "zuuid/cli/argument_parser.hpp"
#include "zuuid/core/message_catalog.hpp"
#include "zuuid/core/models.hpp"
#include "zuuid/platform/system_environment.hpp"
#include "zuuid/services/uuid_generator.hpp"
#include <exception>
#include <iosfwd>
#include <memory>
#include <span>
#include <string>

namespace zuuid {
namespace core {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitConfigError = 1;
inline constexpr int kExitUsageError = 2;
inline constexpr int kExitFatalError = 1;

// One invocation of the tool. Every outside dependency is injected so the
// whole flow runs in-process under test.
class Application {
public:
    Application(platform::EnvironmentLookup env,
                std::unique_ptr<services::UuidGenerator> generator,
                std::ostream& out,
                std::ostream& err,
                bool use_colors = false);

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // raw_args excludes the program name. Returns the process exit code.
    int run(std::span<const std::string> raw_args);

private:
    void report_usage_error(const cli::CliError& error, const MessageCatalog& messages);
    void print_conflict_warning(const FormatPreference& format, const MessageCatalog& messages);
    void print_help(const MessageCatalog& messages);

    platform::EnvironmentLookup m_env;
    std::unique_ptr<services::UuidGenerator> m_generator;
    std::ostream& m_out;
    std::ostream& m_err;
    bool m_use_colors;
};

// Logs an exception that escaped run() and returns the exit code for it.
// The record goes through the installed logger only, once.
int report_fatal_error(const std::exception& error);

GenerationRequest build_generation_request(const cli::CliOptions& options,
                                           const ApplicationConfig& config,
                                           const FormatPreference& format);

} // namespace core
} // namespace zuuid
