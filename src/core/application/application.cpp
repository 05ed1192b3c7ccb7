#include "zuuid/core/application.hpp"
#include "zuuid/cli/flag_precedence.hpp"
#include "zuuid/core/config_manager.hpp"
#include "zuuid/core/language.hpp"
#include "zuuid/utils/format_utils.hpp"
#include "zuuid/utils/logger.hpp"
#include "version.h"

#include <ostream>
#include <string_view>

namespace zuuid {
namespace core {

namespace {

constexpr std::string_view ANSI_YELLOW = "\033[33m";
constexpr std::string_view ANSI_RESET = "\033[0m";

// Installs the invocation's logger and puts the default one back afterwards,
// so no sink outlives the streams it writes to.
class ScopedLogger {
public:
    ScopedLogger(utils::LogLevel level, std::ostream& err, bool use_colors) {
        auto logger = std::make_unique<utils::Logger>(level);
        logger->add_sink(std::make_unique<utils::ConsoleSink>(err, use_colors));
        m_logger = logger.get();
        utils::LoggerManager::set_instance(std::move(logger));
    }

    ~ScopedLogger() {
        m_logger->flush();
        utils::LoggerManager::set_instance(utils::LoggerManager::create_default_logger());
    }

    ScopedLogger(const ScopedLogger&) = delete;
    ScopedLogger& operator=(const ScopedLogger&) = delete;

    utils::Logger& get() { return *m_logger; }

private:
    utils::Logger* m_logger = nullptr;
};

MessageKey message_for(cli::CliErrorKind kind) {
    switch (kind) {
        case cli::CliErrorKind::UnknownOption: return MessageKey::UnknownOption;
        case cli::CliErrorKind::MissingValue: return MessageKey::MissingValue;
        case cli::CliErrorKind::UnexpectedValue: return MessageKey::UnexpectedValue;
        case cli::CliErrorKind::UnexpectedArgument: return MessageKey::UnexpectedArgument;
        case cli::CliErrorKind::InvalidVersion: return MessageKey::InvalidVersion;
        case cli::CliErrorKind::InvalidCount: return MessageKey::InvalidCount;
        case cli::CliErrorKind::InvalidLogLevel: return MessageKey::InvalidLogLevel;
    }
    return MessageKey::UnknownOption;
}

void attach_log_file(utils::Logger& logger, const std::filesystem::path& path) {
    auto file_sink = std::make_unique<utils::FileSink>(path, false);
    if (!file_sink->is_open()) {
        ZUUID_LOG_WARNING("Main", "Cannot open log file: " + path.string());
        return;
    }
    logger.add_sink(std::move(file_sink));
}

} // namespace

int report_fatal_error(const std::exception& error) {
    ZUUID_LOG_ERROR("Main", "Fatal error: " + std::string(error.what()));
    utils::LoggerManager::get_instance().flush();
    return kExitFatalError;
}

GenerationRequest build_generation_request(const cli::CliOptions& options,
                                           const ApplicationConfig& config,
                                           const FormatPreference& format) {
    GenerationRequest request;
    request.version = options.version.value_or(config.uuid_version);
    request.count = options.count.value_or(static_cast<std::size_t>(config.count));
    request.letter_case = options.letter_case.value_or(
        config.uppercase ? LetterCase::Upper : LetterCase::Lower);
    request.format = format;
    return request;
}

Application::Application(platform::EnvironmentLookup env,
                         std::unique_ptr<services::UuidGenerator> generator,
                         std::ostream& out,
                         std::ostream& err,
                         bool use_colors)
    : m_env(std::move(env)),
      m_generator(std::move(generator)),
      m_out(out),
      m_err(err),
      m_use_colors(use_colors) {}

int Application::run(std::span<const std::string> raw_args) {
    auto parsed = cli::parse_arguments(raw_args);
    if (!parsed) {
        const MessageCatalog messages(detect_language(m_env));
        report_usage_error(parsed.error(), messages);
        return kExitUsageError;
    }
    const auto& options = *parsed;

    ScopedLogger logger(options.log_level.value_or(utils::LogLevel::Warning), m_err, m_use_colors);

    ConfigManager config_manager(options.config_path, m_env);
    const auto loaded = config_manager.load();
    const auto& config = config_manager.get();

    if (!options.log_level) {
        logger.get().set_level(config.log_level);
    }
    if (config.log_file) {
        attach_log_file(logger.get(), *config.log_file);
    }

    const MessageCatalog messages(resolve_language(config.language, m_env));

    if (options.show_help) {
        print_help(messages);
        return kExitSuccess;
    }
    if (options.show_version) {
        m_out << "zuuid " << ZUUID_VERSION_STRING << '\n';
        return kExitSuccess;
    }

    if (!loaded) {
        m_err << messages.format(MessageKey::ConfigLoadFailed,
                                 config_manager.path().string() + " (" + to_string(loaded.error()) + ")")
              << '\n';
        return kExitConfigError;
    }

    // Decided from the raw tokens: the parsed presence flags cannot tell
    // which of -f and -s came first.
    const auto format = cli::resolve_format_preference(raw_args, config.format == FormatStyle::Full);
    const auto request = build_generation_request(options, config, format);

    ZUUID_LOG_DEBUG("Main", "Generating " + std::to_string(request.count) + " " +
        to_string(request.version) + " UUID(s), " +
        (format.prefer_full ? "full" : "simple") + " format" +
        (format.conflict_detected ? " (format flags conflict)" : ""));

    if (format.conflict_detected) {
        print_conflict_warning(format, messages);
    }

    for (std::size_t i = 0; i < request.count; ++i) {
        m_out << utils::format_uuid(m_generator->generate(request.version), request.format,
                                    request.letter_case)
              << '\n';
    }
    m_out.flush();

    return kExitSuccess;
}

void Application::report_usage_error(const cli::CliError& error, const MessageCatalog& messages) {
    m_err << messages.format(message_for(error.kind), error.token) << "\n\n"
          << messages.lookup(MessageKey::UsageHint) << '\n';
}

void Application::print_conflict_warning(const FormatPreference& format, const MessageCatalog& messages) {
    const auto note = format.prefer_full ? MessageKey::UsingFull : MessageKey::UsingSimple;

    for (const auto key : {MessageKey::ConflictWarning, note}) {
        if (m_use_colors) {
            m_err << ANSI_YELLOW << messages.lookup(key) << ANSI_RESET << '\n';
        } else {
            m_err << messages.lookup(key) << '\n';
        }
    }
}

void Application::print_help(const MessageCatalog& messages) {
    m_out << messages.lookup(MessageKey::HelpText);
}

} // namespace core
} // namespace zuuid
