#pragma once

#include "zuuid/core/models.hpp"
#include "zuuid/utils/logger.hpp"
#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>

namespace zuuid {
namespace cli {

enum class CliErrorKind {
    UnknownOption,
    MissingValue,
    UnexpectedValue,
    UnexpectedArgument,
    InvalidVersion,
    InvalidCount,
    InvalidLogLevel
};

struct CliError {
    CliErrorKind kind;
    std::string token;  // offending option or value as typed
};

// Structured view of the command line. Presence of the format flags is kept
// for diagnostics only; their order is lost here, which is why the output
// layout is decided by resolve_format_preference on the raw tokens.
struct CliOptions {
    std::optional<core::UuidVersion> version;
    std::optional<core::LetterCase> letter_case;
    std::optional<std::size_t> count;
    bool full_flag = false;
    bool simple_flag = false;
    bool show_help = false;
    bool show_version = false;
    std::optional<std::filesystem::path> config_path;
    std::optional<utils::LogLevel> log_level;
};

/**
 * @brief Parse the command line with getopt_long
 *
 * Works on a private copy of the tokens, so it can be called repeatedly.
 * Stops at the first error. raw_args excludes the program name.
 */
std::expected<CliOptions, CliError> parse_arguments(std::span<const std::string> raw_args);

// Strictly positive decimal integer; anything else is rejected.
std::optional<std::size_t> parse_count(std::string_view text);

} // namespace cli
} // namespace zuuid
