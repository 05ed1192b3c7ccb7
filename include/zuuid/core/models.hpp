#pragma once

#include "zuuid/utils/logger.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace zuuid {
namespace core {

// ============================================================================
// Error types
// ============================================================================

enum class ConfigError {
    FileNotFound,
    InvalidFormat,
    ValidationError
};

// ============================================================================
// Domain types
// ============================================================================

enum class UuidVersion : std::uint8_t {
    V4 = 4,
    V7 = 7
};

enum class LetterCase : std::uint8_t {
    Lower,
    Upper
};

enum class FormatStyle : std::uint8_t {
    Full,
    Simple
};

enum class Language : std::uint8_t {
    English,
    Chinese
};

enum class LanguageSetting : std::uint8_t {
    Auto,
    English,
    Chinese
};

// Outcome of format flag resolution. Both fields come from one scan of the
// raw command line.
struct FormatPreference {
    bool prefer_full = true;
    bool conflict_detected = false;

    bool operator==(const FormatPreference&) const = default;
};

struct GenerationRequest {
    UuidVersion version = UuidVersion::V4;
    std::size_t count = 1;
    LetterCase letter_case = LetterCase::Lower;
    FormatPreference format;
};

struct ApplicationConfig {
    utils::LogLevel log_level = utils::LogLevel::Warning;
    std::optional<std::filesystem::path> log_file;

    // Generation defaults, overridden by the command line
    UuidVersion uuid_version = UuidVersion::V4;
    bool uppercase = false;
    FormatStyle format = FormatStyle::Full;
    std::int64_t count = 1;

    LanguageSetting language = LanguageSetting::Auto;
};

// Accepts 4, 7, v4, v7 in any letter case.
std::optional<UuidVersion> parse_uuid_version(std::string_view text);
std::string to_string(UuidVersion version);

std::optional<FormatStyle> parse_format_style(std::string_view text);
std::string to_string(FormatStyle style);

std::optional<LanguageSetting> parse_language_setting(std::string_view text);
std::string to_string(LanguageSetting setting);

std::string to_string(ConfigError error);

} // namespace core
} // namespace zuuid
