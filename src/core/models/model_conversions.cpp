#include "zuuid/core/models.hpp"
#include "zuuid/utils/format_utils.hpp"

namespace zuuid {
namespace core {

namespace {
    std::string lowercase(std::string_view text) {
        return utils::to_lower_ascii(text);
    }
}

std::optional<UuidVersion> parse_uuid_version(std::string_view text) {
    const auto value = lowercase(text);
    if (value == "4" || value == "v4") {
        return UuidVersion::V4;
    }
    if (value == "7" || value == "v7") {
        return UuidVersion::V7;
    }
    return std::nullopt;
}

std::string to_string(UuidVersion version) {
    switch (version) {
        case UuidVersion::V4: return "v4";
        case UuidVersion::V7: return "v7";
    }
    return "v4";
}

std::optional<FormatStyle> parse_format_style(std::string_view text) {
    const auto value = lowercase(text);
    if (value == "full") return FormatStyle::Full;
    if (value == "simple") return FormatStyle::Simple;
    return std::nullopt;
}

std::string to_string(FormatStyle style) {
    return style == FormatStyle::Simple ? "simple" : "full";
}

std::optional<LanguageSetting> parse_language_setting(std::string_view text) {
    const auto value = lowercase(text);
    if (value == "auto") return LanguageSetting::Auto;
    if (value == "en" || value == "english") return LanguageSetting::English;
    if (value == "zh" || value == "chinese") return LanguageSetting::Chinese;
    return std::nullopt;
}

std::string to_string(LanguageSetting setting) {
    switch (setting) {
        case LanguageSetting::Auto: return "auto";
        case LanguageSetting::English: return "en";
        case LanguageSetting::Chinese: return "zh";
    }
    return "auto";
}

std::string to_string(ConfigError error) {
    switch (error) {
        case ConfigError::FileNotFound: return "file not found";
        case ConfigError::InvalidFormat: return "invalid format";
        case ConfigError::ValidationError: return "validation failed";
    }
    return "unknown error";
}

} // namespace core
} // namespace zuuid
