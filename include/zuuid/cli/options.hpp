#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace zuuid {
namespace cli {

enum class OptionId : std::uint8_t {
    UuidVersion,
    Upper,
    Lower,
    Simple,
    Full,
    Count,
    Config,
    LogLevel,
    Help,
    Version
};

// Format families compete for the output layout.
enum class FormatFamily : std::uint8_t {
    Full,
    Simple
};

struct OptionSpec {
    OptionId id;
    std::string_view long_name;
    char short_name;  // '\0' for long-only options
    char alias;       // second letter accepted for the same option, or '\0'
    bool takes_value;
};

// Single source of truth for both getopt_long and the format flag scan.
inline constexpr std::array<OptionSpec, 10> kOptions = {{
    {OptionId::UuidVersion, "uuid-version", 'V', 'v', true},
    {OptionId::Upper, "upper", 'U', 'u', false},
    {OptionId::Lower, "lower", 'l', '\0', false},
    {OptionId::Simple, "simple", 's', 'S', false},
    {OptionId::Full, "full", 'f', 'F', false},
    {OptionId::Count, "count", 'n', '\0', true},
    {OptionId::Config, "config", '\0', '\0', true},
    {OptionId::LogLevel, "log-level", '\0', '\0', true},
    {OptionId::Help, "help", 'h', '\0', false},
    {OptionId::Version, "version", '\0', '\0', false},
}};

inline const OptionSpec* find_short_option(char letter) {
    if (letter == '\0') {
        return nullptr;
    }
    for (const auto& option : kOptions) {
        if (option.short_name == letter || option.alias == letter) {
            return &option;
        }
    }
    return nullptr;
}

// Exact match first, then a unique prefix, the way getopt_long resolves
// abbreviated long options. Ambiguous or unknown names yield nullptr.
inline const OptionSpec* find_long_option(std::string_view name) {
    if (name.empty()) {
        return nullptr;
    }

    for (const auto& option : kOptions) {
        if (option.long_name == name) {
            return &option;
        }
    }

    const OptionSpec* candidate = nullptr;
    for (const auto& option : kOptions) {
        if (option.long_name.starts_with(name)) {
            if (candidate != nullptr) {
                return nullptr;
            }
            candidate = &option;
        }
    }
    return candidate;
}

inline std::optional<FormatFamily> format_family(OptionId id) {
    switch (id) {
        case OptionId::Full: return FormatFamily::Full;
        case OptionId::Simple: return FormatFamily::Simple;
        default: return std::nullopt;
    }
}

} // namespace cli
} // namespace zuuid
