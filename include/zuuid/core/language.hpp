#pragma once

#include "zuuid/core/models.hpp"
#include "zuuid/platform/system_environment.hpp"
#include <array>
#include <string_view>

namespace zuuid {
namespace core {

// Locale hint variables, in the order they are inspected.
inline constexpr std::array<std::string_view, 3> kLocaleVariables = {
    "LANG", "LC_ALL", "LC_MESSAGES"
};

/**
 * @brief Pick the message language from the locale hint variables
 *
 * Chinese is selected when any hint, lowercased, starts with "zh"
 * (zh_CN.UTF-8, zh_TW, zh-Hans ...). Everything else, including unset
 * variables, selects English.
 */
Language detect_language(const platform::EnvironmentLookup& env);

// A forced setting from the config file wins over the environment.
Language resolve_language(LanguageSetting setting, const platform::EnvironmentLookup& env);

} // namespace core
} // namespace zuuid
