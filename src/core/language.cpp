#include "zuuid/core/language.hpp"
#include "zuuid/utils/format_utils.hpp"
#include "zuuid/utils/logger.hpp"
#include <string>

namespace zuuid {
namespace core {

namespace {
    bool is_chinese_locale(std::string_view value) {
        return utils::to_lower_ascii(value).starts_with("zh");
    }
}

Language detect_language(const platform::EnvironmentLookup& env) {
    if (!env) {
        return Language::English;
    }

    for (const auto name : kLocaleVariables) {
        const auto value = env(name);
        if (value && is_chinese_locale(*value)) {
            ZUUID_LOG_DEBUG("Locale", std::string(name) + "=" + *value + " selects Chinese");
            return Language::Chinese;
        }
    }
    return Language::English;
}

Language resolve_language(LanguageSetting setting, const platform::EnvironmentLookup& env) {
    switch (setting) {
        case LanguageSetting::English: return Language::English;
        case LanguageSetting::Chinese: return Language::Chinese;
        case LanguageSetting::Auto: break;
    }
    return detect_language(env);
}

} // namespace core
} // namespace zuuid
