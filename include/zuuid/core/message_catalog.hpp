#pragma once

#include "zuuid/core/models.hpp"
#include <string>
#include <string_view>

namespace zuuid {
namespace core {

enum class MessageKey {
    ConflictWarning,
    UsingFull,
    UsingSimple,
    InvalidVersion,
    InvalidCount,
    UnknownOption,
    MissingValue,
    UnexpectedValue,
    UnexpectedArgument,
    InvalidLogLevel,
    UsageHint,
    HelpText,
    ConfigLoadFailed
};

/**
 * @brief Localized user-facing text for one invocation
 *
 * Built once after the language is resolved and handed by reference to
 * everything that prints to the user. Templates may contain a single
 * {value} placeholder, filled by format().
 */
class MessageCatalog {
public:
    explicit MessageCatalog(Language language) : m_language(language) {}

    [[nodiscard]] Language language() const { return m_language; }

    [[nodiscard]] std::string_view lookup(MessageKey key) const {
        return lookup(key, m_language);
    }

    [[nodiscard]] std::string format(MessageKey key, std::string_view value) const;

    // Falls back to the English text when no translation exists.
    [[nodiscard]] static std::string_view lookup(MessageKey key, Language language);

private:
    Language m_language;
};

} // namespace core
} // namespace zuuid
