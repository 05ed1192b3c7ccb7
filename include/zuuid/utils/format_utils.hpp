#pragma once

#include "zuuid/core/models.hpp"
#include <string>
#include <string_view>

namespace zuuid::utils {

/**
 * @brief Render a canonical UUID for display
 *
 * Hyphens are removed when the simple layout won (32 characters), letters are
 * uppercased for LetterCase::Upper. Canonical input is already lowercase.
 *
 * @param canonical 36-character hyphenated UUID text
 * @param format Resolved layout
 * @param letter_case Requested case
 * @return The display string
 */
std::string format_uuid(std::string_view canonical, const core::FormatPreference& format,
                        core::LetterCase letter_case);

std::string strip_hyphens(std::string_view text);

std::string to_upper_ascii(std::string_view text);

std::string to_lower_ascii(std::string_view text);

} // namespace zuuid::utils
