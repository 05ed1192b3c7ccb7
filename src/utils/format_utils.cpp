#include "zuuid/utils/format_utils.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace zuuid::utils {

std::string strip_hyphens(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    std::copy_if(text.begin(), text.end(), std::back_inserter(result),
                 [](char c) { return c != '-'; });
    return result;
}

std::string to_upper_ascii(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string to_lower_ascii(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string format_uuid(std::string_view canonical, const core::FormatPreference& format,
                        core::LetterCase letter_case) {
    std::string result = format.prefer_full ? std::string(canonical) : strip_hyphens(canonical);

    if (letter_case == core::LetterCase::Upper) {
        return to_upper_ascii(result);
    }
    return result;
}

} // namespace zuuid::utils
