#include "zuuid/cli/flag_precedence.hpp"
#include <algorithm>
#include <string_view>

namespace zuuid {
namespace cli {

std::vector<FlagOccurrence> scan_format_flags(std::span<const std::string> raw_args) {
    std::vector<FlagOccurrence> occurrences;
    bool value_slot = false;

    for (std::size_t index = 0; index < raw_args.size(); ++index) {
        const std::string_view token = raw_args[index];

        if (value_slot) {
            value_slot = false;
            continue;
        }

        if (token == "--") {
            break;
        }

        if (token.starts_with("--")) {
            const auto body = token.substr(2);
            const auto equals = body.find('=');
            const auto* option = find_long_option(body.substr(0, equals));
            if (option == nullptr) {
                continue;
            }
            if (const auto family = format_family(option->id)) {
                occurrences.push_back({*family, index, 0});
            }
            value_slot = option->takes_value && equals == std::string_view::npos;
            continue;
        }

        if (token.size() < 2 || token.front() != '-') {
            continue;
        }

        const auto cluster = token.substr(1);
        for (std::size_t offset = 0; offset < cluster.size(); ++offset) {
            const auto* option = find_short_option(cluster[offset]);
            if (option == nullptr) {
                continue;
            }
            if (const auto family = format_family(option->id)) {
                occurrences.push_back({*family, index, offset});
            }
            if (option->takes_value) {
                // The rest of the cluster is the value; an empty rest means
                // the next token is.
                value_slot = offset + 1 == cluster.size();
                break;
            }
        }
    }

    return occurrences;
}

core::FormatPreference resolve_format_preference(std::span<const FlagOccurrence> occurrences,
                                                 bool default_full) {
    const auto is_family = [](FormatFamily family) {
        return [family](const FlagOccurrence& occurrence) { return occurrence.family == family; };
    };

    const bool has_full = std::any_of(occurrences.begin(), occurrences.end(), is_family(FormatFamily::Full));
    const bool has_simple = std::any_of(occurrences.begin(), occurrences.end(), is_family(FormatFamily::Simple));

    if (has_full && has_simple) {
        const auto earliest = std::min_element(occurrences.begin(), occurrences.end());
        return {.prefer_full = earliest->family == FormatFamily::Full, .conflict_detected = true};
    }
    if (has_full || has_simple) {
        return {.prefer_full = has_full, .conflict_detected = false};
    }
    return {.prefer_full = default_full, .conflict_detected = false};
}

core::FormatPreference resolve_format_preference(std::span<const std::string> raw_args,
                                                 bool default_full) {
    const auto occurrences = scan_format_flags(raw_args);
    return resolve_format_preference(std::span<const FlagOccurrence>(occurrences), default_full);
}

} // namespace cli
} // namespace zuuid
