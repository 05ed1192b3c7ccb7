#pragma once

#include "zuuid/cli/options.hpp"
#include "zuuid/core/models.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace zuuid {
namespace cli {

// Larger than any realistic short-flag cluster, so keys from different
// arguments never interleave.
inline constexpr std::uint64_t kClusterStride = 1000;

struct FlagOccurrence {
    FormatFamily family;
    std::size_t argument_index;
    std::size_t char_offset;  // position after the leading dash; 0 for long options

    [[nodiscard]] std::uint64_t ordering_key() const {
        return static_cast<std::uint64_t>(argument_index) * kClusterStride + char_offset;
    }

    // Argument position first, then position inside the cluster.
    bool operator<(const FlagOccurrence& other) const {
        if (argument_index != other.argument_index) {
            return argument_index < other.argument_index;
        }
        return char_offset < other.char_offset;
    }
};

/**
 * @brief Find every full/simple format flag in the raw command line
 *
 * Tokens are walked the way getopt_long walks them: "--" stops the scan,
 * long options may be abbreviated to a unique prefix, and the value slot of
 * an option that takes one (the rest of a cluster, "=value", or the next
 * token) is never inspected. raw_args excludes the program name.
 *
 * @return Occurrences in command line order
 */
std::vector<FlagOccurrence> scan_format_flags(std::span<const std::string> raw_args);

/**
 * @brief Decide between full and simple output
 *
 * With both families present the earliest occurrence wins and the conflict
 * is reported. With one family present it wins silently. With neither,
 * default_full decides.
 */
core::FormatPreference resolve_format_preference(std::span<const FlagOccurrence> occurrences,
                                                 bool default_full = true);

core::FormatPreference resolve_format_preference(std::span<const std::string> raw_args,
                                                 bool default_full = true);

} // namespace cli
} // namespace zuuid
