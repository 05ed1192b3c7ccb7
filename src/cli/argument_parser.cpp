#include "zuuid/cli/argument_parser.hpp"
#include "zuuid/cli/options.hpp"
#include <charconv>
#include <getopt.h>
#include <string_view>
#include <vector>

namespace zuuid {
namespace cli {

namespace {

// getopt_long values for options without a short letter.
constexpr int kLongOnlyBase = 256;

int option_value(const OptionSpec& option) {
    if (option.short_name != '\0') {
        return static_cast<unsigned char>(option.short_name);
    }
    return kLongOnlyBase + static_cast<int>(option.id);
}

const OptionSpec* option_for_value(int value) {
    if (value >= kLongOnlyBase) {
        for (const auto& option : kOptions) {
            if (option_value(option) == value) {
                return &option;
            }
        }
        return nullptr;
    }
    if (value <= 0) {
        return nullptr;
    }
    return find_short_option(static_cast<char>(value));
}

std::string build_short_options() {
    // Leading ':' makes getopt return ':' for a missing value.
    std::string result = ":";
    for (const auto& option : kOptions) {
        for (const char letter : {option.short_name, option.alias}) {
            if (letter == '\0') {
                continue;
            }
            result += letter;
            if (option.takes_value) {
                result += ':';
            }
        }
    }
    return result;
}

std::vector<struct option> build_long_options() {
    std::vector<struct option> result;
    result.reserve(kOptions.size() + 1);
    for (const auto& option : kOptions) {
        // Long names are string literals, so data() is null-terminated.
        result.push_back({option.long_name.data(),
                          option.takes_value ? required_argument : no_argument,
                          nullptr,
                          option_value(option)});
    }
    result.push_back({nullptr, 0, nullptr, 0});
    return result;
}

// "--count=5" -> "--count"
std::string long_token(std::string_view token) {
    return std::string(token.substr(0, token.find('=')));
}

std::string short_token(int letter) {
    return std::string("-") + static_cast<char>(letter);
}

} // namespace

std::optional<std::size_t> parse_count(std::string_view text) {
    std::size_t value = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc{} || ptr != last || value == 0) {
        return std::nullopt;
    }
    return value;
}

std::expected<CliOptions, CliError> parse_arguments(std::span<const std::string> raw_args) {
    // getopt permutes argv, so it gets its own copy.
    std::vector<std::string> storage;
    storage.reserve(raw_args.size() + 1);
    storage.emplace_back("zuuid");
    storage.insert(storage.end(), raw_args.begin(), raw_args.end());

    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (auto& token : storage) {
        argv.push_back(token.data());
    }
    argv.push_back(nullptr);
    const int argc = static_cast<int>(storage.size());

    const auto short_options = build_short_options();
    const auto long_options = build_long_options();

    // optind = 0 forces glibc to fully reinitialize between calls.
    optind = 0;
    opterr = 0;

    CliOptions options;
    int value = 0;
    while ((value = getopt_long(argc, argv.data(), short_options.c_str(),
                                long_options.data(), nullptr)) != -1) {
        const std::string_view current = argv[optind - 1];

        if (value == ':') {
            const auto token = current.starts_with("--") ? long_token(current) : short_token(optopt);
            return std::unexpected(CliError{CliErrorKind::MissingValue, token});
        }

        if (value == '?') {
            // optopt is 0 for unknown or ambiguous long options and the
            // option's value when a flag was given "=value".
            if (optopt == 0) {
                return std::unexpected(CliError{CliErrorKind::UnknownOption, long_token(current)});
            }
            if (option_for_value(optopt) != nullptr && current.starts_with("--")) {
                return std::unexpected(CliError{CliErrorKind::UnexpectedValue, long_token(current)});
            }
            return std::unexpected(CliError{CliErrorKind::UnknownOption, short_token(optopt)});
        }

        const auto* spec = option_for_value(value);
        if (spec == nullptr) {
            return std::unexpected(CliError{CliErrorKind::UnknownOption, std::string(current)});
        }

        switch (spec->id) {
            case OptionId::UuidVersion: {
                auto version = core::parse_uuid_version(optarg);
                if (!version) {
                    return std::unexpected(CliError{CliErrorKind::InvalidVersion, optarg});
                }
                options.version = *version;
                break;
            }
            case OptionId::Upper:
                options.letter_case = core::LetterCase::Upper;
                break;
            case OptionId::Lower:
                options.letter_case = core::LetterCase::Lower;
                break;
            case OptionId::Simple:
                options.simple_flag = true;
                break;
            case OptionId::Full:
                options.full_flag = true;
                break;
            case OptionId::Count: {
                auto count = parse_count(optarg);
                if (!count) {
                    return std::unexpected(CliError{CliErrorKind::InvalidCount, optarg});
                }
                options.count = *count;
                break;
            }
            case OptionId::Config:
                options.config_path = std::filesystem::path(optarg);
                break;
            case OptionId::LogLevel: {
                auto level = utils::log_level_from_string(optarg);
                if (!level) {
                    return std::unexpected(CliError{CliErrorKind::InvalidLogLevel, optarg});
                }
                options.log_level = *level;
                break;
            }
            case OptionId::Help:
                options.show_help = true;
                return options;
            case OptionId::Version:
                options.show_version = true;
                return options;
        }
    }

    if (optind < argc) {
        return std::unexpected(CliError{CliErrorKind::UnexpectedArgument, argv[optind]});
    }

    return options;
}

} // namespace cli
} // namespace zuuid
