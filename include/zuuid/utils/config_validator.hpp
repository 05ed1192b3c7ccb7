#pragma once

#include "zuuid/core/models.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace zuuid::utils {

/**
 * @brief Configuration validation errors
 */
enum class ValidationError {
    InvalidCount,
    InvalidLogFile
};

/**
 * @brief Detailed validation result
 */
struct ValidationResult {
    bool is_valid = true;
    std::vector<std::pair<ValidationError, std::string>> errors;
    std::vector<std::string> warnings;

    void add_error(ValidationError error, const std::string& message) {
        is_valid = false;
        errors.emplace_back(error, message);
    }

    void add_warning(const std::string& message) {
        warnings.emplace_back(message);
    }

    std::string get_error_summary() const {
        std::string summary;
        for (const auto& [error, message] : errors) {
            if (!summary.empty()) summary += "; ";
            summary += message;
        }
        return summary;
    }

    std::string get_warning_summary() const {
        std::string summary;
        for (const auto& warning : warnings) {
            if (!summary.empty()) summary += "; ";
            summary += warning;
        }
        return summary;
    }
};

class ConfigValidator {
public:
    // Values that parse but cannot be used: a non-positive count or a log
    // file path that names a directory.
    static ValidationResult validate_application_config(const core::ApplicationConfig& config);

    // Counts above this are accepted with a warning.
    static constexpr std::int64_t kLargeCount = 1'000'000;
};

} // namespace zuuid::utils
