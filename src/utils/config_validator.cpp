#include "zuuid/utils/config_validator.hpp"
#include <filesystem>

namespace zuuid::utils {

ValidationResult ConfigValidator::validate_application_config(const core::ApplicationConfig& config) {
    ValidationResult result;

    if (config.count <= 0) {
        result.add_error(ValidationError::InvalidCount,
            "count must be a positive integer, got " + std::to_string(config.count));
    } else if (config.count > kLargeCount) {
        result.add_warning("count of " + std::to_string(config.count) + " prints a lot of output");
    }

    if (config.log_file) {
        std::error_code ec;
        if (std::filesystem::is_directory(*config.log_file, ec)) {
            result.add_error(ValidationError::InvalidLogFile,
                "log_file is a directory: " + config.log_file->string());
        }
    }

    return result;
}

} // namespace zuuid::utils
