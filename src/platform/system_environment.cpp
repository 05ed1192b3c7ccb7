#include "zuuid/platform/system_environment.hpp"

#include <cstdlib>
#include <unistd.h>

namespace zuuid {
namespace platform {

EnvironmentLookup system_environment() {
    return [](std::string_view name) -> std::optional<std::string> {
        const std::string key(name);
        if (const char* value = std::getenv(key.c_str())) {
            return std::string(value);
        }
        return std::nullopt;
    };
}

bool is_terminal(int fd) {
    return isatty(fd) != 0;
}

} // namespace platform
} // namespace zuuid
