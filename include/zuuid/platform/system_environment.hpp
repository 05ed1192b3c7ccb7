#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace zuuid {
namespace platform {

// Read-only view of the process environment. Injected so that locale and
// config path resolution can be exercised without touching the real one.
using EnvironmentLookup = std::function<std::optional<std::string>(std::string_view name)>;

// Backed by std::getenv.
EnvironmentLookup system_environment();

bool is_terminal(int fd);

} // namespace platform
} // namespace zuuid
