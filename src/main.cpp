#include "zuuid/core/application.hpp"
#include "zuuid/platform/system_environment.hpp"
#include "zuuid/services/uuid_generator.hpp"

#include <iostream>
#include <string>
#include <unistd.h>
#include <vector>

int main(int argc, char* argv[]) {
    // Captured once, before anything can reorder them
    const std::vector<std::string> raw_args(argv + (argc > 0 ? 1 : 0), argv + argc);

    try {
        zuuid::core::Application app(zuuid::platform::system_environment(),
                                     zuuid::services::create_uuid_generator(),
                                     std::cout,
                                     std::cerr,
                                     zuuid::platform::is_terminal(STDERR_FILENO));
        return app.run(raw_args);
    } catch (const std::exception& e) {
        return zuuid::core::report_fatal_error(e);
    }
}
