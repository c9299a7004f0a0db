#include "app/Application.hpp"
#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    lanwatch::app::Options options;
    try {
        options = lanwatch::app::Application::parseArguments(
            std::vector<std::string>(argv + 1, argv + argc));
    } catch (const lanwatch::core::ConfigurationError& e) {
        std::cerr << e.what() << "\n\n" << lanwatch::app::Application::usage();
        return 2;
    }

    if (options.showHelp) {
        std::cout << lanwatch::app::Application::usage();
        return 0;
    }

    try {
        lanwatch::app::Application app(options);
        return app.run();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
