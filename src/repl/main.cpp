#include "minischeme/minischeme.h"
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <iostream>
#include <string>

int main() {
    try {
        // Log level from SPDLOG_LEVEL, e.g. SPDLOG_LEVEL=trace
        spdlog::cfg::load_env_levels();

        minischeme::Interpreter interpreter;
        std::string line;

        while (true) {
            std::cout << ">> " << std::flush;
            if (!std::getline(std::cin, line)) break;

            auto result = interpreter.executeCommand(line);
            if (result.success) {
                std::cout << result.value.toString() << '\n';
            } else {
                std::cout << result.error << '\n';
            }
        }

        std::cout << "\nBye!\n";
    } catch (const std::exception& e) {
        spdlog::error("Unhandled exception in main: {}", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
