#include "app.hpp"
#include "debug.hpp"
#include <iostream>
#include <chrono>
#include <unistd.h>

int main(int /*argc*/, char* /*argv*/[]) {
    DEBUG_LOG("=== FX Cache Manager starting ===");
    DEBUG_LOG("PID: " << getpid());

    try {
        FxCacheManager::App app;

        auto initStart = std::chrono::steady_clock::now();
        if (!app.init()) {
            std::cerr << "Failed to initialize application\n";
            return 1;
        }
        auto initMs = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - initStart).count();
        DEBUG_LOG("app.init() completed in " << initMs << "ms");

        app.run();
        app.shutdown();
        DEBUG_LOG("=== FX Cache Manager shutdown complete ===");

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
