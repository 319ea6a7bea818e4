#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "client/WorldDemo.hpp"
#include "core/WorldSettings.hpp"

using namespace Deepvale;

/**
 * Deepvale - voxel world demo
 *
 * Usage: deepvale [settings.json]
 */
int main(int argc, char** argv) {
    try {
        // Initialize logging
        spdlog::init_thread_pool(8192, 1);
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        auto logger = std::make_shared<spdlog::async_logger>("main", console_sink,
                                                             spdlog::thread_pool(),
                                                             spdlog::async_overflow_policy::block);
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

        spdlog::info("=== Deepvale ===");

        std::string settingsPath = argc > 1 ? argv[1] : "deepvale.json";
        WorldSettings settings;
        if (!settings.load(settingsPath)) {
            settings.save(settingsPath);
        }
        spdlog::set_level(spdlog::level::from_str(settings.logLevel.getValue()));

        // Create and run the demo
        WorldDemo demo(settings);
        demo.init();
        demo.run();
        demo.shutdown();

        spdlog::info("Application shutting down...");
        spdlog::shutdown();

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        spdlog::shutdown();
        return 1;
    }

    return 0;
}
