#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

#include "client/WorldDemo.hpp"
#include "core/WorldSettings.hpp"
#include "events/EventBus.hpp"

using namespace Deepvale;

namespace {

class WorldDemoTest : public ::testing::Test {
protected:
    void SetUp() override {
        previousLogger = spdlog::default_logger();
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(log);
        auto logger = std::make_shared<spdlog::logger>("world_demo_test", sink);
        logger->set_pattern("%v");
        logger->set_level(spdlog::level::trace);
        spdlog::set_default_logger(logger);

        settings.dataDirectory.setValue(DEEPVALE_DATA_DIR);
        settings.worldSizeInChunks.setValue(8);
        settings.worldHeightInChunks.setValue(1);
        settings.useWorldGenerator.setValue(false);
        settings.loadDistance.setValue(1);
        settings.unloadDistance.setValue(2);
        settings.chunkPoolInitialSize.setValue(0);
        settings.chunkPoolMaxSize.setValue(1);
    }

    void TearDown() override {
        spdlog::set_default_logger(previousLogger);
        EventBus::clear();
    }

    std::shared_ptr<spdlog::logger> previousLogger;
    std::ostringstream log;
    WorldSettings settings;
};

} // namespace

TEST_F(WorldDemoTest, ShutdownReleasesChunksWhileLoggingIsUp) {
    WorldDemo demo(settings);
    demo.init();
    ASSERT_TRUE(demo.isInitialized());
    demo.run();
    EXPECT_GT(demo.getMeshRebuilds(), 0u);

    size_t runLength = log.str().size();
    demo.shutdown();
    EXPECT_FALSE(demo.isInitialized());

    // Chunks still loaded at the end of the walk overflow the one-slot pool
    std::string shutdownLog = log.str().substr(runLength);
    size_t overflow = shutdownLog.find("Chunk pool full");
    size_t complete = shutdownLog.find("Shutdown complete");
    ASSERT_NE(overflow, std::string::npos);
    ASSERT_NE(complete, std::string::npos);
    EXPECT_LT(overflow, complete);
}

TEST_F(WorldDemoTest, ShutdownIsIdempotent) {
    WorldDemo demo(settings);
    demo.init();
    demo.shutdown();

    size_t length = log.str().size();
    demo.shutdown();
    EXPECT_EQ(log.str().size(), length);
}
