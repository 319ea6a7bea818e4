#pragma once

#include <cstddef>
#include <memory>
#include "core/WorldSettings.hpp"
#include "events/EventBus.hpp"
#include "world/BlockRegistry.hpp"
#include "world/ChunkLoader.hpp"
#include "world/ChunkPool.hpp"
#include "world/VoxelWorld.hpp"
#include "world/gen/WorldGenerator.hpp"

namespace Deepvale {

/**
 * Deepvale demo client.
 * Owns the block registry, chunk pool, world, generator and loader, and
 * drives one scripted session: generate, dig, then walk while streaming.
 *
 * shutdown() tears everything down in reverse order of init(), so it must
 * run while logging is still up.
 */
class WorldDemo {
public:
    explicit WorldDemo(const WorldSettings& settings);
    ~WorldDemo();

    // No copy/move
    WorldDemo(const WorldDemo&) = delete;
    WorldDemo& operator=(const WorldDemo&) = delete;

    void init();
    void run();
    void shutdown();

    size_t getMeshRebuilds() const { return meshRebuilds; }
    bool isInitialized() const { return world != nullptr; }

private:
    void logWorldStatistics() const;

private:
    const WorldSettings& settings;

    std::unique_ptr<BlockRegistry> blocks;
    std::unique_ptr<ChunkPool> pool;
    std::unique_ptr<VoxelWorld> world;
    std::unique_ptr<WorldGenerator> generator;
    std::unique_ptr<ChunkLoader> loader;

    ScopedSubscription meshSubscription;
    size_t meshRebuilds = 0;
};

} // namespace Deepvale
