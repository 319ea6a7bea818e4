#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "events/EventBus.hpp"
#include "events/WorldEvents.hpp"
#include "world/BlockRegistry.hpp"
#include "world/ChunkPool.hpp"
#include "world/VoxelWorld.hpp"

using namespace Deepvale;

namespace {

class VoxelWorldTest : public ::testing::Test {
protected:
    void SetUp() override {
        blocks.registerDefaults();
        stone = blocks.get(BlockIds::STONE);
        grass = blocks.get(BlockIds::GRASS);
    }

    void TearDown() override {
        EventBus::clear();
    }

    void clearAllDirty(VoxelWorld& world) {
        for (VoxelChunk* chunk : world.getAllChunks()) {
            chunk->clearDirty();
        }
    }

    std::vector<ChunkPosition> dirtyChunks(const VoxelWorld& world) {
        std::vector<ChunkPosition> result;
        for (VoxelChunk* chunk : world.getAllChunks()) {
            if (chunk->isDirty()) {
                result.push_back(chunk->getPosition());
            }
        }
        return result;
    }

    static bool contains(const std::vector<ChunkPosition>& positions, const ChunkPosition& pos) {
        return std::find(positions.begin(), positions.end(), pos) != positions.end();
    }

    BlockRegistry blocks;
    const BlockType* stone = nullptr;
    const BlockType* grass = nullptr;
};

} // namespace

TEST_F(VoxelWorldTest, InitializeCreatesChunkGridOnce) {
    VoxelWorld world(blocks, 3, 2);
    EXPECT_FALSE(world.isInitialized());

    world.initialize();
    world.initialize();

    EXPECT_TRUE(world.isInitialized());
    EXPECT_EQ(world.getChunkCount(), 3u * 2u * 3u);
    EXPECT_EQ(world.getSizeInBlocks(), 48);
    EXPECT_EQ(world.getHeightInBlocks(), 32);
    EXPECT_NE(world.getChunk({2, 1, 2}), nullptr);
    EXPECT_EQ(world.getChunk({3, 0, 0}), nullptr);
}

TEST_F(VoxelWorldTest, ReadsOutsideLoadedChunksReturnAir) {
    VoxelWorld world(blocks, 2, 1);
    world.initialize();
    world.generateFlatTerrain(16, stone);

    const glm::ivec3 outside[] = {
        {-1, 0, 0}, {0, -1, 0}, {0, 0, -1}, {32, 0, 0}, {0, 16, 0}, {0, 0, 32}, {-500, -500, -500}, {1000, 3, 1000}
    };
    for (const auto& pos : outside) {
        EXPECT_EQ(world.getBlock(pos), blocks.air()) << pos.x << "," << pos.y << "," << pos.z;
        EXPECT_FALSE(world.isPositionValid(pos));
    }

    EXPECT_EQ(world.getBlock({0, 0, 0}), stone);
    EXPECT_EQ(world.getBlock({31, 15, 31}), stone);
}

TEST_F(VoxelWorldTest, RequestBlockChangeNeedsALoadedChunk) {
    VoxelWorld world(blocks, 1, 1);
    world.initialize();

    EXPECT_FALSE(world.requestBlockChange({16, 0, 0}, stone));
    EXPECT_FALSE(world.requestBlockChange({0, -1, 0}, stone));

    EXPECT_TRUE(world.requestBlockChange({3, 4, 5}, stone));
    EXPECT_EQ(world.getBlock({3, 4, 5}), stone);

    // Last write wins
    EXPECT_TRUE(world.requestBlockChange({3, 4, 5}, grass));
    EXPECT_EQ(world.getBlock({3, 4, 5}), grass);
}

TEST_F(VoxelWorldTest, IdenticalWriteDoesNotDirtyChunk) {
    VoxelWorld world(blocks, 1, 1);
    world.initialize();
    world.requestBlockChange({3, 4, 5}, stone);
    clearAllDirty(world);

    EXPECT_FALSE(world.requestBlockChange({3, 4, 5}, stone));
    EXPECT_TRUE(dirtyChunks(world).empty());
}

TEST_F(VoxelWorldTest, InteriorEditDirtiesOnlyOwningChunk) {
    VoxelWorld world(blocks, 3, 3);
    world.initialize();
    clearAllDirty(world);

    world.requestBlockChange({24, 24, 24}, stone);

    auto dirty = dirtyChunks(world);
    ASSERT_EQ(dirty.size(), 1u);
    EXPECT_EQ(dirty[0], (ChunkPosition{1, 1, 1}));
}

TEST_F(VoxelWorldTest, BoundaryEditDirtiesFaceNeighbour) {
    VoxelWorld world(blocks, 3, 3);
    world.initialize();
    clearAllDirty(world);

    // Local x = 0 in chunk (1, 1, 1)
    world.requestBlockChange({16, 20, 20}, stone);

    auto dirty = dirtyChunks(world);
    EXPECT_EQ(dirty.size(), 2u);
    EXPECT_TRUE(contains(dirty, {1, 1, 1}));
    EXPECT_TRUE(contains(dirty, {0, 1, 1}));

    clearAllDirty(world);

    // Local z = 15 in chunk (1, 1, 1)
    world.requestBlockChange({20, 20, 31}, stone);
    dirty = dirtyChunks(world);
    EXPECT_EQ(dirty.size(), 2u);
    EXPECT_TRUE(contains(dirty, {1, 1, 2}));
}

TEST_F(VoxelWorldTest, CornerEditDirtiesEveryTouchingFaceNeighbour) {
    VoxelWorld world(blocks, 3, 3);
    world.initialize();
    clearAllDirty(world);

    world.requestBlockChange({16, 16, 16}, stone);

    auto dirty = dirtyChunks(world);
    EXPECT_EQ(dirty.size(), 4u);
    EXPECT_TRUE(contains(dirty, {1, 1, 1}));
    EXPECT_TRUE(contains(dirty, {0, 1, 1}));
    EXPECT_TRUE(contains(dirty, {1, 0, 1}));
    EXPECT_TRUE(contains(dirty, {1, 1, 0}));
}

TEST_F(VoxelWorldTest, EdgeOfWorldEditIgnoresMissingNeighbour) {
    VoxelWorld world(blocks, 2, 1);
    world.initialize();
    clearAllDirty(world);

    world.requestBlockChange({0, 5, 5}, stone);

    auto dirty = dirtyChunks(world);
    ASSERT_EQ(dirty.size(), 1u);
    EXPECT_EQ(dirty[0], (ChunkPosition{0, 0, 0}));
}

TEST_F(VoxelWorldTest, RebuildDirtyChunksTouchesOnlyDirtyChunks) {
    VoxelWorld world(blocks, 2, 2);
    world.initialize();
    EXPECT_EQ(world.rebuildDirtyChunks(), 8u);
    EXPECT_EQ(world.rebuildDirtyChunks(), 0u);

    std::vector<ChunkPosition> rebuilt;
    ScopedSubscription subscription(EventBus::subscribe<ChunkMeshRebuiltEvent>(
        [&rebuilt](ChunkMeshRebuiltEvent& event) { rebuilt.push_back(event.getChunkPosition()); }));

    world.requestBlockChange({4, 4, 4}, stone);
    EXPECT_EQ(world.rebuildDirtyChunks(), 1u);
    ASSERT_EQ(rebuilt.size(), 1u);
    EXPECT_EQ(rebuilt[0], (ChunkPosition{0, 0, 0}));
    EXPECT_EQ(world.getChunk({0, 0, 0})->getMesh().getQuadCount(), 6u);
    EXPECT_TRUE(dirtyChunks(world).empty());
}

TEST_F(VoxelWorldTest, FlatTerrainFillsBelowGroundHeight) {
    VoxelWorld world(blocks, 1, 2);
    world.initialize();
    world.generateFlatTerrain(20, grass);

    EXPECT_EQ(world.getBlock({0, 0, 0}), grass);
    EXPECT_EQ(world.getBlock({15, 19, 15}), grass);
    EXPECT_EQ(world.getBlock({15, 20, 15}), blocks.air());
    EXPECT_TRUE(dirtyChunks(world).empty());

    // Ground above the world top is clamped
    world.generateFlatTerrain(100, stone);
    EXPECT_EQ(world.getBlock({0, 31, 0}), stone);
}

TEST_F(VoxelWorldTest, FlatTerrainWithNullBlockDoesNothing) {
    VoxelWorld world(blocks, 1, 1);
    world.initialize();
    world.generateFlatTerrain(8, nullptr);

    EXPECT_EQ(world.getChunk({0, 0, 0})->countNonAir(), 0u);
}

TEST_F(VoxelWorldTest, GenerateWithoutGeneratorDoesNothing) {
    VoxelWorld world(blocks, 1, 1);
    world.initialize();
    world.generateWithWorldGenerator();

    EXPECT_EQ(world.getChunk({0, 0, 0})->countNonAir(), 0u);
}

TEST_F(VoxelWorldTest, BlockChangedEventsOnlyForRealChanges) {
    VoxelWorld world(blocks, 1, 1);
    world.initialize();

    std::vector<BlockChangedEvent> events;
    ScopedSubscription subscription(EventBus::subscribe<BlockChangedEvent>(
        [&events](BlockChangedEvent& event) { events.push_back(event); }));

    world.requestBlockChange({1, 2, 3}, stone);
    world.requestBlockChange({1, 2, 3}, stone);
    world.requestBlockChange({1, 2, 3}, nullptr);

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].getPosition(), glm::ivec3(1, 2, 3));
    EXPECT_EQ(events[0].getOldBlock(), blocks.air());
    EXPECT_EQ(events[0].getNewBlock(), stone);
    EXPECT_EQ(events[1].getNewBlock(), blocks.air());
}

TEST_F(VoxelWorldTest, UnloadReturnsChunkToPool) {
    ChunkPool pool(blocks.air(), 8);
    VoxelWorld world(blocks, 2, 1);
    world.setChunkPool(&pool);
    world.initialize();
    world.requestBlockChange({20, 3, 3}, stone);

    std::vector<ChunkPosition> unloaded;
    ScopedSubscription subscription(EventBus::subscribe<ChunkUnloadedEvent>(
        [&unloaded](ChunkUnloadedEvent& event) { unloaded.push_back(event.getChunkPosition()); }));

    world.unloadChunk({1, 0, 0});

    EXPECT_EQ(world.getChunkCount(), 3u);
    EXPECT_EQ(pool.getAvailableCount(), 1u);
    ASSERT_EQ(unloaded.size(), 1u);
    EXPECT_EQ(unloaded[0], (ChunkPosition{1, 0, 0}));

    EXPECT_EQ(world.getBlock({20, 3, 3}), blocks.air());
    EXPECT_FALSE(world.requestBlockChange({20, 3, 3}, stone));

    // Reloading reuses the pooled chunk, empty
    VoxelChunk* reloaded = world.loadOrCreateChunk({1, 0, 0});
    ASSERT_NE(reloaded, nullptr);
    EXPECT_EQ(reloaded->countNonAir(), 0u);
    EXPECT_EQ(pool.getAvailableCount(), 0u);
    EXPECT_EQ(pool.getTotalCreated(), 4u);
}

TEST_F(VoxelWorldTest, ChunksOutsideBoundsAreNeverCreated) {
    VoxelWorld world(blocks, 2, 1);
    EXPECT_EQ(world.loadOrCreateChunk({2, 0, 0}), nullptr);
    EXPECT_EQ(world.loadOrCreateChunk({0, -1, 0}), nullptr);
    EXPECT_EQ(world.getChunkCount(), 0u);

    VoxelChunk* chunk = world.loadOrCreateChunk({1, 0, 1});
    ASSERT_NE(chunk, nullptr);
    EXPECT_EQ(world.loadOrCreateChunk({1, 0, 1}), chunk);
    EXPECT_EQ(world.getChunkCount(), 1u);
}

TEST_F(VoxelWorldTest, WorldPositionMapsThroughBlockSize) {
    VoxelWorld world(blocks, 4, 2);

    // 8 world units = 16 blocks = chunk 1
    EXPECT_EQ(world.worldToChunkPos({8.0f, 0.0f, 0.0f}), (ChunkPosition{1, 0, 0}));
    EXPECT_EQ(world.worldToChunkPos({7.9f, 7.9f, 7.9f}), (ChunkPosition{0, 0, 0}));
    EXPECT_EQ(world.worldToChunkPos({8.25f, 16.0f, 24.0f}), (ChunkPosition{1, 2, 3}));
    EXPECT_EQ(world.worldToChunkPos({-0.1f, 0.0f, 0.0f}), (ChunkPosition{-1, 0, 0}));
}
