#include <gtest/gtest.h>

#include <memory>

#include "events/EventBus.hpp"
#include "world/BlockRegistry.hpp"
#include "world/ChunkLoader.hpp"
#include "world/VoxelWorld.hpp"
#include "world/gen/WorldGenerator.hpp"

using namespace Deepvale;

namespace {

class ChunkLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        blocks.registerDefaults();
    }

    void TearDown() override {
        EventBus::clear();
    }

    BlockRegistry blocks;
};

} // namespace

TEST_F(ChunkLoaderTest, ConstructorKeepsUnloadBeyondLoad) {
    VoxelWorld world(blocks, 8, 1);

    ChunkLoader loader(world, 4, 3);
    EXPECT_EQ(loader.getLoadDistance(), 4);
    EXPECT_EQ(loader.getUnloadDistance(), 6);

    loader.setUnloadDistance(2);
    EXPECT_EQ(loader.getUnloadDistance(), 5);

    loader.setLoadDistance(10);
    EXPECT_EQ(loader.getUnloadDistance(), 11);
}

TEST_F(ChunkLoaderTest, SetTargetQueuesChunksInRange) {
    VoxelWorld world(blocks, 8, 1);
    ChunkLoader loader(world, 2, 4);
    EXPECT_FALSE(loader.hasTarget());

    // Chunk (0, 0); only the in-bounds quarter circle of radius 2 is queued
    loader.setTarget({8, 0, 8});

    EXPECT_TRUE(loader.hasTarget());
    EXPECT_EQ(loader.getLoadQueueSize(), 6u);
    EXPECT_EQ(world.getChunkCount(), 0u);
}

TEST_F(ChunkLoaderTest, UpdateLoadsAtMostChunksPerTick) {
    VoxelWorld world(blocks, 8, 1);
    ChunkLoader loader(world, 2, 4);
    loader.setTarget({8, 0, 8});

    loader.update({8, 0, 8});
    EXPECT_EQ(world.getChunkCount(), 2u);
    EXPECT_EQ(loader.getLoadQueueSize(), 4u);

    // Loaded chunks were remeshed in the same tick
    EXPECT_EQ(loader.getMeshQueueSize(), 0u);
    for (VoxelChunk* chunk : world.getAllChunks()) {
        EXPECT_FALSE(chunk->isDirty());
    }

    loader.update({8, 0, 8});
    loader.update({8, 0, 8});
    EXPECT_EQ(world.getChunkCount(), 6u);
    EXPECT_EQ(loader.getLoadQueueSize(), 0u);

    // Nothing left to do
    loader.update({8, 0, 8});
    EXPECT_EQ(world.getChunkCount(), 6u);
}

TEST_F(ChunkLoaderTest, MovingAwayUnloadsAndSkipsStaleEntries) {
    VoxelWorld world(blocks, 8, 1);
    ChunkLoader loader(world, 2, 4);
    loader.update({8, 0, 8});
    ASSERT_EQ(world.getChunkCount(), 2u);
    ASSERT_EQ(loader.getLoadQueueSize(), 4u);

    // Chunk (7, 7) is far beyond the unload distance of everything loaded so far
    loader.update({120, 0, 120});

    EXPECT_EQ(world.getChunk({0, 0, 0}), nullptr);
    EXPECT_EQ(world.getChunkCount(), 2u);
    EXPECT_NE(world.getChunk({5, 0, 7}), nullptr);
    EXPECT_NE(world.getChunk({6, 0, 6}), nullptr);
    EXPECT_EQ(loader.getLoadQueueSize(), 4u);
}

TEST_F(ChunkLoaderTest, LoadedChunksAreGenerated) {
    VoxelWorld world(blocks, 4, 1);

    auto flat = std::make_shared<BiomeDefinition>();
    flat->id = "flat";
    flat->topBlock = blocks.get(BlockIds::GRASS);
    flat->fillerBlock = blocks.get(BlockIds::DIRT);
    flat->stoneBlock = blocks.get(BlockIds::STONE);
    flat->baseHeight = 10;
    flat->heightVariation = 0;
    flat->stoneStartHeight = 2;
    flat->waterLevel = 0;
    flat->treeChance = 0.0f;

    WorldGenerator generator(blocks, 1234);
    generator.setDefaultBiome(flat);
    generator.setWorld(&world);
    world.setWorldGenerator(&generator);

    ChunkLoader loader(world, 1, 3, 8, 8);
    loader.update({0, 0, 0});

    ASSERT_NE(world.getChunk({0, 0, 0}), nullptr);
    EXPECT_EQ(world.getBlock({3, 10, 3}), blocks.get(BlockIds::GRASS));
    EXPECT_EQ(world.getBlock({3, 9, 3}), blocks.get(BlockIds::DIRT));
    EXPECT_EQ(world.getBlock({3, 11, 3}), blocks.air());
    EXPECT_EQ(world.getBlock({3, 0, 3}), blocks.get(BlockIds::STONE));
    EXPECT_GT(world.getChunk({0, 0, 0})->getMesh().getQuadCount(), 0u);
}

TEST_F(ChunkLoaderTest, GeneratingANeighbourRemeshesLoadedChunks) {
    VoxelWorld world(blocks, 4, 1);

    auto flat = std::make_shared<BiomeDefinition>();
    flat->id = "flat";
    flat->topBlock = blocks.get(BlockIds::GRASS);
    flat->fillerBlock = blocks.get(BlockIds::DIRT);
    flat->stoneBlock = blocks.get(BlockIds::STONE);
    flat->baseHeight = 10;
    flat->heightVariation = 0;
    flat->stoneStartHeight = 2;
    flat->waterLevel = 0;
    flat->treeChance = 0.0f;

    WorldGenerator generator(blocks, 1234);
    generator.setDefaultBiome(flat);
    generator.setWorld(&world);
    world.setWorldGenerator(&generator);

    ChunkLoader loader(world, 1, 3, 1, 8);
    loader.update({0, 0, 0});

    VoxelChunk* origin = world.getChunk({0, 0, 0});
    ASSERT_NE(origin, nullptr);
    ASSERT_FALSE(origin->isDirty());
    size_t quadsAlone = origin->getMesh().getQuadCount();

    // Filling (0, 0, 1) buries the +Z side of the origin chunk
    loader.update({0, 0, 0});
    ASSERT_NE(world.getChunk({0, 0, 1}), nullptr);

    EXPECT_FALSE(origin->isDirty());
    EXPECT_LT(origin->getMesh().getQuadCount(), quadsAlone);
    EXPECT_EQ(loader.getMeshQueueSize(), 0u);
}

TEST_F(ChunkLoaderTest, ForceUpdateRequeuesUnloadedChunks) {
    VoxelWorld world(blocks, 8, 1);
    ChunkLoader loader(world, 1, 3, 8, 8);
    loader.update({8, 0, 8});
    ASSERT_EQ(world.getChunkCount(), 3u);

    world.unloadChunk({1, 0, 0});
    loader.forceUpdate();
    EXPECT_EQ(loader.getLoadQueueSize(), 1u);

    loader.update({8, 0, 8});
    EXPECT_EQ(world.getChunkCount(), 3u);
}
