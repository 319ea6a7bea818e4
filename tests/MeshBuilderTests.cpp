#include <gtest/gtest.h>

#include <memory>

#include <glm/glm.hpp>

#include "world/BlockRegistry.hpp"
#include "world/ChunkMeshBuilder.hpp"
#include "world/VoxelChunk.hpp"
#include "world/VoxelWorld.hpp"

using namespace Deepvale;

namespace {

class MeshBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        blocks.registerDefaults();
        stone = blocks.get(BlockIds::STONE);
        dirt = blocks.get(BlockIds::DIRT);
        water = blocks.get(BlockIds::WATER);
        leaves = blocks.get(BlockIds::OAK_LEAVES);
        naive = ChunkMeshBuilder::create(MesherType::NAIVE);
        greedy = ChunkMeshBuilder::create(MesherType::GREEDY);
    }

    void fillLayer(VoxelChunk& chunk, int32_t y, const BlockType* block) {
        for (int32_t x = 0; x < CHUNK_SIZE; x++) {
            for (int32_t z = 0; z < CHUNK_SIZE; z++) {
                chunk.setBlockLocal(x, y, z, block);
            }
        }
    }

    // Every triangle must face the way its normal points
    void expectWindingMatchesNormals(const ChunkMesh& mesh) {
        ASSERT_EQ(mesh.indices.size() % 3, 0u);
        for (size_t i = 0; i < mesh.indices.size(); i += 3) {
            const glm::vec3& a = mesh.vertices[mesh.indices[i]];
            const glm::vec3& b = mesh.vertices[mesh.indices[i + 1]];
            const glm::vec3& c = mesh.vertices[mesh.indices[i + 2]];
            glm::vec3 facing = glm::cross(b - a, c - a);
            EXPECT_GT(glm::dot(facing, mesh.normals[mesh.indices[i]]), 0.0f) << "triangle " << i / 3;
        }
    }

    BlockRegistry blocks;
    const BlockType* stone = nullptr;
    const BlockType* dirt = nullptr;
    const BlockType* water = nullptr;
    const BlockType* leaves = nullptr;
    std::unique_ptr<ChunkMeshBuilder> naive;
    std::unique_ptr<ChunkMeshBuilder> greedy;
};

} // namespace

TEST_F(MeshBuilderTest, EmptyChunkHasNoGeometry) {
    VoxelChunk chunk({0, 0, 0}, blocks.air());
    EXPECT_TRUE(naive->build(chunk, nullptr).isEmpty());
    EXPECT_TRUE(greedy->build(chunk, nullptr).isEmpty());
}

TEST_F(MeshBuilderTest, IsolatedBlockHasSixFaces) {
    VoxelChunk chunk({0, 0, 0}, blocks.air());
    chunk.setBlockLocal(8, 8, 8, stone);

    ChunkMesh mesh = naive->build(chunk, nullptr);
    EXPECT_EQ(mesh.getQuadCount(), 6u);
    EXPECT_EQ(mesh.vertices.size(), 24u);
    EXPECT_EQ(mesh.normals.size(), 24u);
    EXPECT_EQ(mesh.colors.size(), 24u);
    EXPECT_EQ(mesh.uvs.size(), 24u);
    EXPECT_EQ(mesh.indices.size(), 36u);
    EXPECT_EQ(mesh.colors.front(), stone->getColor());

    EXPECT_EQ(greedy->build(chunk, nullptr).getQuadCount(), 6u);
}

TEST_F(MeshBuilderTest, NaiveFacesFollowFixedOrder) {
    VoxelChunk chunk({0, 0, 0}, blocks.air());
    chunk.setBlockLocal(0, 0, 0, stone);

    ChunkMesh mesh = naive->build(chunk, nullptr);
    ASSERT_EQ(mesh.getQuadCount(), 6u);

    const glm::vec3 expected[6] = {
        {1, 0, 0}, {-1, 0, 0}, {0, 1, 0}, {0, -1, 0}, {0, 0, 1}, {0, 0, -1}
    };
    for (size_t face = 0; face < 6; face++) {
        EXPECT_EQ(mesh.normals[face * 4], expected[face]) << "face " << face;
    }
}

TEST_F(MeshBuilderTest, TrianglesWindTowardsTheirNormals) {
    VoxelChunk chunk({0, 0, 0}, blocks.air());
    chunk.setBlockLocal(8, 8, 8, stone);
    fillLayer(chunk, 2, dirt);
    chunk.setBlockLocal(4, 3, 4, stone);
    chunk.setBlockLocal(5, 3, 4, stone);
    chunk.setBlockLocal(4, 4, 4, leaves);

    ChunkMesh naiveMesh = naive->build(chunk, nullptr);
    ChunkMesh greedyMesh = greedy->build(chunk, nullptr);
    ASSERT_FALSE(naiveMesh.isEmpty());
    ASSERT_FALSE(greedyMesh.isEmpty());

    expectWindingMatchesNormals(naiveMesh);
    expectWindingMatchesNormals(greedyMesh);
}

TEST_F(MeshBuilderTest, SharedOpaqueFacesAreCulled) {
    VoxelChunk chunk({0, 0, 0}, blocks.air());
    chunk.setBlockLocal(4, 4, 4, stone);
    chunk.setBlockLocal(5, 4, 4, stone);

    EXPECT_EQ(naive->build(chunk, nullptr).getQuadCount(), 10u);
    // Same block type merges into one quad per side
    EXPECT_EQ(greedy->build(chunk, nullptr).getQuadCount(), 6u);
}

TEST_F(MeshBuilderTest, DifferentBlocksDoNotMerge) {
    VoxelChunk chunk({0, 0, 0}, blocks.air());
    chunk.setBlockLocal(4, 4, 4, stone);
    chunk.setBlockLocal(5, 4, 4, dirt);

    EXPECT_EQ(naive->build(chunk, nullptr).getQuadCount(), 10u);
    EXPECT_EQ(greedy->build(chunk, nullptr).getQuadCount(), 10u);
}

TEST_F(MeshBuilderTest, NonSolidBlocksEmitNothing) {
    VoxelChunk chunk({0, 0, 0}, blocks.air());
    chunk.setBlockLocal(3, 3, 3, water);

    EXPECT_TRUE(naive->build(chunk, nullptr).isEmpty());
    EXPECT_TRUE(greedy->build(chunk, nullptr).isEmpty());
}

TEST_F(MeshBuilderTest, TransparentNeighbourKeepsFaceVisible) {
    VoxelChunk chunk({0, 0, 0}, blocks.air());
    chunk.setBlockLocal(4, 4, 4, stone);
    chunk.setBlockLocal(5, 4, 4, leaves);

    // Stone keeps its face toward the leaves; the leaves lose theirs toward stone
    EXPECT_EQ(naive->build(chunk, nullptr).getQuadCount(), 11u);
    EXPECT_EQ(greedy->build(chunk, nullptr).getQuadCount(), 11u);
}

TEST_F(MeshBuilderTest, FullLayerMergesGreedily) {
    VoxelChunk chunk({0, 0, 0}, blocks.air());
    fillLayer(chunk, 5, stone);

    EXPECT_EQ(naive->build(chunk, nullptr).getQuadCount(), 2u * 256u + 4u * 16u);
    EXPECT_EQ(greedy->build(chunk, nullptr).getQuadCount(), 6u);
}

TEST_F(MeshBuilderTest, GreedyQuadSpansMergedArea) {
    VoxelChunk chunk({0, 0, 0}, blocks.air());
    fillLayer(chunk, 0, stone);

    ChunkMesh mesh = greedy->build(chunk, nullptr);
    bool foundTop = false;
    for (size_t quad = 0; quad < mesh.getQuadCount(); quad++) {
        if (mesh.normals[quad * 4] != glm::vec3(0, 1, 0)) {
            continue;
        }
        foundTop = true;
        glm::vec3 minCorner(1e9f);
        glm::vec3 maxCorner(-1e9f);
        for (size_t v = 0; v < 4; v++) {
            minCorner = glm::min(minCorner, mesh.vertices[quad * 4 + v]);
            maxCorner = glm::max(maxCorner, mesh.vertices[quad * 4 + v]);
        }
        EXPECT_EQ(minCorner, glm::vec3(0, 1, 0));
        EXPECT_EQ(maxCorner, glm::vec3(16, 1, 16));
    }
    EXPECT_TRUE(foundTop);
}

TEST_F(MeshBuilderTest, WorldFloorHidesBottomFaces) {
    VoxelWorld world(blocks, 1, 1);
    world.initialize();
    ASSERT_TRUE(world.requestBlockChange({8, 0, 8}, stone));

    VoxelChunk* chunk = world.getChunk({0, 0, 0});
    ASSERT_NE(chunk, nullptr);

    // Below y = 0 reads as solid; the other outside positions read as air
    EXPECT_EQ(naive->build(*chunk, &world).getQuadCount(), 5u);
    EXPECT_EQ(greedy->build(*chunk, &world).getQuadCount(), 5u);
}

TEST_F(MeshBuilderTest, NeighbourChunkCullsBoundaryFaces) {
    VoxelWorld world(blocks, 2, 1);
    world.initialize();
    world.requestBlockChange({15, 4, 4}, stone);
    world.requestBlockChange({16, 4, 4}, stone);

    VoxelChunk* left = world.getChunk({0, 0, 0});
    VoxelChunk* right = world.getChunk({1, 0, 0});
    ASSERT_NE(left, nullptr);
    ASSERT_NE(right, nullptr);

    EXPECT_EQ(naive->build(*left, &world).getQuadCount(), 5u);
    EXPECT_EQ(naive->build(*right, &world).getQuadCount(), 5u);

    // Without a world the boundary face is visible again
    EXPECT_EQ(naive->build(*left, nullptr).getQuadCount(), 6u);
}
