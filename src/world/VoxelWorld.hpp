#pragma once

#include "BlockGetter.hpp"
#include "BlockRegistry.hpp"
#include "ChunkMeshBuilder.hpp"
#include "VoxelChunk.hpp"
#include <glm/glm.hpp>
#include <memory>
#include <unordered_map>
#include <vector>

namespace Deepvale {

class ChunkPool;
class IWorldGenerator;

/**
 * Owns every loaded chunk and is the only place chunks are created or destroyed.
 *
 * The world has declared bounds of sizeInChunks x heightInChunks x sizeInChunks
 * chunks starting at the origin. Chunks are only loaded inside those bounds,
 * and every read outside a loaded chunk returns air.
 *
 * Single-threaded: all calls are expected from the thread that drives the world.
 */
class VoxelWorld : public BlockGetter {
public:
    using ChunkMap = std::unordered_map<ChunkPosition, std::unique_ptr<VoxelChunk>, ChunkPositionHash>;

    VoxelWorld(const BlockRegistry& blocks, int32_t sizeInChunks = 4, int32_t heightInChunks = 2);
    ~VoxelWorld() override;

    VoxelWorld(const VoxelWorld&) = delete;
    VoxelWorld& operator=(const VoxelWorld&) = delete;

    // Creates the full chunk grid; later calls do nothing
    void initialize();
    bool isInitialized() const { return initialized_; }

    void setMesherType(MesherType type);
    void setWorldGenerator(IWorldGenerator* generator) { generator_ = generator; }
    IWorldGenerator* getWorldGenerator() const { return generator_; }

    // Not owned; must outlive the world
    void setChunkPool(ChunkPool* pool) { pool_ = pool; }

    // BlockGetter
    const BlockType* getBlock(const glm::ivec3& worldPos) const override;
    bool isPositionValid(const glm::ivec3& worldPos) const override;

    /**
     * Apply a block change synchronously. Returns false when no loaded chunk
     * owns the position or the stored block already matches. When the stored
     * block actually changes, the owning chunk and any loaded chunk sharing
     * the touched boundary face are marked dirty, and a BlockChangedEvent is
     * posted.
     */
    bool requestBlockChange(const glm::ivec3& worldPos, const BlockType* block);

    VoxelChunk* getChunkAt(const glm::ivec3& worldPos) const;
    VoxelChunk* getChunk(const ChunkPosition& chunkPos) const;
    std::vector<VoxelChunk*> getAllChunks() const;
    size_t getChunkCount() const { return chunks_.size(); }
    bool isChunkInBounds(const ChunkPosition& chunkPos) const;

    VoxelChunk* loadOrCreateChunk(const ChunkPosition& chunkPos);
    void unloadChunk(const ChunkPosition& chunkPos);

    // Remeshes dirty chunks only; returns how many were rebuilt
    size_t rebuildDirtyChunks();
    void rebuildAllChunks();
    void rebuildChunkMesh(VoxelChunk* chunk);
    bool rebuildChunkMeshIfDirty(VoxelChunk* chunk);

    // Runs the attached generator over every loaded chunk, then remeshes all
    void generateWithWorldGenerator();

    // Fills y in [0, groundHeight) across the world with one block
    void generateFlatTerrain(int32_t groundHeight, const BlockType* groundBlock);

    // Float world-space position (world units, not blocks) to chunk coordinate
    ChunkPosition worldToChunkPos(const glm::vec3& worldPos) const;

    const BlockRegistry& getBlockRegistry() const { return blocks_; }
    const BlockType* air() const { return blocks_.air(); }

    int32_t getSizeInChunks() const { return sizeInChunks_; }
    int32_t getHeightInChunks() const { return heightInChunks_; }
    int32_t getSizeInBlocks() const { return sizeInChunks_ * CHUNK_SIZE; }
    int32_t getHeightInBlocks() const { return heightInChunks_ * CHUNK_SIZE; }

private:
    VoxelChunk* createChunk(const ChunkPosition& chunkPos);
    void handleBlockChanged(const glm::ivec3& worldPos, const BlockType* oldBlock, const BlockType* newBlock);
    void markNeighborsDirtyIfOnBoundary(const glm::ivec3& worldPos);
    void markChunkDirty(const ChunkPosition& chunkPos);
    void postMeshRebuilt(const VoxelChunk& chunk);

    const BlockRegistry& blocks_;
    int32_t sizeInChunks_;
    int32_t heightInChunks_;
    bool initialized_ = false;

    ChunkMap chunks_;
    std::unique_ptr<ChunkMeshBuilder> meshBuilder_;
    IWorldGenerator* generator_ = nullptr;
    ChunkPool* pool_ = nullptr;
};

} // namespace Deepvale
