#pragma once

#include "BlockType.hpp"
#include "ChunkMesh.hpp"
#include <glm/glm.hpp>
#include <fmt/format.h>
#include <array>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace Deepvale {

class BlockGetter;
class BlockRegistry;
class ChunkMeshBuilder;

constexpr int32_t CHUNK_SIZE = 16;
constexpr int32_t CHUNK_VOLUME = CHUNK_SIZE * CHUNK_SIZE * CHUNK_SIZE;

// World units per block edge
constexpr float BLOCK_SIZE = 0.5f;

struct ChunkPosition {
    int32_t x, y, z;

    bool operator==(const ChunkPosition& other) const {
        return x == other.x && y == other.y && z == other.z;
    }

    bool operator!=(const ChunkPosition& other) const {
        return !(*this == other);
    }

    // Order: +X, -X, +Y, -Y, +Z, -Z
    static constexpr std::array<glm::ivec3, 6> getFaceNeighborOffsets() {
        return {{
            { 1,  0,  0},
            {-1,  0,  0},
            { 0,  1,  0},
            { 0, -1,  0},
            { 0,  0,  1},
            { 0,  0, -1}
        }};
    }

    ChunkPosition getNeighbor(int32_t dx, int32_t dy, int32_t dz) const {
        return {x + dx, y + dy, z + dz};
    }

    glm::ivec3 toIVec3() const { return {x, y, z}; }
};

struct ChunkPositionHash {
    std::size_t operator()(const ChunkPosition& pos) const {
        std::size_t h1 = std::hash<int32_t>{}(pos.x);
        std::size_t h2 = std::hash<int32_t>{}(pos.y);
        std::size_t h3 = std::hash<int32_t>{}(pos.z);
        return h1 ^ (h2 << 1) ^ (h3 << 2);
    }
};

/**
 * A 16x16x16 block grid. Cells hold registry-owned BlockType pointers and are
 * never null; empty cells hold the air sentinel.
 */
class VoxelChunk {
public:
    // (worldPosition, oldBlock, newBlock)
    using BlockChangedCallback = std::function<void(const glm::ivec3&, const BlockType*, const BlockType*)>;

    VoxelChunk(const ChunkPosition& position, const BlockType* air);

    VoxelChunk(const VoxelChunk&) = delete;
    VoxelChunk& operator=(const VoxelChunk&) = delete;

    const ChunkPosition& getPosition() const { return position_; }
    glm::ivec3 getWorldOrigin() const { return position_.toIVec3() * CHUNK_SIZE; }
    const BlockType* getAir() const { return air_; }

    // Air when out of range
    const BlockType* getBlockLocal(int32_t x, int32_t y, int32_t z) const;
    const BlockType* getBlockLocal(const glm::ivec3& local) const { return getBlockLocal(local.x, local.y, local.z); }

    /**
     * Store a block at a local position. Null stores air.
     * Returns true only when the stored block changed; the chunk is then
     * marked dirty and the block-changed callback runs.
     * Out-of-range positions and identical values return false.
     */
    bool setBlockLocal(int32_t x, int32_t y, int32_t z, const BlockType* block);
    bool setBlockLocal(const glm::ivec3& local, const BlockType* block) { return setBlockLocal(local.x, local.y, local.z, block); }

    static bool isLocalPositionValid(int32_t x, int32_t y, int32_t z) {
        return x >= 0 && x < CHUNK_SIZE && y >= 0 && y < CHUNK_SIZE && z >= 0 && z < CHUNK_SIZE;
    }

    static int32_t getIndex(int32_t x, int32_t y, int32_t z) {
        return x + y * CHUNK_SIZE + z * CHUNK_SIZE * CHUNK_SIZE;
    }

    static ChunkPosition worldToChunkPosition(const glm::ivec3& worldPos);
    static glm::ivec3 worldToLocal(const glm::ivec3& worldPos, const ChunkPosition& chunkPos);

    bool isDirty() const { return isDirty_; }
    void markDirty() { isDirty_ = true; }
    void clearDirty() { isDirty_ = false; }

    // Rebuilds the whole mesh synchronously and clears the dirty flag
    void rebuildMesh(const ChunkMeshBuilder& builder, const BlockGetter* world);
    // Returns true if a rebuild happened
    bool rebuildMeshIfDirty(const ChunkMeshBuilder& builder, const BlockGetter* world);

    const ChunkMesh& getMesh() const { return mesh_; }

    void setBlockChangedCallback(BlockChangedCallback callback) { onBlockChanged_ = std::move(callback); }

    size_t countNonAir() const;

    // Block ids in index order, for saving
    std::vector<std::string> getBlockIds() const;

    // Replaces every cell from ids in index order; unknown ids become air.
    // Does not fire the block-changed callback.
    bool loadBlockIds(const std::vector<std::string>& ids, const BlockRegistry& registry);

    // Back to an all-air dirty chunk at a new position, callback detached
    void reset(const ChunkPosition& position);

private:
    ChunkPosition position_;
    const BlockType* air_;
    std::array<const BlockType*, CHUNK_VOLUME> blocks_;
    ChunkMesh mesh_;
    bool isDirty_ = true;
    BlockChangedCallback onBlockChanged_;
};

} // namespace Deepvale

template<>
struct fmt::formatter<Deepvale::ChunkPosition> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const Deepvale::ChunkPosition& pos, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "({}, {}, {})", pos.x, pos.y, pos.z);
    }
};
