#pragma once

#include <glm/glm.hpp>
#include <cstdint>

namespace Deepvale {

class BlockType;
class VoxelChunk;

// Fills chunks with terrain; implementations must be deterministic per seed
class IWorldGenerator {
public:
    virtual ~IWorldGenerator() = default;

    virtual void generateChunk(VoxelChunk& chunk) = 0;

    // Terrain block a position would receive, before ores and vegetation
    virtual const BlockType* getBlockAt(const glm::ivec3& worldPos) const = 0;

    virtual int32_t getSurfaceHeight(int32_t x, int32_t z) const = 0;
    virtual int32_t getSeed() const = 0;
};

} // namespace Deepvale
