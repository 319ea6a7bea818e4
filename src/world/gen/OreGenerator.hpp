#pragma once
#include "ChunkColumns.hpp"
#include "OreConfig.hpp"
#include "PerlinNoise.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <vector>

namespace Deepvale {

class BiomeDefinition;
class VoxelChunk;

/**
 * Replaces stone with ore veins. The vein noise at a position is the product
 * of three 2D Perlin planes (XY, YZ, XZ), which gives elongated pockets.
 */
class OreGenerator {
public:
    explicit OreGenerator(int32_t seed);

    // Product of the three planes at `worldPos`, in [0, 1]
    float getOreNoise(const glm::ivec3& worldPos, float scale) const;

    bool shouldPlaceOre(const glm::ivec3& worldPos, const OreConfig& config, int32_t surfaceHeight) const;

    // First matching ore, or null; only stone can turn into ore
    const BlockType* getOreAt(const glm::ivec3& worldPos, const std::vector<OreConfig>& ores,
                              int32_t surfaceHeight, const BlockType* stoneBlock,
                              const BlockType* currentBlock) const;

    // Returns the number of blocks replaced
    size_t generateOres(VoxelChunk& chunk, const ChunkColumns& columns) const;

    int32_t getSeed() const { return m_seed; }

private:
    int32_t m_seed;
    glm::vec3 m_seedOffset;
    PerlinNoise m_noise;
};

} // namespace Deepvale
