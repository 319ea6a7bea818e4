#include "OreGenerator.hpp"
#include "BiomeDefinition.hpp"
#include "world/VoxelChunk.hpp"
#include <random>
#include <tracy/Tracy.hpp>

namespace Deepvale {

namespace {

// Separate stream from the terrain offsets
constexpr uint32_t ORE_SEED_SALT = 7919;

} // namespace

OreGenerator::OreGenerator(int32_t seed)
    : m_seed(seed), m_noise(static_cast<int32_t>(static_cast<uint32_t>(seed) + ORE_SEED_SALT)) {
    std::mt19937 rng(static_cast<uint32_t>(seed) + ORE_SEED_SALT);
    std::uniform_real_distribution<float> offset(0.0f, 10000.0f);
    m_seedOffset.x = offset(rng);
    m_seedOffset.y = offset(rng);
    m_seedOffset.z = offset(rng);
}

float OreGenerator::getOreNoise(const glm::ivec3& worldPos, float scale) const {
    glm::vec3 p = (glm::vec3(worldPos) + m_seedOffset) * scale;

    float xy = m_noise.sample(p.x, p.y);
    float yz = m_noise.sample(p.y, p.z);
    float xz = m_noise.sample(p.x, p.z);
    return xy * yz * xz;
}

bool OreGenerator::shouldPlaceOre(const glm::ivec3& worldPos, const OreConfig& config, int32_t surfaceHeight) const {
    if (!config.ore) {
        return false;
    }

    int32_t depth = surfaceHeight - worldPos.y;
    if (depth < config.minDepth || depth > config.maxDepth) {
        return false;
    }

    return getOreNoise(worldPos, config.noiseScale) < config.spawnChance;
}

const BlockType* OreGenerator::getOreAt(const glm::ivec3& worldPos, const std::vector<OreConfig>& ores,
                                        int32_t surfaceHeight, const BlockType* stoneBlock,
                                        const BlockType* currentBlock) const {
    if (!stoneBlock || currentBlock != stoneBlock) {
        return nullptr;
    }

    for (const auto& config : ores) {
        if (shouldPlaceOre(worldPos, config, surfaceHeight)) {
            return config.ore;
        }
    }
    return nullptr;
}

size_t OreGenerator::generateOres(VoxelChunk& chunk, const ChunkColumns& columns) const {
    ZoneScoped;

    glm::ivec3 origin = chunk.getWorldOrigin();
    size_t placed = 0;

    for (int32_t x = 0; x < CHUNK_SIZE; x++) {
        for (int32_t z = 0; z < CHUNK_SIZE; z++) {
            const ColumnSample& column = columns[columnIndex(x, z)];
            if (!column.biome || column.biome->ores.empty()) {
                continue;
            }

            for (int32_t y = 0; y < CHUNK_SIZE; y++) {
                const BlockType* current = chunk.getBlockLocal(x, y, z);
                if (current != column.biome->stoneBlock) {
                    continue;
                }

                glm::ivec3 worldPos = origin + glm::ivec3(x, y, z);
                const BlockType* ore = getOreAt(worldPos, column.biome->ores, column.surfaceHeight,
                                                column.biome->stoneBlock, current);
                if (ore && chunk.setBlockLocal(x, y, z, ore)) {
                    placed++;
                }
            }
        }
    }
    return placed;
}

} // namespace Deepvale
