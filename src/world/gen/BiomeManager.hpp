#pragma once
#include "BiomeDefinition.hpp"
#include "PerlinNoise.hpp"
#include <cstdint>
#include <memory>
#include <vector>

namespace Deepvale {

/**
 * Picks a biome per world column from low-frequency 2D noise.
 * The noise value in [0, 1] is split into equal bands, one per biome, in the
 * order the biomes were given.
 */
class BiomeManager {
public:
    explicit BiomeManager(float biomeScale = 0.005f);

    void setBiomes(std::vector<std::shared_ptr<BiomeDefinition>> biomes);
    const std::vector<std::shared_ptr<BiomeDefinition>>& getAllBiomes() const { return m_biomes; }

    // Null (with a warning) when no biomes are configured
    const BiomeDefinition* getBiomeAt(int32_t x, int32_t z) const;

    void setSeed(int32_t seed);
    float getSeedOffset() const { return m_seedOffset; }

    void setBiomeScale(float scale) { m_biomeScale = scale; }
    float getBiomeScale() const { return m_biomeScale; }

private:
    std::vector<std::shared_ptr<BiomeDefinition>> m_biomes;
    float m_biomeScale;
    float m_seedOffset = 0.0f;
    PerlinNoise m_noise;
};

} // namespace Deepvale
