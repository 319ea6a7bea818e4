#include "BiomeManager.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace Deepvale {

BiomeManager::BiomeManager(float biomeScale)
    : m_biomeScale(biomeScale) {
}

void BiomeManager::setBiomes(std::vector<std::shared_ptr<BiomeDefinition>> biomes) {
    m_biomes = std::move(biomes);
    std::erase(m_biomes, nullptr);
    spdlog::debug("Biome manager configured with {} biomes", m_biomes.size());
}

const BiomeDefinition* BiomeManager::getBiomeAt(int32_t x, int32_t z) const {
    if (m_biomes.empty()) {
        spdlog::warn("No biomes configured");
        return nullptr;
    }

    if (m_biomes.size() == 1) {
        return m_biomes.front().get();
    }

    float noise = m_noise.sample(
        (static_cast<float>(x) + m_seedOffset) * m_biomeScale,
        (static_cast<float>(z) + m_seedOffset) * m_biomeScale);

    int32_t count = static_cast<int32_t>(m_biomes.size());
    int32_t index = static_cast<int32_t>(std::floor(noise * static_cast<float>(count)));
    index = std::clamp(index, 0, count - 1);
    return m_biomes[index].get();
}

void BiomeManager::setSeed(int32_t seed) {
    // Kept under 10000 so float sample coordinates stay precise for large seeds
    m_seedOffset = static_cast<float>(std::fmod(static_cast<double>(seed) * 0.1, 10000.0));
    m_noise = PerlinNoise(seed);
}

} // namespace Deepvale
