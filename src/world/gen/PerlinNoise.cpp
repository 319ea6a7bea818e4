#include "PerlinNoise.hpp"
#include "util/MathHelper.hpp"
#include <algorithm>

namespace Deepvale {

PerlinNoise::PerlinNoise(int32_t seed)
    : m_seed(seed), m_generator(FastNoise::New<FastNoise::Perlin>()) {
}

float PerlinNoise::sample(float x, float y) const {
    float value = m_generator->GenSingle2D(x, y, m_seed);
    return MathHelper::clamp01(value * 0.5f + 0.5f);
}

float PerlinNoise::sample(float x, float y, float z) const {
    float value = m_generator->GenSingle3D(x, y, z, m_seed);
    return MathHelper::clamp01(value * 0.5f + 0.5f);
}

float PerlinNoise::fractal(float x, float y, int32_t octaves, float persistence, float lacunarity) const {
    octaves = std::max(1, octaves);

    float amplitude = 1.0f;
    float frequency = 1.0f;
    float total = 0.0f;
    float maxValue = 0.0f;

    for (int32_t i = 0; i < octaves; i++) {
        total += sample(x * frequency, y * frequency) * amplitude;
        maxValue += amplitude;
        amplitude *= persistence;
        frequency *= lacunarity;
    }

    if (maxValue <= 0.0f) {
        return 0.5f;
    }
    return total / maxValue;
}

} // namespace Deepvale
