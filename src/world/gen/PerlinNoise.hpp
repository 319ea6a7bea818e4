#pragma once
#include <FastNoise/FastNoise.h>
#include <cstdint>

namespace Deepvale {

/**
 * Seeded Perlin noise remapped to [0, 1].
 * Integer lattice points sample to 0.5.
 */
class PerlinNoise {
public:
    explicit PerlinNoise(int32_t seed = 0);

    float sample(float x, float y) const;
    float sample(float x, float y, float z) const;

    /**
     * Fractal (fBm) 2D noise normalised back to [0, 1].
     * Octave i samples at frequency lacunarity^i with amplitude persistence^i.
     */
    float fractal(float x, float y, int32_t octaves, float persistence, float lacunarity) const;

    int32_t getSeed() const { return m_seed; }

private:
    int32_t m_seed;
    FastNoise::SmartNode<FastNoise::Perlin> m_generator;
};

} // namespace Deepvale
