#pragma once
#include "world/VoxelChunk.hpp"
#include <array>
#include <cstdint>

namespace Deepvale {

class BiomeDefinition;

// Biome and surface height of one world column
struct ColumnSample {
    const BiomeDefinition* biome = nullptr;
    int32_t surfaceHeight = 0;
};

// Indexed by localX + localZ * CHUNK_SIZE
using ChunkColumns = std::array<ColumnSample, CHUNK_SIZE * CHUNK_SIZE>;

inline int32_t columnIndex(int32_t localX, int32_t localZ) {
    return localX + localZ * CHUNK_SIZE;
}

} // namespace Deepvale
