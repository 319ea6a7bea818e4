#pragma once
#include <glm/glm.hpp>
#include <cstdint>
#include <random>

namespace Deepvale {

class BlockType;
class VoxelWorld;
struct TreeType;

/**
 * Places trees and bushes through VoxelWorld::requestBlockChange, so they may
 * spill into neighbouring chunks. Positions outside the world are skipped.
 * Leaves and bushes only replace air; trunks overwrite whatever is there.
 */
class VegetationGenerator {
public:
    // Returns the number of blocks written
    size_t generateTree(VoxelWorld& world, const glm::ivec3& base, const TreeType& tree, std::mt19937& rng) const;

    // A 3x3 leaf layer with sparse corners and a single block on top
    size_t generateBush(VoxelWorld& world, const glm::ivec3& base, const BlockType* leaves, std::mt19937& rng) const;

private:
    static bool placeIfAir(VoxelWorld& world, const glm::ivec3& pos, const BlockType* block);
};

} // namespace Deepvale
