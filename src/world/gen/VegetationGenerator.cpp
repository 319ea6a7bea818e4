#include "VegetationGenerator.hpp"
#include "TreeType.hpp"
#include "world/VoxelWorld.hpp"
#include <algorithm>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace Deepvale {

bool VegetationGenerator::placeIfAir(VoxelWorld& world, const glm::ivec3& pos, const BlockType* block) {
    if (!world.isPositionValid(pos)) {
        return false;
    }
    if (!world.getBlock(pos)->isAir()) {
        return false;
    }
    return world.requestBlockChange(pos, block);
}

size_t VegetationGenerator::generateTree(VoxelWorld& world, const glm::ivec3& base, const TreeType& tree, std::mt19937& rng) const {
    if (!tree.trunk || !tree.leaves) {
        spdlog::warn("Tree type is missing its trunk or leaves block");
        return 0;
    }

    std::uniform_int_distribution<int32_t> heightRoll(tree.minTrunkHeight, std::max(tree.minTrunkHeight, tree.maxTrunkHeight));
    std::uniform_real_distribution<float> chance(0.0f, 1.0f);

    size_t written = 0;
    int32_t trunkHeight = heightRoll(rng);
    for (int32_t y = 0; y < trunkHeight; y++) {
        glm::ivec3 trunkPos = base + glm::ivec3(0, y, 0);
        if (world.isPositionValid(trunkPos) && world.requestBlockChange(trunkPos, tree.trunk)) {
            written++;
        }
    }

    int32_t top = base.y + trunkHeight;
    for (int32_t y = top - tree.leafRadius; y <= top + tree.leafRadius; y++) {
        int32_t radius = std::max(1, tree.leafRadius - std::abs(y - top) / 2);

        for (int32_t x = -radius; x <= radius; x++) {
            for (int32_t z = -radius; z <= radius; z++) {
                // Corners are ragged
                if (std::abs(x) == radius && std::abs(z) == radius && chance(rng) > 0.5f) {
                    continue;
                }
                if (x == 0 && z == 0 && y < top) {
                    continue;
                }
                if (placeIfAir(world, {base.x + x, y, base.z + z}, tree.leaves)) {
                    written++;
                }
            }
        }
    }
    return written;
}

size_t VegetationGenerator::generateBush(VoxelWorld& world, const glm::ivec3& base, const BlockType* leaves, std::mt19937& rng) const {
    if (!leaves) {
        return 0;
    }

    std::uniform_real_distribution<float> chance(0.0f, 1.0f);
    size_t written = 0;

    for (int32_t y = 0; y < 2; y++) {
        int32_t radius = y == 0 ? 1 : 0;
        for (int32_t x = -radius; x <= radius; x++) {
            for (int32_t z = -radius; z <= radius; z++) {
                if (y == 0 && std::abs(x) == 1 && std::abs(z) == 1 && chance(rng) > 0.3f) {
                    continue;
                }
                if (placeIfAir(world, base + glm::ivec3(x, y, z), leaves)) {
                    written++;
                }
            }
        }
    }
    return written;
}

} // namespace Deepvale
