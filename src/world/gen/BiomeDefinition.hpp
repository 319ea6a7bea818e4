#pragma once
#include "OreConfig.hpp"
#include "TreeType.hpp"
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace Deepvale {

/**
 * Static terrain parameters for one biome. Block references point into the
 * BlockRegistry the biome was built against; water and beach may be null.
 */
class BiomeDefinition {
public:
    std::string id;
    std::string name;

    const BlockType* topBlock = nullptr;
    const BlockType* fillerBlock = nullptr;
    const BlockType* stoneBlock = nullptr;
    const BlockType* waterBlock = nullptr;
    const BlockType* beachBlock = nullptr;

    int32_t baseHeight = 32;
    int32_t heightVariation = 16;
    int32_t fillerDepth = 3;
    int32_t stoneStartHeight = 20;
    int32_t waterLevel = 28;
    int32_t beachHeight = 2;

    float treeChance = 0.02f;
    float bushChance = 0.0f;
    std::vector<TreeType> treeTypes;

    // Null falls back to the leaves of the first tree type
    const BlockType* bushBlock = nullptr;

    // Checked in order; the first ore that passes wins
    std::vector<OreConfig> ores;

    // Null when the biome has no trees
    const TreeType* getRandomTreeType(std::mt19937& rng) const;

    const BlockType* getBushBlock() const;

    // Clamps heights and chances into their usable ranges
    void validate();

    // `id` is not part of the JSON; the loader passes the file stem
    static Codec<BiomeDefinition> codec(const BlockRegistry& blocks, const std::string& id);
};

} // namespace Deepvale
