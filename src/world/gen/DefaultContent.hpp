#pragma once
#include "BiomeDefinition.hpp"
#include <memory>
#include <vector>

namespace Deepvale {

class BlockRegistry;

// Built-in biomes used when the data directory provides none
class DefaultContent {
public:
    static std::shared_ptr<BiomeDefinition> createForest(const BlockRegistry& blocks);
    static std::shared_ptr<BiomeDefinition> createDesert(const BlockRegistry& blocks);
    static std::shared_ptr<BiomeDefinition> createPlains(const BlockRegistry& blocks);

    // Forest, desert, plains; expects the default blocks to be registered
    static std::vector<std::shared_ptr<BiomeDefinition>> createBiomes(const BlockRegistry& blocks);
};

} // namespace Deepvale
