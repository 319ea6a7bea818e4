#include "DefaultContent.hpp"
#include "world/BlockRegistry.hpp"

namespace Deepvale {

namespace {

TreeType oakTree(const BlockRegistry& blocks, int32_t minHeight, int32_t maxHeight) {
    TreeType tree;
    tree.trunk = blocks.get(BlockIds::OAK_WOOD);
    tree.leaves = blocks.get(BlockIds::OAK_LEAVES);
    tree.minTrunkHeight = minHeight;
    tree.maxTrunkHeight = maxHeight;
    tree.leafRadius = 2;
    return tree;
}

} // namespace

std::shared_ptr<BiomeDefinition> DefaultContent::createForest(const BlockRegistry& blocks) {
    auto biome = std::make_shared<BiomeDefinition>();
    biome->id = "forest";
    biome->name = "Forest";
    biome->topBlock = blocks.get(BlockIds::GRASS);
    biome->fillerBlock = blocks.get(BlockIds::DIRT);
    biome->stoneBlock = blocks.get(BlockIds::STONE);
    biome->waterBlock = blocks.get(BlockIds::WATER);
    biome->beachBlock = blocks.get(BlockIds::SAND);
    biome->baseHeight = 32;
    biome->heightVariation = 16;
    biome->fillerDepth = 4;
    biome->stoneStartHeight = 20;
    biome->waterLevel = 28;
    biome->beachHeight = 2;
    biome->treeChance = 0.03f;
    biome->treeTypes.push_back(oakTree(blocks, 4, 7));
    biome->ores = {
        {blocks.get(BlockIds::COAL_ORE), 3, 80, 0.08f, 0.12f},
        {blocks.get(BlockIds::IRON_ORE), 10, 64, 0.06f, 0.10f},
        {blocks.get(BlockIds::GOLD_ORE), 25, 48, 0.03f, 0.08f},
        {blocks.get(BlockIds::DIAMOND_ORE), 35, 64, 0.01f, 0.05f},
    };
    biome->validate();
    return biome;
}

std::shared_ptr<BiomeDefinition> DefaultContent::createDesert(const BlockRegistry& blocks) {
    auto biome = std::make_shared<BiomeDefinition>();
    biome->id = "desert";
    biome->name = "Desert";
    biome->topBlock = blocks.get(BlockIds::SAND);
    biome->fillerBlock = blocks.get(BlockIds::SAND);
    biome->stoneBlock = blocks.get(BlockIds::STONE);
    biome->waterBlock = blocks.get(BlockIds::WATER);
    biome->beachBlock = blocks.get(BlockIds::SAND);
    biome->baseHeight = 30;
    biome->heightVariation = 8;
    biome->fillerDepth = 6;
    biome->stoneStartHeight = 18;
    biome->waterLevel = 20;
    biome->beachHeight = 1;
    biome->treeChance = 0.0f;
    biome->ores = {
        {blocks.get(BlockIds::COAL_ORE), 5, 70, 0.05f, 0.12f},
        {blocks.get(BlockIds::IRON_ORE), 15, 55, 0.05f, 0.10f},
        {blocks.get(BlockIds::GOLD_ORE), 20, 40, 0.05f, 0.08f},
    };
    biome->validate();
    return biome;
}

std::shared_ptr<BiomeDefinition> DefaultContent::createPlains(const BlockRegistry& blocks) {
    auto biome = std::make_shared<BiomeDefinition>();
    biome->id = "plains";
    biome->name = "Plains";
    biome->topBlock = blocks.get(BlockIds::GRASS);
    biome->fillerBlock = blocks.get(BlockIds::DIRT);
    biome->stoneBlock = blocks.get(BlockIds::STONE);
    biome->waterBlock = blocks.get(BlockIds::WATER);
    biome->beachBlock = blocks.get(BlockIds::SAND);
    biome->baseHeight = 34;
    biome->heightVariation = 6;
    biome->fillerDepth = 4;
    biome->stoneStartHeight = 22;
    biome->waterLevel = 28;
    biome->beachHeight = 2;
    biome->treeChance = 0.005f;
    biome->treeTypes.push_back(oakTree(blocks, 3, 5));
    biome->ores = {
        {blocks.get(BlockIds::COAL_ORE), 4, 75, 0.07f, 0.12f},
        {blocks.get(BlockIds::IRON_ORE), 12, 60, 0.055f, 0.10f},
        {blocks.get(BlockIds::GOLD_ORE), 28, 44, 0.025f, 0.08f},
    };
    biome->validate();
    return biome;
}

std::vector<std::shared_ptr<BiomeDefinition>> DefaultContent::createBiomes(const BlockRegistry& blocks) {
    return {createForest(blocks), createDesert(blocks), createPlains(blocks)};
}

} // namespace Deepvale
