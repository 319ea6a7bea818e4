#pragma once
#include "BlockType.hpp"
#include "gen/Registry.hpp"
#include <filesystem>
#include <string>

namespace Deepvale {

// Ids of the built-in block catalog
namespace BlockIds {
    inline constexpr const char* AIR = BlockType::AIR_ID;
    inline constexpr const char* GRASS = "grass";
    inline constexpr const char* DIRT = "dirt";
    inline constexpr const char* STONE = "stone";
    inline constexpr const char* SAND = "sand";
    inline constexpr const char* WATER = "water";
    inline constexpr const char* OAK_WOOD = "oak_wood";
    inline constexpr const char* OAK_LEAVES = "oak_leaves";
    inline constexpr const char* COAL_ORE = "coal_ore";
    inline constexpr const char* IRON_ORE = "iron_ore";
    inline constexpr const char* GOLD_ORE = "gold_ore";
    inline constexpr const char* DIAMOND_ORE = "diamond_ore";
}

/**
 * Owns every BlockType a world uses. The Air sentinel is always present.
 * Registered blocks are never replaced, so their addresses stay valid for the
 * registry's lifetime.
 */
class BlockRegistry {
public:
    BlockRegistry();

    BlockRegistry(const BlockRegistry&) = delete;
    BlockRegistry& operator=(const BlockRegistry&) = delete;

    // Returns the registered block, or the existing one when the id is taken
    const BlockType* registerBlock(const std::string& id, const BlockType::Properties& properties);

    // Grass, dirt, stone, sand, water, oak wood and leaves, four ores
    void registerDefaults();

    // One JSON file per block; returns false when nothing could be loaded
    bool loadFromDirectory(const std::filesystem::path& directory);

    const BlockType* air() const { return air_; }
    const BlockType* get(const std::string& id) const;
    const BlockType* getOrAir(const std::string& id) const;
    bool contains(const std::string& id) const { return blocks_.contains(id); }
    size_t size() const { return blocks_.size(); }

    void freeze() { blocks_.freeze(); }
    bool isFrozen() const { return blocks_.isFrozen(); }

    // Decodes a block id into a registered block (for biome and tree JSON)
    Codec<const BlockType*> blockCodec() const;

    const Registry<BlockType>& getRegistry() const { return blocks_; }

private:
    Registry<BlockType> blocks_{"block registry"};
    const BlockType* air_ = nullptr;
};

} // namespace Deepvale
