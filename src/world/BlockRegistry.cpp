#include "BlockRegistry.hpp"
#include <spdlog/spdlog.h>

namespace Deepvale {

namespace {

BlockType::Properties makeProperties(const char* displayName, glm::vec4 color, float hardness,
                                     bool solid = true, bool transparent = false, bool placeable = true) {
    BlockType::Properties props;
    props.displayName = displayName;
    props.color = color;
    props.hardness = hardness;
    props.solid = solid;
    props.transparent = transparent;
    props.placeable = placeable;
    return props;
}

} // namespace

BlockRegistry::BlockRegistry() {
    auto air = std::make_shared<BlockType>(BlockIds::AIR, BlockType::airProperties());
    air_ = air.get();
    blocks_.registerEntry(BlockIds::AIR, std::move(air));
}

const BlockType* BlockRegistry::registerBlock(const std::string& id, const BlockType::Properties& properties) {
    if (id.empty()) {
        spdlog::error("Cannot register a block with an empty id");
        return nullptr;
    }

    if (auto existing = blocks_.get(id)) {
        spdlog::warn("Block '{}' is already registered, keeping the existing definition", id);
        return existing.get();
    }

    auto block = std::make_shared<BlockType>(id, properties);
    const BlockType* blockPtr = block.get();
    if (!blocks_.registerEntry(id, std::move(block))) {
        return nullptr;
    }
    return blockPtr;
}

void BlockRegistry::registerDefaults() {
    registerBlock(BlockIds::GRASS, makeProperties("Grass", {0.3f, 0.7f, 0.2f, 1.0f}, 0.5f));
    registerBlock(BlockIds::DIRT, makeProperties("Dirt", {0.5f, 0.35f, 0.2f, 1.0f}, 0.5f));
    registerBlock(BlockIds::STONE, makeProperties("Stone", {0.5f, 0.5f, 0.5f, 1.0f}, 1.5f));
    registerBlock(BlockIds::SAND, makeProperties("Sand", {0.9f, 0.85f, 0.6f, 1.0f}, 0.4f));
    registerBlock(BlockIds::WATER, makeProperties("Water", {0.2f, 0.4f, 0.8f, 0.5f}, 0.0f, false, true, false));
    registerBlock(BlockIds::OAK_WOOD, makeProperties("Oak Wood", {0.55f, 0.4f, 0.25f, 1.0f}, 1.2f));
    registerBlock(BlockIds::OAK_LEAVES, makeProperties("Oak Leaves", {0.2f, 0.55f, 0.15f, 0.9f}, 0.2f, true, true));
    registerBlock(BlockIds::COAL_ORE, makeProperties("Coal Ore", {0.25f, 0.25f, 0.25f, 1.0f}, 2.0f));
    registerBlock(BlockIds::IRON_ORE, makeProperties("Iron Ore", {0.7f, 0.55f, 0.45f, 1.0f}, 2.5f));
    registerBlock(BlockIds::GOLD_ORE, makeProperties("Gold Ore", {0.9f, 0.8f, 0.3f, 1.0f}, 3.0f));
    registerBlock(BlockIds::DIAMOND_ORE, makeProperties("Diamond Ore", {0.4f, 0.85f, 0.9f, 1.0f}, 4.0f));

    spdlog::debug("Registered built-in blocks, {} total", blocks_.size());
}

bool BlockRegistry::loadFromDirectory(const std::filesystem::path& directory) {
    auto codec = BlockType::Properties::codec();

    size_t loaded = RegistryLoader::loadFromDirectory(directory,
        [this, &codec](const std::string& id, simdjson::ondemand::value json) {
            if (id == BlockIds::AIR) {
                spdlog::warn("Ignoring block file for the built-in air block");
                return false;
            }

            auto result = codec.decode(json);
            if (result.isError()) {
                spdlog::error("Failed to decode block {}: {}", id, result.error);
                return false;
            }
            return registerBlock(id, result.value.value()) != nullptr;
        });

    return loaded > 0;
}

const BlockType* BlockRegistry::get(const std::string& id) const {
    return blocks_.get(id).get();
}

const BlockType* BlockRegistry::getOrAir(const std::string& id) const {
    const BlockType* block = get(id);
    if (!block) {
        spdlog::warn("Unknown block '{}', using air", id);
        return air_;
    }
    return block;
}

Codec<const BlockType*> BlockRegistry::blockCodec() const {
    return blocks_.referenceCodec().map<const BlockType*>(
        [](std::shared_ptr<BlockType> block) -> const BlockType* { return block.get(); });
}

} // namespace Deepvale
