#include "BiomeDefinition.hpp"
#include <algorithm>

namespace Deepvale {

const TreeType* BiomeDefinition::getRandomTreeType(std::mt19937& rng) const {
    if (treeTypes.empty()) {
        return nullptr;
    }
    std::uniform_int_distribution<size_t> pick(0, treeTypes.size() - 1);
    return &treeTypes[pick(rng)];
}

const BlockType* BiomeDefinition::getBushBlock() const {
    if (bushBlock) {
        return bushBlock;
    }
    return treeTypes.empty() ? nullptr : treeTypes.front().leaves;
}

void BiomeDefinition::validate() {
    if (name.empty()) {
        name = id;
    }
    baseHeight = std::max(1, baseHeight);
    heightVariation = std::max(0, heightVariation);
    fillerDepth = std::max(1, fillerDepth);
    stoneStartHeight = std::max(0, stoneStartHeight);
    waterLevel = std::max(0, waterLevel);
    beachHeight = std::max(0, beachHeight);
    treeChance = std::clamp(treeChance, 0.0f, 1.0f);
    bushChance = std::clamp(bushChance, 0.0f, 1.0f);
    for (auto& tree : treeTypes) {
        tree.validate();
    }
    for (auto& ore : ores) {
        ore.validate();
    }
}

Codec<BiomeDefinition> BiomeDefinition::codec(const BlockRegistry& blocks, const std::string& id) {
    return Codec<BiomeDefinition>([&blocks, id](simdjson::ondemand::value json) -> DecodeResult<BiomeDefinition> {
        simdjson::ondemand::object obj;
        if (json.get_object().get(obj)) {
            return DecodeResult<BiomeDefinition>::failure("Expected object");
        }

        const BlockType* none = nullptr;
        auto blockRef = blocks.blockCodec();

        BiomeDefinition biome;
        biome.id = id;

        std::string error;
        bool ok = optionalField("name", Codecs::STRING(), std::string()).decodeInto(obj, biome.name, error)
               && field("top", blockRef).decodeInto(obj, biome.topBlock, error)
               && field("filler", blockRef).decodeInto(obj, biome.fillerBlock, error)
               && field("stone", blockRef).decodeInto(obj, biome.stoneBlock, error)
               && optionalField("water", blockRef, none).decodeInto(obj, biome.waterBlock, error)
               && optionalField("beach", blockRef, none).decodeInto(obj, biome.beachBlock, error)
               && optionalField("baseHeight", Codecs::INT32(), 32).decodeInto(obj, biome.baseHeight, error)
               && optionalField("heightVariation", Codecs::INT32(), 16).decodeInto(obj, biome.heightVariation, error)
               && optionalField("fillerDepth", Codecs::INT32(), 3).decodeInto(obj, biome.fillerDepth, error)
               && optionalField("stoneStartHeight", Codecs::INT32(), 20).decodeInto(obj, biome.stoneStartHeight, error)
               && optionalField("waterLevel", Codecs::INT32(), 28).decodeInto(obj, biome.waterLevel, error)
               && optionalField("beachHeight", Codecs::INT32(), 2).decodeInto(obj, biome.beachHeight, error)
               && optionalField("treeChance", Codecs::FLOAT(), 0.02f).decodeInto(obj, biome.treeChance, error)
               && optionalField("bushChance", Codecs::FLOAT(), 0.0f).decodeInto(obj, biome.bushChance, error)
               && optionalField("bushBlock", blockRef, none).decodeInto(obj, biome.bushBlock, error)
               && optionalField("trees", Codecs::list(TreeType::codec(blocks)), std::vector<TreeType>()).decodeInto(obj, biome.treeTypes, error)
               && optionalField("ores", Codecs::list(OreConfig::codec(blocks)), std::vector<OreConfig>()).decodeInto(obj, biome.ores, error);

        if (!ok) {
            return DecodeResult<BiomeDefinition>::failure(error);
        }

        biome.validate();
        return DecodeResult<BiomeDefinition>::success(std::move(biome));
    });
}

} // namespace Deepvale
