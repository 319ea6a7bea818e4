#pragma once
#include "world/BlockRegistry.hpp"
#include <algorithm>
#include <cstdint>

namespace Deepvale {

/**
 * One ore vein layer. Depth is measured downward from the column surface;
 * the ore may replace stone where minDepth <= depth <= maxDepth and the
 * ore noise falls below spawnChance.
 */
struct OreConfig {
    const BlockType* ore = nullptr;
    int32_t minDepth = 5;
    int32_t maxDepth = 64;
    float spawnChance = 0.05f;
    float noiseScale = 0.1f;

    OreConfig() = default;

    OreConfig(const BlockType* oreBlock, int32_t minDepth, int32_t maxDepth, float spawnChance, float noiseScale = 0.1f)
        : ore(oreBlock), minDepth(minDepth), maxDepth(maxDepth)
        , spawnChance(spawnChance), noiseScale(noiseScale) {
        validate();
    }

    void validate() {
        minDepth = std::max(0, minDepth);
        maxDepth = std::max(minDepth, maxDepth);
        spawnChance = std::clamp(spawnChance, 0.0f, 1.0f);
    }

    static Codec<OreConfig> codec(const BlockRegistry& blocks) {
        return Codec<OreConfig>([&blocks](simdjson::ondemand::value json) -> DecodeResult<OreConfig> {
            simdjson::ondemand::object obj;
            if (json.get_object().get(obj)) {
                return DecodeResult<OreConfig>::failure("Expected object");
            }

            OreConfig config;
            std::string error;
            bool ok = field("ore", blocks.blockCodec()).decodeInto(obj, config.ore, error)
                   && optionalField("minDepth", Codecs::INT32(), 5).decodeInto(obj, config.minDepth, error)
                   && optionalField("maxDepth", Codecs::INT32(), 64).decodeInto(obj, config.maxDepth, error)
                   && optionalField("spawnChance", Codecs::FLOAT().clamped(0.0f, 1.0f), 0.05f).decodeInto(obj, config.spawnChance, error)
                   && optionalField("noiseScale", Codecs::FLOAT(), 0.1f).decodeInto(obj, config.noiseScale, error);

            if (!ok) {
                return DecodeResult<OreConfig>::failure(error);
            }
            config.validate();
            return DecodeResult<OreConfig>::success(config);
        });
    }
};

} // namespace Deepvale
