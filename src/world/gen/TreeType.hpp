#pragma once
#include "world/BlockRegistry.hpp"
#include <algorithm>
#include <cstdint>

namespace Deepvale {

// Shape and blocks of one kind of tree
struct TreeType {
    const BlockType* trunk = nullptr;
    const BlockType* leaves = nullptr;
    int32_t minTrunkHeight = 4;
    int32_t maxTrunkHeight = 6;
    int32_t leafRadius = 2;

    void validate() {
        minTrunkHeight = std::max(1, minTrunkHeight);
        maxTrunkHeight = std::max(minTrunkHeight, maxTrunkHeight);
        leafRadius = std::max(1, leafRadius);
    }

    static Codec<TreeType> codec(const BlockRegistry& blocks) {
        return Codec<TreeType>([&blocks](simdjson::ondemand::value json) -> DecodeResult<TreeType> {
            simdjson::ondemand::object obj;
            if (json.get_object().get(obj)) {
                return DecodeResult<TreeType>::failure("Expected object");
            }

            TreeType tree;
            std::string error;
            bool ok = field("trunk", blocks.blockCodec()).decodeInto(obj, tree.trunk, error)
                   && field("leaves", blocks.blockCodec()).decodeInto(obj, tree.leaves, error)
                   && optionalField("minTrunkHeight", Codecs::INT32(), 4).decodeInto(obj, tree.minTrunkHeight, error)
                   && optionalField("maxTrunkHeight", Codecs::INT32(), 6).decodeInto(obj, tree.maxTrunkHeight, error)
                   && optionalField("leafRadius", Codecs::INT32(), 2).decodeInto(obj, tree.leafRadius, error);

            if (!ok) {
                return DecodeResult<TreeType>::failure(error);
            }
            tree.validate();
            return DecodeResult<TreeType>::success(tree);
        });
    }
};

} // namespace Deepvale
