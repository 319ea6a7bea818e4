#include "BlockType.hpp"
#include <algorithm>

namespace Deepvale {

namespace {

// [r, g, b] or [r, g, b, a], components in 0..1
Codec<glm::vec4> colorCodec() {
    return Codec<glm::vec4>([](simdjson::ondemand::value json) -> DecodeResult<glm::vec4> {
        auto components = Codecs::list(Codecs::FLOAT()).decode(json);
        if (components.isError()) {
            return DecodeResult<glm::vec4>::failure("Color: " + components.error);
        }

        const auto& c = components.value.value();
        if (c.size() != 3 && c.size() != 4) {
            return DecodeResult<glm::vec4>::failure("Color needs 3 or 4 components, got " + std::to_string(c.size()));
        }

        glm::vec4 color(c[0], c[1], c[2], c.size() == 4 ? c[3] : 1.0f);
        return DecodeResult<glm::vec4>::success(glm::clamp(color, 0.0f, 1.0f));
    });
}

} // namespace

BlockType::BlockType(std::string id, Properties properties)
    : id_(std::move(id)), properties_(std::move(properties)) {
    properties_.hardness = std::max(0.0f, properties_.hardness);
    if (properties_.displayName.empty()) {
        properties_.displayName = id_;
    }
}

BlockType::Properties BlockType::airProperties() {
    Properties props;
    props.displayName = "Air";
    props.color = glm::vec4(0.0f);
    props.solid = false;
    props.transparent = true;
    props.hardness = 0.0f;
    props.placeable = false;
    return props;
}

Codec<BlockType::Properties> BlockType::Properties::codec() {
    return Codec<Properties>([](simdjson::ondemand::value json) -> DecodeResult<Properties> {
        simdjson::ondemand::object obj;
        if (json.get_object().get(obj)) {
            return DecodeResult<Properties>::failure("Expected object");
        }

        Properties props;
        std::string error;
        bool ok = optionalField("displayName", Codecs::STRING(), std::string()).decodeInto(obj, props.displayName, error)
               && optionalField("color", colorCodec(), glm::vec4(1.0f)).decodeInto(obj, props.color, error)
               && optionalField("solid", Codecs::BOOL(), true).decodeInto(obj, props.solid, error)
               && optionalField("transparent", Codecs::BOOL(), false).decodeInto(obj, props.transparent, error)
               && optionalField("hardness", Codecs::FLOAT(), 1.0f).decodeInto(obj, props.hardness, error)
               && optionalField("placeable", Codecs::BOOL(), true).decodeInto(obj, props.placeable, error);

        if (!ok) {
            return DecodeResult<Properties>::failure(error);
        }
        return DecodeResult<Properties>::success(std::move(props));
    });
}

} // namespace Deepvale
