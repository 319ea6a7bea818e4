#pragma once
#include "gen/Codec.hpp"
#include <glm/glm.hpp>
#include <string>

namespace Deepvale {

/**
 * Immutable catalog entry for one kind of block.
 * Instances are owned by a BlockRegistry and compared by address.
 */
class BlockType {
public:
    // Everything about a block except its id; this is what block JSON files describe
    struct Properties {
        std::string displayName;
        glm::vec4 color{1.0f};
        bool solid = true;
        bool transparent = false;
        float hardness = 1.0f;
        bool placeable = true;

        static Codec<Properties> codec();
    };

    BlockType(std::string id, Properties properties);

    const std::string& getId() const { return id_; }
    const std::string& getDisplayName() const { return properties_.displayName; }
    const glm::vec4& getColor() const { return properties_.color; }
    float getHardness() const { return properties_.hardness; }
    bool isPlaceable() const { return properties_.placeable; }

    bool isSolid() const { return properties_.solid; }
    bool isTransparent() const { return properties_.transparent; }

    // Hides the face of whatever is next to it
    bool isOpaque() const { return isSolid() && !isTransparent(); }

    bool isAir() const { return id_ == AIR_ID; }

    static constexpr const char* AIR_ID = "air";

    static Properties airProperties();

private:
    std::string id_;
    Properties properties_;
};

} // namespace Deepvale
