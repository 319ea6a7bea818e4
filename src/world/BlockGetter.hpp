#pragma once

#include <glm/glm.hpp>

namespace Deepvale {

class BlockType;

// Read access to blocks by world position
class BlockGetter {
public:
    virtual ~BlockGetter() = default;

    // Air for anything that is not loaded
    virtual const BlockType* getBlock(const glm::ivec3& pos) const = 0;

    // Inside the declared world bounds (loaded or not)
    virtual bool isPositionValid(const glm::ivec3& pos) const = 0;
};

} // namespace Deepvale
