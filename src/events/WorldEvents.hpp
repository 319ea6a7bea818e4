#pragma once

#include "Event.hpp"
#include "world/BlockType.hpp"
#include "world/VoxelChunk.hpp"
#include <glm/glm.hpp>
#include <fmt/format.h>

namespace Deepvale {

// Posted by VoxelWorld after a block value actually changed
class BlockChangedEvent : public Event {
public:
    BlockChangedEvent(const glm::ivec3& position, const BlockType* oldBlock, const BlockType* newBlock)
        : m_position(position), m_oldBlock(oldBlock), m_newBlock(newBlock) {}

    const glm::ivec3& getPosition() const { return m_position; }
    const BlockType* getOldBlock() const { return m_oldBlock; }
    const BlockType* getNewBlock() const { return m_newBlock; }

    std::string toString() const override {
        return fmt::format("BlockChangedEvent: ({}, {}, {}) {} -> {}",
                           m_position.x, m_position.y, m_position.z,
                           m_oldBlock->getId(), m_newBlock->getId());
    }

    EVENT_CLASS_TYPE(BlockChanged)
    EVENT_CLASS_CATEGORY(EventCategoryWorld | EventCategoryBlock)

private:
    glm::ivec3 m_position;
    const BlockType* m_oldBlock;
    const BlockType* m_newBlock;
};

class ChunkEvent : public Event {
public:
    const ChunkPosition& getChunkPosition() const { return m_position; }

    EVENT_CLASS_CATEGORY(EventCategoryWorld | EventCategoryChunk)

protected:
    explicit ChunkEvent(const ChunkPosition& position) : m_position(position) {}

    ChunkPosition m_position;
};

class ChunkLoadedEvent : public ChunkEvent {
public:
    explicit ChunkLoadedEvent(const ChunkPosition& position) : ChunkEvent(position) {}

    std::string toString() const override {
        return fmt::format("ChunkLoadedEvent: {}", m_position);
    }

    EVENT_CLASS_TYPE(ChunkLoaded)
};

class ChunkUnloadedEvent : public ChunkEvent {
public:
    explicit ChunkUnloadedEvent(const ChunkPosition& position) : ChunkEvent(position) {}

    std::string toString() const override {
        return fmt::format("ChunkUnloadedEvent: {}", m_position);
    }

    EVENT_CLASS_TYPE(ChunkUnloaded)
};

class ChunkMeshRebuiltEvent : public ChunkEvent {
public:
    ChunkMeshRebuiltEvent(const ChunkPosition& position, size_t quadCount)
        : ChunkEvent(position), m_quadCount(quadCount) {}

    size_t getQuadCount() const { return m_quadCount; }

    EVENT_CLASS_TYPE(ChunkMeshRebuilt)

private:
    size_t m_quadCount;
};

} // namespace Deepvale
