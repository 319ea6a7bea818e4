#pragma once

#include "VoxelChunk.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <deque>
#include <unordered_set>

namespace Deepvale {

class VoxelWorld;

/**
 * Streams chunks in and out of a VoxelWorld around a moving target.
 *
 * When the target crosses into a new chunk column, every in-bounds chunk within
 * loadDistance (XZ, in chunks) is queued and every loaded chunk beyond
 * unloadDistance is unloaded. Each update() then loads at most chunksPerTick
 * queued chunks and remeshes at most meshesPerTick of the chunks it loaded.
 */
class ChunkLoader {
public:
    ChunkLoader(VoxelWorld& world, int32_t loadDistance = 4, int32_t unloadDistance = 6,
                int32_t chunksPerTick = 2, int32_t meshesPerTick = 4);

    // Block position of the target; queues around it immediately
    void setTarget(const glm::ivec3& blockPos);
    void update(const glm::ivec3& blockPos);

    // Requeue around the current target even if it has not moved
    void forceUpdate();

    void setLoadDistance(int32_t distance);
    void setUnloadDistance(int32_t distance);
    int32_t getLoadDistance() const { return loadDistance_; }
    int32_t getUnloadDistance() const { return unloadDistance_; }

    size_t getLoadQueueSize() const { return loadQueue_.size(); }
    size_t getMeshQueueSize() const { return meshQueue_.size(); }
    bool hasTarget() const { return hasTarget_; }

private:
    void updateChunkQueues(const ChunkPosition& center);
    void processLoadQueue();
    void processMeshQueue();
    void queueMesh(const ChunkPosition& pos);
    bool isWithinDistance(const ChunkPosition& pos, const ChunkPosition& center, int32_t distance) const;

    VoxelWorld& world_;
    int32_t loadDistance_;
    int32_t unloadDistance_;
    int32_t chunksPerTick_;
    int32_t meshesPerTick_;

    bool hasTarget_ = false;
    ChunkPosition targetChunk_{INT32_MAX, INT32_MAX, INT32_MAX};

    std::deque<ChunkPosition> loadQueue_;
    std::unordered_set<ChunkPosition, ChunkPositionHash> queuedPositions_;
    std::deque<ChunkPosition> meshQueue_;
};

} // namespace Deepvale
