#pragma once

#include "VoxelChunk.hpp"
#include <memory>
#include <vector>

namespace Deepvale {

/**
 * Recycles chunk allocations across load/unload cycles.
 * Released chunks are reset to air; when the pool is full they are destroyed.
 */
class ChunkPool {
public:
    // maxPoolSize 0 means unlimited
    ChunkPool(const BlockType* air, size_t maxPoolSize = 128);

    void preAllocate(size_t count);

    std::unique_ptr<VoxelChunk> acquire(const ChunkPosition& position);
    void release(std::unique_ptr<VoxelChunk> chunk);

    void clear();

    size_t getAvailableCount() const { return pool_.size(); }
    size_t getTotalCreated() const { return totalCreated_; }
    size_t getMaxPoolSize() const { return maxPoolSize_; }

private:
    bool isFull() const { return maxPoolSize_ > 0 && pool_.size() >= maxPoolSize_; }

    const BlockType* air_;
    size_t maxPoolSize_;
    size_t totalCreated_ = 0;
    std::vector<std::unique_ptr<VoxelChunk>> pool_;
};

} // namespace Deepvale
