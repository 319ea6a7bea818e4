#include "ChunkPool.hpp"
#include <spdlog/spdlog.h>

namespace Deepvale {

ChunkPool::ChunkPool(const BlockType* air, size_t maxPoolSize)
    : air_(air), maxPoolSize_(maxPoolSize) {}

void ChunkPool::preAllocate(size_t count) {
    for (size_t i = 0; i < count && !isFull(); i++) {
        pool_.push_back(std::make_unique<VoxelChunk>(ChunkPosition{0, 0, 0}, air_));
        totalCreated_++;
    }
    spdlog::debug("Chunk pool pre-allocated, {} available", pool_.size());
}

std::unique_ptr<VoxelChunk> ChunkPool::acquire(const ChunkPosition& position) {
    if (!pool_.empty()) {
        std::unique_ptr<VoxelChunk> chunk = std::move(pool_.back());
        pool_.pop_back();
        chunk->reset(position);
        spdlog::trace("Reused pooled chunk for {}, {} left", position, pool_.size());
        return chunk;
    }

    totalCreated_++;
    return std::make_unique<VoxelChunk>(position, air_);
}

void ChunkPool::release(std::unique_ptr<VoxelChunk> chunk) {
    if (!chunk) {
        return;
    }

    if (isFull()) {
        spdlog::trace("Chunk pool full, destroying chunk {}", chunk->getPosition());
        return;
    }

    chunk->reset(chunk->getPosition());
    pool_.push_back(std::move(chunk));
}

void ChunkPool::clear() {
    pool_.clear();
}

} // namespace Deepvale
