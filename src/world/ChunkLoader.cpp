#include "ChunkLoader.hpp"
#include "VoxelWorld.hpp"
#include "gen/IWorldGenerator.hpp"
#include <algorithm>
#include <cmath>
#include <vector>
#include <tracy/Tracy.hpp>
#include <spdlog/spdlog.h>

namespace Deepvale {

ChunkLoader::ChunkLoader(VoxelWorld& world, int32_t loadDistance, int32_t unloadDistance,
                         int32_t chunksPerTick, int32_t meshesPerTick)
    : world_(world)
    , loadDistance_(std::max(1, loadDistance))
    , unloadDistance_(unloadDistance)
    , chunksPerTick_(std::max(1, chunksPerTick))
    , meshesPerTick_(std::max(1, meshesPerTick)) {
    if (unloadDistance_ <= loadDistance_) {
        unloadDistance_ = loadDistance_ + 2;
        spdlog::warn("Unload distance adjusted to {}", unloadDistance_);
    }
}

void ChunkLoader::setTarget(const glm::ivec3& blockPos) {
    hasTarget_ = true;
    targetChunk_ = VoxelChunk::worldToChunkPosition(blockPos);
    updateChunkQueues(targetChunk_);
}

void ChunkLoader::update(const glm::ivec3& blockPos) {
    ZoneScoped;

    ChunkPosition current = VoxelChunk::worldToChunkPosition(blockPos);
    if (!hasTarget_ || current.x != targetChunk_.x || current.z != targetChunk_.z) {
        hasTarget_ = true;
        targetChunk_ = current;
        updateChunkQueues(current);
    }

    processLoadQueue();
    processMeshQueue();
}

void ChunkLoader::forceUpdate() {
    if (hasTarget_) {
        updateChunkQueues(targetChunk_);
    }
}

void ChunkLoader::setLoadDistance(int32_t distance) {
    loadDistance_ = std::max(1, distance);
    unloadDistance_ = std::max(loadDistance_ + 1, unloadDistance_);
}

void ChunkLoader::setUnloadDistance(int32_t distance) {
    unloadDistance_ = std::max(loadDistance_ + 1, distance);
}

bool ChunkLoader::isWithinDistance(const ChunkPosition& pos, const ChunkPosition& center, int32_t distance) const {
    float dx = static_cast<float>(pos.x - center.x);
    float dz = static_cast<float>(pos.z - center.z);
    return std::sqrt(dx * dx + dz * dz) <= static_cast<float>(distance);
}

void ChunkLoader::updateChunkQueues(const ChunkPosition& center) {
    ZoneScoped;

    size_t queued = 0;
    for (int32_t x = -loadDistance_; x <= loadDistance_; x++) {
        for (int32_t z = -loadDistance_; z <= loadDistance_; z++) {
            for (int32_t y = 0; y < world_.getHeightInChunks(); y++) {
                ChunkPosition pos{center.x + x, y, center.z + z};

                if (!world_.isChunkInBounds(pos)) {
                    continue;
                }
                if (world_.getChunk(pos) || queuedPositions_.contains(pos)) {
                    continue;
                }
                if (isWithinDistance(pos, center, loadDistance_)) {
                    loadQueue_.push_back(pos);
                    queuedPositions_.insert(pos);
                    queued++;
                }
            }
        }
    }

    std::vector<ChunkPosition> toUnload;
    for (VoxelChunk* chunk : world_.getAllChunks()) {
        if (!isWithinDistance(chunk->getPosition(), center, unloadDistance_)) {
            toUnload.push_back(chunk->getPosition());
        }
    }
    for (const auto& pos : toUnload) {
        world_.unloadChunk(pos);
    }

    if (queued > 0 || !toUnload.empty()) {
        spdlog::debug("Target chunk {}: queued {} chunks, unloaded {}", center, queued, toUnload.size());
    }
}

void ChunkLoader::processLoadQueue() {
    int32_t processed = 0;
    while (!loadQueue_.empty() && processed < chunksPerTick_) {
        ChunkPosition pos = loadQueue_.front();
        loadQueue_.pop_front();
        queuedPositions_.erase(pos);

        // The target may have moved away since this chunk was queued
        if (!isWithinDistance(pos, targetChunk_, loadDistance_)) {
            continue;
        }

        bool existed = world_.getChunk(pos) != nullptr;
        VoxelChunk* chunk = world_.loadOrCreateChunk(pos);
        if (!chunk) {
            continue;
        }

        if (!existed) {
            if (IWorldGenerator* generator = world_.getWorldGenerator()) {
                generator->generateChunk(*chunk);
            }
        }
        queueMesh(pos);

        // Writes into a new chunk dirty its already meshed neighbours, and
        // vegetation can reach diagonal chunks too
        for (int32_t dx = -1; dx <= 1; dx++) {
            for (int32_t dy = -1; dy <= 1; dy++) {
                for (int32_t dz = -1; dz <= 1; dz++) {
                    if (dx == 0 && dy == 0 && dz == 0) {
                        continue;
                    }
                    ChunkPosition neighborPos = pos.getNeighbor(dx, dy, dz);
                    VoxelChunk* neighbor = world_.getChunk(neighborPos);
                    if (neighbor && neighbor->isDirty()) {
                        queueMesh(neighborPos);
                    }
                }
            }
        }
        processed++;
    }
}

void ChunkLoader::queueMesh(const ChunkPosition& pos) {
    if (std::find(meshQueue_.begin(), meshQueue_.end(), pos) == meshQueue_.end()) {
        meshQueue_.push_back(pos);
    }
}

void ChunkLoader::processMeshQueue() {
    int32_t processed = 0;
    while (!meshQueue_.empty() && processed < meshesPerTick_) {
        ChunkPosition pos = meshQueue_.front();
        meshQueue_.pop_front();

        // Unloaded chunks simply drop out of the queue
        VoxelChunk* chunk = world_.getChunk(pos);
        world_.rebuildChunkMeshIfDirty(chunk);
        processed++;
    }
}

} // namespace Deepvale
