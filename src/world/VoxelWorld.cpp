#include "VoxelWorld.hpp"
#include "ChunkPool.hpp"
#include "events/EventBus.hpp"
#include "events/WorldEvents.hpp"
#include "gen/IWorldGenerator.hpp"
#include <cmath>
#include <tracy/Tracy.hpp>
#include <spdlog/spdlog.h>

namespace Deepvale {

VoxelWorld::VoxelWorld(const BlockRegistry& blocks, int32_t sizeInChunks, int32_t heightInChunks)
    : blocks_(blocks)
    , sizeInChunks_(std::max(1, sizeInChunks))
    , heightInChunks_(std::max(1, heightInChunks))
    , meshBuilder_(ChunkMeshBuilder::create(MesherType::NAIVE)) {
}

VoxelWorld::~VoxelWorld() {
    // Chunks hold callbacks into this world; detach before they go to the pool or away
    for (auto& [pos, chunk] : chunks_) {
        chunk->setBlockChangedCallback(nullptr);
        if (pool_) {
            pool_->release(std::move(chunk));
        }
    }
    chunks_.clear();
}

void VoxelWorld::initialize() {
    if (initialized_) {
        return;
    }

    ZoneScoped;
    for (int32_t x = 0; x < sizeInChunks_; x++) {
        for (int32_t y = 0; y < heightInChunks_; y++) {
            for (int32_t z = 0; z < sizeInChunks_; z++) {
                loadOrCreateChunk({x, y, z});
            }
        }
    }

    initialized_ = true;
    spdlog::info("World initialized: {}x{}x{} chunks ({} blocks wide, {} high)",
                 sizeInChunks_, heightInChunks_, sizeInChunks_, getSizeInBlocks(), getHeightInBlocks());
}

void VoxelWorld::setMesherType(MesherType type) {
    meshBuilder_ = ChunkMeshBuilder::create(type);
}

const BlockType* VoxelWorld::getBlock(const glm::ivec3& worldPos) const {
    VoxelChunk* chunk = getChunkAt(worldPos);
    if (!chunk) {
        return blocks_.air();
    }
    return chunk->getBlockLocal(VoxelChunk::worldToLocal(worldPos, chunk->getPosition()));
}

bool VoxelWorld::isPositionValid(const glm::ivec3& worldPos) const {
    return worldPos.x >= 0 && worldPos.x < getSizeInBlocks() &&
           worldPos.y >= 0 && worldPos.y < getHeightInBlocks() &&
           worldPos.z >= 0 && worldPos.z < getSizeInBlocks();
}

bool VoxelWorld::requestBlockChange(const glm::ivec3& worldPos, const BlockType* block) {
    VoxelChunk* chunk = getChunkAt(worldPos);
    if (!chunk) {
        return false;
    }

    // The chunk reports actual changes back through handleBlockChanged
    return chunk->setBlockLocal(VoxelChunk::worldToLocal(worldPos, chunk->getPosition()), block);
}

VoxelChunk* VoxelWorld::getChunkAt(const glm::ivec3& worldPos) const {
    return getChunk(VoxelChunk::worldToChunkPosition(worldPos));
}

VoxelChunk* VoxelWorld::getChunk(const ChunkPosition& chunkPos) const {
    auto it = chunks_.find(chunkPos);
    if (it == chunks_.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<VoxelChunk*> VoxelWorld::getAllChunks() const {
    std::vector<VoxelChunk*> result;
    result.reserve(chunks_.size());
    for (const auto& [pos, chunk] : chunks_) {
        result.push_back(chunk.get());
    }
    return result;
}

bool VoxelWorld::isChunkInBounds(const ChunkPosition& chunkPos) const {
    return chunkPos.x >= 0 && chunkPos.x < sizeInChunks_ &&
           chunkPos.y >= 0 && chunkPos.y < heightInChunks_ &&
           chunkPos.z >= 0 && chunkPos.z < sizeInChunks_;
}

VoxelChunk* VoxelWorld::loadOrCreateChunk(const ChunkPosition& chunkPos) {
    if (VoxelChunk* existing = getChunk(chunkPos)) {
        return existing;
    }

    if (!isChunkInBounds(chunkPos)) {
        spdlog::warn("Refusing to create chunk {} outside the world bounds", chunkPos);
        return nullptr;
    }

    return createChunk(chunkPos);
}

VoxelChunk* VoxelWorld::createChunk(const ChunkPosition& chunkPos) {
    std::unique_ptr<VoxelChunk> chunk = pool_
        ? pool_->acquire(chunkPos)
        : std::make_unique<VoxelChunk>(chunkPos, blocks_.air());

    chunk->setBlockChangedCallback(
        [this](const glm::ivec3& worldPos, const BlockType* oldBlock, const BlockType* newBlock) {
            handleBlockChanged(worldPos, oldBlock, newBlock);
        });

    VoxelChunk* chunkPtr = chunk.get();
    chunks_.emplace(chunkPos, std::move(chunk));
    spdlog::trace("Created chunk {}", chunkPos);

    if (EventBus::hasListeners(EventType::ChunkLoaded)) {
        ChunkLoadedEvent event(chunkPos);
        EventBus::post(event);
    }
    return chunkPtr;
}

void VoxelWorld::unloadChunk(const ChunkPosition& chunkPos) {
    auto it = chunks_.find(chunkPos);
    if (it == chunks_.end()) {
        return;
    }

    std::unique_ptr<VoxelChunk> chunk = std::move(it->second);
    chunks_.erase(it);
    chunk->setBlockChangedCallback(nullptr);

    if (pool_) {
        pool_->release(std::move(chunk));
    }
    spdlog::trace("Unloaded chunk {}", chunkPos);

    if (EventBus::hasListeners(EventType::ChunkUnloaded)) {
        ChunkUnloadedEvent event(chunkPos);
        EventBus::post(event);
    }
}

void VoxelWorld::handleBlockChanged(const glm::ivec3& worldPos, const BlockType* oldBlock, const BlockType* newBlock) {
    markNeighborsDirtyIfOnBoundary(worldPos);

    if (EventBus::hasListeners(EventType::BlockChanged)) {
        BlockChangedEvent event(worldPos, oldBlock, newBlock);
        EventBus::post(event);
    }
}

void VoxelWorld::markNeighborsDirtyIfOnBoundary(const glm::ivec3& worldPos) {
    ChunkPosition chunkPos = VoxelChunk::worldToChunkPosition(worldPos);
    glm::ivec3 localPos = VoxelChunk::worldToLocal(worldPos, chunkPos);

    if (localPos.x == 0) markChunkDirty(chunkPos.getNeighbor(-1, 0, 0));
    if (localPos.x == CHUNK_SIZE - 1) markChunkDirty(chunkPos.getNeighbor(1, 0, 0));
    if (localPos.y == 0) markChunkDirty(chunkPos.getNeighbor(0, -1, 0));
    if (localPos.y == CHUNK_SIZE - 1) markChunkDirty(chunkPos.getNeighbor(0, 1, 0));
    if (localPos.z == 0) markChunkDirty(chunkPos.getNeighbor(0, 0, -1));
    if (localPos.z == CHUNK_SIZE - 1) markChunkDirty(chunkPos.getNeighbor(0, 0, 1));
}

void VoxelWorld::markChunkDirty(const ChunkPosition& chunkPos) {
    if (VoxelChunk* chunk = getChunk(chunkPos)) {
        chunk->markDirty();
    }
}

size_t VoxelWorld::rebuildDirtyChunks() {
    ZoneScoped;

    size_t rebuilt = 0;
    for (auto& [pos, chunk] : chunks_) {
        if (rebuildChunkMeshIfDirty(chunk.get())) {
            rebuilt++;
        }
    }

    if (rebuilt > 0) {
        spdlog::debug("Rebuilt {} dirty chunk meshes", rebuilt);
    }
    return rebuilt;
}

void VoxelWorld::rebuildAllChunks() {
    ZoneScoped;
    for (auto& [pos, chunk] : chunks_) {
        rebuildChunkMesh(chunk.get());
    }
}

void VoxelWorld::rebuildChunkMesh(VoxelChunk* chunk) {
    if (!chunk) {
        return;
    }

    chunk->rebuildMesh(*meshBuilder_, this);
    postMeshRebuilt(*chunk);
}

bool VoxelWorld::rebuildChunkMeshIfDirty(VoxelChunk* chunk) {
    if (!chunk || !chunk->rebuildMeshIfDirty(*meshBuilder_, this)) {
        return false;
    }
    postMeshRebuilt(*chunk);
    return true;
}

void VoxelWorld::postMeshRebuilt(const VoxelChunk& chunk) {
    if (EventBus::hasListeners(EventType::ChunkMeshRebuilt)) {
        ChunkMeshRebuiltEvent event(chunk.getPosition(), chunk.getMesh().getQuadCount());
        EventBus::post(event);
    }
}

void VoxelWorld::generateWithWorldGenerator() {
    if (!generator_) {
        spdlog::warn("No world generator assigned");
        return;
    }

    ZoneScoped;
    spdlog::info("Generating {} chunks with seed {}...", chunks_.size(), generator_->getSeed());

    // Vegetation may write into neighbouring chunks, so iterate over a snapshot
    for (VoxelChunk* chunk : getAllChunks()) {
        generator_->generateChunk(*chunk);
    }

    rebuildAllChunks();
    spdlog::info("Terrain generation complete");
}

void VoxelWorld::generateFlatTerrain(int32_t groundHeight, const BlockType* groundBlock) {
    if (!groundBlock) {
        spdlog::warn("Cannot generate flat terrain with a null block type");
        return;
    }

    ZoneScoped;
    int32_t top = std::min(groundHeight, getHeightInBlocks());
    for (int32_t x = 0; x < getSizeInBlocks(); x++) {
        for (int32_t z = 0; z < getSizeInBlocks(); z++) {
            for (int32_t y = 0; y < top; y++) {
                requestBlockChange({x, y, z}, groundBlock);
            }
        }
    }

    rebuildDirtyChunks();
}

ChunkPosition VoxelWorld::worldToChunkPos(const glm::vec3& worldPos) const {
    glm::ivec3 blockPos(glm::floor(worldPos / BLOCK_SIZE));
    return VoxelChunk::worldToChunkPosition(blockPos);
}

} // namespace Deepvale
