#include "VoxelChunk.hpp"
#include "BlockRegistry.hpp"
#include "ChunkMeshBuilder.hpp"
#include "util/MathHelper.hpp"
#include <algorithm>
#include <tracy/Tracy.hpp>
#include <spdlog/spdlog.h>

namespace Deepvale {

VoxelChunk::VoxelChunk(const ChunkPosition& position, const BlockType* air)
    : position_(position), air_(air) {
    blocks_.fill(air_);
}

const BlockType* VoxelChunk::getBlockLocal(int32_t x, int32_t y, int32_t z) const {
    if (!isLocalPositionValid(x, y, z)) {
        return air_;
    }
    return blocks_[getIndex(x, y, z)];
}

bool VoxelChunk::setBlockLocal(int32_t x, int32_t y, int32_t z, const BlockType* block) {
    if (!isLocalPositionValid(x, y, z)) {
        return false;
    }

    if (!block) {
        block = air_;
    }

    const BlockType*& cell = blocks_[getIndex(x, y, z)];
    if (cell == block) {
        return false;
    }

    const BlockType* oldBlock = cell;
    cell = block;
    isDirty_ = true;

    if (onBlockChanged_) {
        onBlockChanged_(getWorldOrigin() + glm::ivec3(x, y, z), oldBlock, block);
    }
    return true;
}

ChunkPosition VoxelChunk::worldToChunkPosition(const glm::ivec3& worldPos) {
    return {
        MathHelper::floorDiv(worldPos.x, CHUNK_SIZE),
        MathHelper::floorDiv(worldPos.y, CHUNK_SIZE),
        MathHelper::floorDiv(worldPos.z, CHUNK_SIZE)
    };
}

glm::ivec3 VoxelChunk::worldToLocal(const glm::ivec3& worldPos, const ChunkPosition& chunkPos) {
    return worldPos - chunkPos.toIVec3() * CHUNK_SIZE;
}

void VoxelChunk::rebuildMesh(const ChunkMeshBuilder& builder, const BlockGetter* world) {
    ZoneScoped;
    mesh_ = builder.build(*this, world);
    isDirty_ = false;
}

bool VoxelChunk::rebuildMeshIfDirty(const ChunkMeshBuilder& builder, const BlockGetter* world) {
    if (!isDirty_) {
        return false;
    }
    rebuildMesh(builder, world);
    return true;
}

size_t VoxelChunk::countNonAir() const {
    return static_cast<size_t>(std::count_if(blocks_.begin(), blocks_.end(),
        [this](const BlockType* block) { return block != air_; }));
}

std::vector<std::string> VoxelChunk::getBlockIds() const {
    std::vector<std::string> ids;
    ids.reserve(CHUNK_VOLUME);
    for (const BlockType* block : blocks_) {
        ids.push_back(block->getId());
    }
    return ids;
}

bool VoxelChunk::loadBlockIds(const std::vector<std::string>& ids, const BlockRegistry& registry) {
    if (ids.size() != static_cast<size_t>(CHUNK_VOLUME)) {
        spdlog::error("Chunk {} expects {} block ids, got {}", position_, CHUNK_VOLUME, ids.size());
        return false;
    }

    for (size_t i = 0; i < ids.size(); i++) {
        blocks_[i] = registry.getOrAir(ids[i]);
    }
    isDirty_ = true;
    return true;
}

void VoxelChunk::reset(const ChunkPosition& position) {
    position_ = position;
    blocks_.fill(air_);
    mesh_.clear();
    isDirty_ = true;
    onBlockChanged_ = nullptr;
}

} // namespace Deepvale
