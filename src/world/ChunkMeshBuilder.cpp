#include "ChunkMeshBuilder.hpp"
#include "BlockGetter.hpp"
#include "BlockType.hpp"
#include "GreedyChunkMeshBuilder.hpp"
#include "NaiveChunkMeshBuilder.hpp"
#include "VoxelChunk.hpp"

namespace Deepvale {

namespace {

const BlockType& virtualSolidBlock() {
    static const BlockType block("virtual_solid", [] {
        BlockType::Properties props;
        props.displayName = "Virtual Solid";
        props.placeable = false;
        return props;
    }());
    return block;
}

} // namespace

std::unique_ptr<ChunkMeshBuilder> ChunkMeshBuilder::create(MesherType type) {
    switch (type) {
        case MesherType::GREEDY:
            return std::make_unique<GreedyChunkMeshBuilder>();
        case MesherType::NAIVE:
            break;
    }
    return std::make_unique<NaiveChunkMeshBuilder>();
}

const BlockType* ChunkMeshBuilder::sampleBlock(const VoxelChunk& chunk, const glm::ivec3& local, const BlockGetter* world) {
    if (VoxelChunk::isLocalPositionValid(local.x, local.y, local.z)) {
        return chunk.getBlockLocal(local);
    }

    const BlockType* air = chunk.getAir();
    if (!world) {
        return air;
    }

    glm::ivec3 worldPos = chunk.getWorldOrigin() + local;
    if (!world->isPositionValid(worldPos)) {
        return worldPos.y < 0 ? &virtualSolidBlock() : air;
    }
    return world->getBlock(worldPos);
}

} // namespace Deepvale
