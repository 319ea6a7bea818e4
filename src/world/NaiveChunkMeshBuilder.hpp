#pragma once

#include "ChunkMeshBuilder.hpp"

namespace Deepvale {

/**
 * One quad per visible face, no merging.
 * A face of a solid block is visible unless the neighbour across it is opaque.
 * Non-solid blocks (air, water) produce no geometry.
 */
class NaiveChunkMeshBuilder : public ChunkMeshBuilder {
public:
    ChunkMesh build(const VoxelChunk& chunk, const BlockGetter* world) const override;
};

} // namespace Deepvale
