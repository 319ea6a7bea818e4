#pragma once

#include "ChunkMeshBuilder.hpp"

namespace Deepvale {

/**
 * Merges coplanar visible faces of the same block type into rectangles.
 * Visibility follows the same rule as NaiveChunkMeshBuilder; only faces of
 * blocks inside the chunk are emitted. UVs span the quad in block units.
 */
class GreedyChunkMeshBuilder : public ChunkMeshBuilder {
public:
    ChunkMesh build(const VoxelChunk& chunk, const BlockGetter* world) const override;

private:
    void sweepAxis(const VoxelChunk& chunk, const BlockGetter* world, int axis, ChunkMesh& mesh) const;
};

} // namespace Deepvale
