#pragma once

#include "ChunkMesh.hpp"
#include <glm/glm.hpp>
#include <memory>

namespace Deepvale {

class BlockGetter;
class BlockType;
class VoxelChunk;

enum class MesherType {
    NAIVE,
    GREEDY
};

// Turns a chunk's block grid into a mesh
class ChunkMeshBuilder {
public:
    virtual ~ChunkMeshBuilder() = default;

    // `world` may be null; out-of-chunk neighbours then read as air
    virtual ChunkMesh build(const VoxelChunk& chunk, const BlockGetter* world) const = 0;

    static std::unique_ptr<ChunkMeshBuilder> create(MesherType type);

protected:
    /**
     * Block at a chunk-local position that may lie outside the chunk.
     * Outside the world bounds, positions below y = 0 read as a solid opaque
     * block so the underside of the world is never meshed; everything else
     * outside reads as air.
     */
    static const BlockType* sampleBlock(const VoxelChunk& chunk, const glm::ivec3& local, const BlockGetter* world);
};

} // namespace Deepvale
