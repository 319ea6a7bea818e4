#include "NaiveChunkMeshBuilder.hpp"
#include "FaceUtils.hpp"
#include "VoxelChunk.hpp"
#include <tracy/Tracy.hpp>
#include <spdlog/spdlog.h>

namespace Deepvale {

ChunkMesh NaiveChunkMeshBuilder::build(const VoxelChunk& chunk, const BlockGetter* world) const {
    ZoneScoped;

    ChunkMesh mesh;
    size_t solidBlocks = 0;

    for (int32_t x = 0; x < CHUNK_SIZE; x++) {
        for (int32_t y = 0; y < CHUNK_SIZE; y++) {
            for (int32_t z = 0; z < CHUNK_SIZE; z++) {
                const BlockType* block = chunk.getBlockLocal(x, y, z);
                if (!block->isSolid()) {
                    continue;
                }
                solidBlocks++;

                glm::ivec3 blockPos(x, y, z);
                for (FaceDirection face : ALL_FACES) {
                    int faceIndex = FaceUtils::toIndex(face);
                    const BlockType* neighbor = sampleBlock(chunk, blockPos + FaceUtils::FACE_DIRS[faceIndex], world);
                    if (neighbor->isOpaque()) {
                        continue;
                    }

                    glm::vec3 corners[4];
                    for (int i = 0; i < 4; i++) {
                        corners[i] = glm::vec3(blockPos) + FaceUtils::FACE_VERTICES[faceIndex][i];
                    }
                    mesh.addQuad(corners, FaceUtils::FACE_NORMALS[faceIndex], block->getColor(), FaceUtils::FACE_UVS);
                }
            }
        }
    }

    if (mesh.isEmpty() && solidBlocks > 0) {
        spdlog::debug("Chunk {} has {} solid blocks but no visible faces", chunk.getPosition(), solidBlocks);
    }

    return mesh;
}

} // namespace Deepvale
