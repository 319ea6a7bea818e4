#include "GreedyChunkMeshBuilder.hpp"
#include "VoxelChunk.hpp"
#include <tracy/Tracy.hpp>
#include <array>

namespace Deepvale {

namespace {

// One face slot per cell of a slice; null means no face
using FaceMask = std::array<const BlockType*, CHUNK_SIZE * CHUNK_SIZE>;

void emitQuad(ChunkMesh& mesh, int axis, bool positive, const glm::ivec3& origin,
              const glm::ivec3& du, const glm::ivec3& dv, const BlockType* block) {
    glm::vec3 v0(origin);
    glm::vec3 v1(origin + du);
    glm::vec3 v2(origin + du + dv);
    glm::vec3 v3(origin + dv);

    glm::vec3 normal(0.0f);
    normal[axis] = positive ? 1.0f : -1.0f;

    float width = static_cast<float>(du.x + du.y + du.z);
    float height = static_cast<float>(dv.x + dv.y + dv.z);

    if (positive) {
        const glm::vec3 corners[4] = {v0, v1, v2, v3};
        const glm::vec2 uvs[4] = {{0.0f, 0.0f}, {width, 0.0f}, {width, height}, {0.0f, height}};
        mesh.addQuad(corners, normal, block->getColor(), uvs);
    } else {
        const glm::vec3 corners[4] = {v3, v2, v1, v0};
        const glm::vec2 uvs[4] = {{0.0f, height}, {width, height}, {width, 0.0f}, {0.0f, 0.0f}};
        mesh.addQuad(corners, normal, block->getColor(), uvs);
    }
}

// Consumes the mask, emitting the largest rectangles of equal blocks first-fit
void mergeMask(FaceMask& mask, ChunkMesh& mesh, int axis, int slice, bool positive) {
    const int axisU = (axis + 1) % 3;
    const int axisV = (axis + 2) % 3;

    for (int j = 0; j < CHUNK_SIZE; j++) {
        for (int i = 0; i < CHUNK_SIZE;) {
            const BlockType* block = mask[i + j * CHUNK_SIZE];
            if (!block) {
                i++;
                continue;
            }

            int width = 1;
            while (i + width < CHUNK_SIZE && mask[i + width + j * CHUNK_SIZE] == block) {
                width++;
            }

            int height = 1;
            bool done = false;
            while (j + height < CHUNK_SIZE && !done) {
                for (int k = 0; k < width; k++) {
                    if (mask[i + k + (j + height) * CHUNK_SIZE] != block) {
                        done = true;
                        break;
                    }
                }
                if (!done) {
                    height++;
                }
            }

            glm::ivec3 origin(0);
            origin[axis] = slice;
            origin[axisU] = i;
            origin[axisV] = j;

            glm::ivec3 du(0);
            glm::ivec3 dv(0);
            du[axisU] = width;
            dv[axisV] = height;

            emitQuad(mesh, axis, positive, origin, du, dv, block);

            for (int l = 0; l < height; l++) {
                for (int k = 0; k < width; k++) {
                    mask[i + k + (j + l) * CHUNK_SIZE] = nullptr;
                }
            }
            i += width;
        }
    }
}

} // namespace

ChunkMesh GreedyChunkMeshBuilder::build(const VoxelChunk& chunk, const BlockGetter* world) const {
    ZoneScoped;

    ChunkMesh mesh;
    for (int axis = 0; axis < 3; axis++) {
        sweepAxis(chunk, world, axis, mesh);
    }
    return mesh;
}

void GreedyChunkMeshBuilder::sweepAxis(const VoxelChunk& chunk, const BlockGetter* world, int axis, ChunkMesh& mesh) const {
    const int axisU = (axis + 1) % 3;
    const int axisV = (axis + 2) % 3;

    FaceMask positiveMask;
    FaceMask negativeMask;

    // Plane `slice` separates cell slice - 1 (behind) from cell slice (in front)
    for (int slice = 0; slice <= CHUNK_SIZE; slice++) {
        positiveMask.fill(nullptr);
        negativeMask.fill(nullptr);

        for (int j = 0; j < CHUNK_SIZE; j++) {
            for (int i = 0; i < CHUNK_SIZE; i++) {
                glm::ivec3 front(0);
                front[axis] = slice;
                front[axisU] = i;
                front[axisV] = j;
                glm::ivec3 behind = front;
                behind[axis] -= 1;

                const BlockType* behindBlock = sampleBlock(chunk, behind, world);
                const BlockType* frontBlock = sampleBlock(chunk, front, world);

                if (slice > 0 && behindBlock->isSolid() && !frontBlock->isOpaque()) {
                    positiveMask[i + j * CHUNK_SIZE] = behindBlock;
                }
                if (slice < CHUNK_SIZE && frontBlock->isSolid() && !behindBlock->isOpaque()) {
                    negativeMask[i + j * CHUNK_SIZE] = frontBlock;
                }
            }
        }

        mergeMask(positiveMask, mesh, axis, slice, true);
        mergeMask(negativeMask, mesh, axis, slice, false);
    }
}

} // namespace Deepvale
