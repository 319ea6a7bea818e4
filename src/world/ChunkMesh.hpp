#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <vector>

namespace Deepvale {

// CPU-side chunk geometry in chunk-local block units, ready for upload
struct ChunkMesh {
    std::vector<glm::vec3> vertices;
    std::vector<glm::vec3> normals;
    std::vector<glm::vec4> colors;
    std::vector<glm::vec2> uvs;
    std::vector<uint32_t> indices;

    // Appends one quad as two triangles (0, 1, 2) and (0, 2, 3)
    void addQuad(const glm::vec3 corners[4], const glm::vec3& normal,
                 const glm::vec4& color, const glm::vec2 quadUvs[4]) {
        uint32_t base = static_cast<uint32_t>(vertices.size());
        for (int i = 0; i < 4; i++) {
            vertices.push_back(corners[i]);
            normals.push_back(normal);
            colors.push_back(color);
            uvs.push_back(quadUvs[i]);
        }
        indices.insert(indices.end(), {base, base + 1, base + 2, base, base + 2, base + 3});
    }

    size_t getQuadCount() const { return vertices.size() / 4; }
    bool isEmpty() const { return vertices.empty(); }

    void clear() {
        vertices.clear();
        normals.clear();
        colors.clear();
        uvs.clear();
        indices.clear();
    }
};

} // namespace Deepvale
