#pragma once

#include "FaceDirection.hpp"
#include <glm/glm.hpp>

namespace Deepvale {

namespace FaceUtils {

inline constexpr int toIndex(FaceDirection dir) {
    return static_cast<int>(dir);
}

// Neighbour offset for each face, indexed by FaceDirection
inline constexpr glm::ivec3 FACE_DIRS[6] = {
    { 1,  0,  0},
    {-1,  0,  0},
    { 0,  1,  0},
    { 0, -1,  0},
    { 0,  0,  1},
    { 0,  0, -1},
};

inline constexpr glm::vec3 FACE_NORMALS[6] = {
    { 1.0f,  0.0f,  0.0f},
    {-1.0f,  0.0f,  0.0f},
    { 0.0f,  1.0f,  0.0f},
    { 0.0f, -1.0f,  0.0f},
    { 0.0f,  0.0f,  1.0f},
    { 0.0f,  0.0f, -1.0f},
};

// Unit cube corners per face, counter-clockwise seen from outside;
// triangles are (0, 1, 2) and (0, 2, 3)
inline constexpr glm::vec3 FACE_VERTICES[6][4] = {
    // +X
    {{1, 0, 0}, {1, 1, 0}, {1, 1, 1}, {1, 0, 1}},
    // -X
    {{0, 0, 1}, {0, 1, 1}, {0, 1, 0}, {0, 0, 0}},
    // +Y
    {{0, 1, 0}, {0, 1, 1}, {1, 1, 1}, {1, 1, 0}},
    // -Y
    {{0, 0, 1}, {0, 0, 0}, {1, 0, 0}, {1, 0, 1}},
    // +Z
    {{1, 0, 1}, {1, 1, 1}, {0, 1, 1}, {0, 0, 1}},
    // -Z
    {{0, 0, 0}, {0, 1, 0}, {1, 1, 0}, {1, 0, 0}},
};

inline constexpr glm::vec2 FACE_UVS[4] = {
    {0.0f, 0.0f}, {0.0f, 1.0f}, {1.0f, 1.0f}, {1.0f, 0.0f}
};

} // namespace FaceUtils

} // namespace Deepvale
