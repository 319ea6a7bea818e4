#pragma once

#include <array>
#include <cstdint>

namespace Deepvale {

// Block faces in meshing order: +X, -X, +Y, -Y, +Z, -Z
enum class FaceDirection : uint8_t {
    EAST,   // +X
    WEST,   // -X
    UP,     // +Y
    DOWN,   // -Y
    SOUTH,  // +Z
    NORTH   // -Z
};

inline constexpr std::array<FaceDirection, 6> ALL_FACES = {
    FaceDirection::EAST, FaceDirection::WEST,
    FaceDirection::UP, FaceDirection::DOWN,
    FaceDirection::SOUTH, FaceDirection::NORTH
};

} // namespace Deepvale
