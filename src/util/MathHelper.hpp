#pragma once

#include <cstdint>

namespace Deepvale {

// Integer helpers for block and chunk coordinates
class MathHelper {
public:
    // Floor division: -1 / 16 == -1, not 0
    static int32_t floorDiv(int32_t dividend, int32_t divisor);

    // Floor modulo, always in [0, divisor) for a positive divisor
    static int32_t floorMod(int32_t dividend, int32_t divisor);

    static float clamp01(float value);
};

} // namespace Deepvale
