#include "MathHelper.hpp"

namespace Deepvale {

int32_t MathHelper::floorDiv(int32_t dividend, int32_t divisor) {
    int32_t quotient = dividend / divisor;
    if ((dividend % divisor != 0) && ((dividend < 0) != (divisor < 0))) {
        quotient--;
    }
    return quotient;
}

int32_t MathHelper::floorMod(int32_t dividend, int32_t divisor) {
    int32_t result = dividend % divisor;
    if ((result ^ divisor) < 0 && result != 0) {
        result += divisor;
    }
    return result;
}

float MathHelper::clamp01(float value) {
    if (value < 0.0f) return 0.0f;
    if (value > 1.0f) return 1.0f;
    return value;
}

} // namespace Deepvale
