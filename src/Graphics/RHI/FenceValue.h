#pragma once

#include <cstdint>

namespace Helios::Graphics {

// Value on a queue's fence timeline. The queue issues these strictly
// increasing from 1; 0 means "nothing submitted yet" and is always complete.
using FenceValue = uint64_t;

inline constexpr FenceValue kNoFenceValue = 0;

[[nodiscard]] constexpr bool IsFenceValueComplete(FenceValue value, FenceValue completedValue) {
    return value <= completedValue;
}

} // namespace Helios::Graphics
