#pragma once

#include <cstdint>

namespace Helios::Graphics {

// Device-reported sizes for one acceleration structure build.
struct AccelerationBufferSizes {
    uint64_t resultBytes = 0;
    uint64_t scratchBytes = 0;
};

// Grow-only: an existing buffer is kept while it covers the requirement.
[[nodiscard]] constexpr bool NeedsReallocation(uint64_t currentCapacity, uint64_t requiredBytes) {
    return currentCapacity == 0 || currentCapacity < requiredBytes;
}

struct AccelerationBufferPlan {
    bool reallocateResult = false;
    bool reallocateScratch = false;
    AccelerationBufferSizes allocate;  // sizes to create where reallocation is needed
};

[[nodiscard]] constexpr AccelerationBufferPlan PlanAccelerationBuffers(const AccelerationBufferSizes& current,
                                                                       const AccelerationBufferSizes& required) {
    AccelerationBufferPlan plan;
    plan.reallocateResult = NeedsReallocation(current.resultBytes, required.resultBytes);
    plan.reallocateScratch = NeedsReallocation(current.scratchBytes, required.scratchBytes);
    plan.allocate.resultBytes = plan.reallocateResult ? required.resultBytes : current.resultBytes;
    plan.allocate.scratchBytes = plan.reallocateScratch ? required.scratchBytes : current.scratchBytes;
    return plan;
}

} // namespace Helios::Graphics
