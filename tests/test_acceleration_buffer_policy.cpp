// test_acceleration_buffer_policy.cpp
// Unit tests for grow-only acceleration structure buffer sizing
// Run: test_acceleration_buffer_policy.exe

#include "Graphics/RHI/AccelerationBufferPolicy.h"

#include <iostream>

using namespace Helios::Graphics;

// ============================================================================
// Test Framework (minimal)
// ============================================================================

static int g_testsPassed = 0;
static int g_testsFailed = 0;

#define TEST_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            std::cerr << "[FAIL] " << __FUNCTION__ << ": " << message << std::endl; \
            g_testsFailed++; \
            return false; \
        } \
    } while(0)

#define TEST_PASS() \
    do { \
        std::cout << "[PASS] " << __FUNCTION__ << std::endl; \
        g_testsPassed++; \
        return true; \
    } while(0)

// ============================================================================
// Tests
// ============================================================================

bool test_first_allocation_always_happens() {
    TEST_ASSERT(NeedsReallocation(0, 256), "No buffer yet should force allocation");
    TEST_ASSERT(NeedsReallocation(0, 0), "Zero capacity should force allocation even for zero bytes");
    TEST_PASS();
}

bool test_existing_capacity_is_reused() {
    TEST_ASSERT(!NeedsReallocation(1024, 1024), "Exact fit should be reused");
    TEST_ASSERT(!NeedsReallocation(1024, 512), "Smaller requirement should reuse the buffer");
    TEST_ASSERT(NeedsReallocation(1024, 1025), "Larger requirement should reallocate");
    TEST_PASS();
}

bool test_plan_is_idempotent() {
    const AccelerationBufferSizes required{4096, 2048};

    const AccelerationBufferPlan first = PlanAccelerationBuffers({}, required);
    TEST_ASSERT(first.reallocateResult && first.reallocateScratch, "First plan allocates both buffers");
    TEST_ASSERT(first.allocate.resultBytes == 4096 && first.allocate.scratchBytes == 2048,
                "First plan should allocate the required sizes");

    const AccelerationBufferPlan second = PlanAccelerationBuffers(first.allocate, required);
    TEST_ASSERT(!second.reallocateResult, "Unchanged requirement must not reallocate the result");
    TEST_ASSERT(!second.reallocateScratch, "Unchanged requirement must not reallocate scratch");
    TEST_PASS();
}

bool test_growth_only_on_first_exceeding_call() {
    AccelerationBufferSizes capacity{};
    int resultReallocations = 0;

    // Required size grows with the instance count, then stays put.
    const uint64_t requirements[] = {256, 256, 512, 512, 384, 512, 1024, 1024};
    for (uint64_t bytes : requirements) {
        const AccelerationBufferPlan plan = PlanAccelerationBuffers(capacity, {bytes, bytes / 2});
        if (plan.reallocateResult) {
            TEST_ASSERT(bytes > capacity.resultBytes, "Reallocation only when the requirement exceeds capacity");
            ++resultReallocations;
        }
        capacity = plan.allocate;
    }

    TEST_ASSERT(resultReallocations == 3, "Expected reallocations at 256, 512 and 1024");
    TEST_ASSERT(capacity.resultBytes == 1024, "Capacity should end at the largest requirement");
    TEST_PASS();
}

bool test_scratch_and_result_are_independent() {
    const AccelerationBufferPlan plan = PlanAccelerationBuffers({1024, 256}, {512, 512});
    TEST_ASSERT(!plan.reallocateResult, "Result still fits");
    TEST_ASSERT(plan.reallocateScratch, "Scratch must grow");
    TEST_ASSERT(plan.allocate.resultBytes == 1024, "Kept result keeps its capacity");
    TEST_ASSERT(plan.allocate.scratchBytes == 512, "Grown scratch takes the required size");
    TEST_PASS();
}

// Compile-time checks of the same policy.
static_assert(NeedsReallocation(0, 1));
static_assert(!PlanAccelerationBuffers({64, 64}, {64, 64}).reallocateResult);

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "================================================" << std::endl;
    std::cout << "Acceleration Buffer Policy Unit Tests" << std::endl;
    std::cout << "================================================" << std::endl;

    test_first_allocation_always_happens();
    test_existing_capacity_is_reused();
    test_plan_is_idempotent();
    test_growth_only_on_first_exceeding_call();
    test_scratch_and_result_are_independent();

    std::cout << "\n================================================" << std::endl;
    std::cout << "Results: " << g_testsPassed << " passed, " << g_testsFailed << " failed" << std::endl;
    std::cout << "================================================" << std::endl;

    return g_testsFailed > 0 ? 1 : 0;
}
