// test_descriptor_slot_allocator.cpp
// Unit tests for the append-only descriptor slot allocator shared by every heap kind
// Run: test_descriptor_slot_allocator.exe

#include "Graphics/RHI/DescriptorSlotAllocator.h"
#include "Utils/Verify.h"

#include <iostream>
#include <string>

using namespace Helios;
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

bool test_slots_are_sequential() {
    DescriptorSlotAllocator slots("CbvSrvUav", 16);
    constexpr uint32_t kCount = 10;

    for (uint32_t i = 0; i < kCount; ++i) {
        const uint32_t index = slots.Allocate();
        TEST_ASSERT(index == i, "Slot " + std::to_string(i) + " allocated as " + std::to_string(index));
    }

    TEST_ASSERT(slots.GetAllocatedCount() == kCount, "Allocated count should match allocations");
    TEST_ASSERT(slots.GetRemaining() == 16 - kCount, "Remaining should shrink with each allocation");
    TEST_ASSERT(slots.HasSpace(), "Heap should still have space");
    TEST_PASS();
}

bool test_fill_to_capacity() {
    DescriptorSlotAllocator slots("Rtv", 4);
    for (uint32_t i = 0; i < 4; ++i) {
        (void)slots.Allocate();
    }

    TEST_ASSERT(!slots.HasSpace(), "Full heap should report no space");
    TEST_ASSERT(slots.GetRemaining() == 0, "Full heap has nothing remaining");
    TEST_PASS();
}

bool test_allocation_past_capacity_is_fatal() {
    DescriptorSlotAllocator slots("Dsv", 1);
    (void)slots.Allocate();

    std::string message;
    try {
        (void)slots.Allocate();
    } catch (const Utils::FatalError& e) {
        message = e.what();
    }

    TEST_ASSERT(!message.empty(), "Allocating past capacity must be fatal");
    TEST_ASSERT(message.find("Dsv heap exhausted") != std::string::npos,
                "Fatal message should name the heap, got: " + message);
    TEST_ASSERT(slots.GetAllocatedCount() == 1, "Failed allocation must not consume a slot");
    TEST_PASS();
}

bool test_zero_capacity_is_always_full() {
    DescriptorSlotAllocator slots;
    TEST_ASSERT(!slots.HasSpace(), "Default allocator has no capacity");

    bool threw = false;
    try {
        (void)slots.Allocate();
    } catch (const Utils::FatalError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Allocating from a zero-capacity heap must be fatal");
    TEST_PASS();
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "================================================" << std::endl;
    std::cout << "Descriptor Slot Allocator Unit Tests" << std::endl;
    std::cout << "================================================" << std::endl;

    auto previousHandler = Utils::InstallThrowingFatalHandler();

    test_slots_are_sequential();
    test_fill_to_capacity();
    test_allocation_past_capacity_is_fatal();
    test_zero_capacity_is_always_full();

    Utils::SetFatalHandler(std::move(previousHandler));

    std::cout << "\n================================================" << std::endl;
    std::cout << "Results: " << g_testsPassed << " passed, " << g_testsFailed << " failed" << std::endl;
    std::cout << "================================================" << std::endl;

    return g_testsFailed > 0 ? 1 : 0;
}
