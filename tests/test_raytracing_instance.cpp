// test_raytracing_instance.cpp
// Unit tests for top-level instance record packing
// Run: test_raytracing_instance.exe
//
// These tests verify that:
// 1. Instance id, mask, hit group offset and flags survive encode/decode
// 2. Values wider than their bitfield are rejected, not truncated
// 3. Transforms are written row-major 3x4 (transpose of the glm matrix)
// 4. Packed words land at the native byte offsets

#include "Graphics/RHI/RaytracingInstance.h"

#include <cmath>
#include <cstring>
#include <iostream>

#include <glm/gtc/matrix_transform.hpp>

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
// Field Packing
// ============================================================================

bool test_round_trip_full_mask_and_wide_id() {
    InstanceFields fields;
    fields.instanceId = 0x123456;
    fields.mask = 0xFF;
    fields.hitGroupOffset = 0;
    fields.flags = 0;

    auto encoded = EncodeInstance(glm::mat4(1.0f), fields);
    TEST_ASSERT(encoded.IsOk(), "Valid fields should encode");

    const InstanceFields decoded = DecodeInstanceFields(encoded.Value());
    TEST_ASSERT(decoded.instanceId == 0x123456, "Instance id should round-trip");
    TEST_ASSERT(decoded.mask == 0xFF, "Mask should round-trip");
    TEST_ASSERT(decoded.hitGroupOffset == 0, "Hit group offset should round-trip");
    TEST_ASSERT(decoded.flags == 0, "Flags should round-trip");
    TEST_ASSERT(encoded.Value().instanceIdAndMask == 0xFF123456u, "Packed word should be mask<<24 | id");
    TEST_PASS();
}

bool test_offset_and_flags_share_second_word() {
    InstanceFields fields;
    fields.hitGroupOffset = 0xABCDEF;
    fields.flags = 0x4;  // FORCE_OPAQUE
    fields.accelerationStructure = 0x1000200030004000ull;

    auto encoded = EncodeInstance(glm::mat4(1.0f), fields);
    TEST_ASSERT(encoded.IsOk(), "Valid fields should encode");
    TEST_ASSERT(encoded.Value().hitGroupOffsetAndFlags == 0x04ABCDEFu, "Packed word should be flags<<24 | offset");

    const InstanceFields decoded = DecodeInstanceFields(encoded.Value());
    TEST_ASSERT(decoded.hitGroupOffset == 0xABCDEF, "Offset should round-trip");
    TEST_ASSERT(decoded.flags == 0x4, "Flags should round-trip");
    TEST_ASSERT(decoded.accelerationStructure == fields.accelerationStructure, "BLAS address should round-trip");
    TEST_PASS();
}

bool test_rejects_oversized_fields() {
    InstanceFields wideId;
    wideId.instanceId = 0x1000000;
    auto idResult = EncodeInstance(glm::mat4(1.0f), wideId);
    TEST_ASSERT(idResult.IsErr(), "Instance id above 0xFFFFFF must be rejected");
    TEST_ASSERT(idResult.Error().code == ErrorCode::InvalidArgument, "Rejection should be InvalidArgument");

    InstanceFields wideOffset;
    wideOffset.hitGroupOffset = 0x1000000;
    TEST_ASSERT(EncodeInstance(glm::mat4(1.0f), wideOffset).IsErr(), "Offset above 0xFFFFFF must be rejected");

    InstanceFields wideMask;
    wideMask.mask = 0x100;
    TEST_ASSERT(EncodeInstance(glm::mat4(1.0f), wideMask).IsErr(), "Mask above 0xFF must be rejected");

    InstanceFields wideFlags;
    wideFlags.flags = 0x100;
    TEST_ASSERT(EncodeInstance(glm::mat4(1.0f), wideFlags).IsErr(), "Flags above 0xFF must be rejected");
    TEST_PASS();
}

bool test_accepts_maximum_fields() {
    InstanceFields fields;
    fields.instanceId = kMaxInstanceId;
    fields.mask = kMaxInstanceMask;
    fields.hitGroupOffset = kMaxHitGroupOffset;
    fields.flags = kMaxInstanceFlags;

    auto encoded = EncodeInstance(glm::mat4(1.0f), fields);
    TEST_ASSERT(encoded.IsOk(), "Maximum field values should encode");
    TEST_ASSERT(encoded.Value().instanceIdAndMask == 0xFFFFFFFFu, "All id/mask bits should be set");
    TEST_ASSERT(encoded.Value().hitGroupOffsetAndFlags == 0xFFFFFFFFu, "All offset/flag bits should be set");
    TEST_PASS();
}

// ============================================================================
// Transform Layout
// ============================================================================

bool test_translation_lands_in_last_column() {
    const glm::mat4 world = glm::translate(glm::mat4(1.0f), glm::vec3(1.0f, 2.0f, 3.0f));
    float rows[3][4];
    ToRowMajor3x4(world, rows);

    TEST_ASSERT(rows[0][3] == 1.0f && rows[1][3] == 2.0f && rows[2][3] == 3.0f,
                "Translation should occupy column 3 of each row");
    TEST_ASSERT(rows[0][0] == 1.0f && rows[1][1] == 1.0f && rows[2][2] == 1.0f, "Diagonal should be identity");
    TEST_PASS();
}

bool test_rotation_is_transposed() {
    const glm::mat4 world = glm::rotate(glm::mat4(1.0f), glm::radians(90.0f), glm::vec3(0.0f, 0.0f, 1.0f));
    float rows[3][4];
    ToRowMajor3x4(world, rows);

    // Row-major: rows[r][c] holds world[c][r].
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 4; ++c) {
            TEST_ASSERT(rows[r][c] == world[c][r], "Element mismatch at row " << r << " col " << c);
        }
    }

    const glm::mat4 back = FromRowMajor3x4(rows);
    for (int c = 0; c < 4; ++c) {
        for (int r = 0; r < 4; ++r) {
            TEST_ASSERT(std::abs(back[c][r] - world[c][r]) < 1e-6f, "Inverse layout should restore the matrix");
        }
    }
    TEST_PASS();
}

bool test_packed_words_at_native_offsets() {
    InstanceFields fields;
    fields.instanceId = 0x000102;
    fields.mask = 0x0F;
    fields.accelerationStructure = 0xDEADBEEF00ull;

    auto encoded = EncodeInstance(glm::mat4(1.0f), fields);
    TEST_ASSERT(encoded.IsOk(), "Valid fields should encode");

    unsigned char bytes[sizeof(RaytracingInstanceDesc)];
    std::memcpy(bytes, &encoded.Value(), sizeof(bytes));

    uint32_t word0 = 0;
    uint64_t address = 0;
    std::memcpy(&word0, bytes + 48, sizeof(word0));
    std::memcpy(&address, bytes + 56, sizeof(address));
    TEST_ASSERT(word0 == 0x0F000102u, "Word at byte 48 should hold id | mask<<24");
    TEST_ASSERT(address == 0xDEADBEEF00ull, "BLAS address should sit at byte 56");
    TEST_PASS();
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "================================================" << std::endl;
    std::cout << "Raytracing Instance Encoding Unit Tests" << std::endl;
    std::cout << "================================================" << std::endl;

    test_round_trip_full_mask_and_wide_id();
    test_offset_and_flags_share_second_word();
    test_rejects_oversized_fields();
    test_accepts_maximum_fields();

    std::cout << "\n--- Transform Layout ---" << std::endl;
    test_translation_lands_in_last_column();
    test_rotation_is_transposed();
    test_packed_words_at_native_offsets();

    std::cout << "\n================================================" << std::endl;
    std::cout << "Results: " << g_testsPassed << " passed, " << g_testsFailed << " failed" << std::endl;
    std::cout << "================================================" << std::endl;

    return g_testsFailed > 0 ? 1 : 0;
}
