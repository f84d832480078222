// test_transform_update_policy.cpp
// Unit tests for per-instance transform update policies
// Run: test_transform_update_policy.exe

#include "Graphics/TransformUpdatePolicy.h"

#include <cmath>
#include <iostream>

#include <glm/gtc/matrix_transform.hpp>

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

static bool NearlyEqual(const glm::vec3& a, const glm::vec3& b, float eps = 1e-4f) {
    return std::abs(a.x - b.x) < eps && std::abs(a.y - b.y) < eps && std::abs(a.z - b.z) < eps;
}

static bool NearlyEqual(const glm::mat4& a, const glm::mat4& b, float eps = 1e-4f) {
    for (int c = 0; c < 4; ++c) {
        for (int r = 0; r < 4; ++r) {
            if (std::abs(a[c][r] - b[c][r]) >= eps) {
                return false;
            }
        }
    }
    return true;
}

// ============================================================================
// Tests
// ============================================================================

bool test_stationary_returns_base() {
    const glm::mat4 base = glm::translate(glm::mat4(1.0f), glm::vec3(4.0f, 5.0f, 6.0f));
    TEST_ASSERT(EvaluateTransform(Stationary{}, base, 123.0) == base, "Stationary must not alter the base");
    TEST_ASSERT(!IsAnimated(Stationary{}), "Stationary is not animated");
    TEST_PASS();
}

bool test_default_rotation_axis() {
    const ConstantRotation rotation;
    TEST_ASSERT(NearlyEqual(rotation.axis, glm::normalize(glm::vec3(0.0f, 1.0f, 1.0f))),
                "Default axis should be normalize(0,1,1)");
    TEST_ASSERT(rotation.degreesPerSecond == 90.0f, "Default rate should be 90 degrees per second");
    TEST_ASSERT(IsAnimated(rotation), "Rotation is animated");
    TEST_PASS();
}

bool test_rotation_quarter_turn() {
    ConstantRotation rotation;
    rotation.axis = glm::vec3(0.0f, 1.0f, 0.0f);
    rotation.degreesPerSecond = 90.0f;

    const glm::mat4 world = EvaluateTransform(rotation, glm::mat4(1.0f), 1.0);
    const glm::vec3 rotated = glm::vec3(world * glm::vec4(1.0f, 0.0f, 0.0f, 0.0f));
    TEST_ASSERT(NearlyEqual(rotated, glm::vec3(0.0f, 0.0f, -1.0f)),
                "+X rotated 90 degrees about +Y should point at -Z");
    TEST_PASS();
}

bool test_rotation_applies_after_base() {
    ConstantRotation rotation;
    rotation.axis = glm::vec3(0.0f, 0.0f, 1.0f);
    const glm::mat4 base = glm::translate(glm::mat4(1.0f), glm::vec3(10.0f, 0.0f, 0.0f));

    const glm::mat4 world = EvaluateTransform(rotation, base, 2.0);
    const glm::vec3 origin = glm::vec3(world * glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));
    TEST_ASSERT(NearlyEqual(origin, glm::vec3(10.0f, 0.0f, 0.0f)),
                "Rotation is about the object origin, so the translation is kept");
    TEST_PASS();
}

bool test_rotation_wraps_full_turns() {
    const ConstantRotation rotation;
    const glm::mat4 atZero = EvaluateTransform(rotation, glm::mat4(1.0f), 0.0);
    const glm::mat4 atFullTurn = EvaluateTransform(rotation, glm::mat4(1.0f), 4.0);
    const glm::mat4 afterManyTurns = EvaluateTransform(rotation, glm::mat4(1.0f), 4.0 * 100000.0 + 1.0);
    const glm::mat4 atOneSecond = EvaluateTransform(rotation, glm::mat4(1.0f), 1.0);

    TEST_ASSERT(NearlyEqual(atZero, glm::mat4(1.0f)), "Zero elapsed time is the identity rotation");
    TEST_ASSERT(NearlyEqual(atFullTurn, atZero), "Four seconds at 90 deg/s is a full turn");
    TEST_ASSERT(NearlyEqual(afterManyTurns, atOneSecond), "Long sessions should keep precision");
    TEST_PASS();
}

bool test_degenerate_axis_is_ignored() {
    ConstantRotation rotation;
    rotation.axis = glm::vec3(0.0f);
    TEST_ASSERT(EvaluateTransform(rotation, glm::mat4(1.0f), 1.0) == glm::mat4(1.0f),
                "Zero-length axis should leave the base unchanged");
    TEST_PASS();
}

bool test_custom_transform() {
    CustomTransform custom;
    custom.evaluate = [](const glm::mat4& base, double t) {
        return glm::translate(base, glm::vec3(static_cast<float>(t), 0.0f, 0.0f));
    };

    const glm::mat4 world = EvaluateTransform(custom, glm::mat4(1.0f), 3.0);
    TEST_ASSERT(world[3][0] == 3.0f, "Custom callback result should be returned");
    TEST_ASSERT(IsAnimated(custom), "Custom transform with a callback is animated");

    TEST_ASSERT(!IsAnimated(CustomTransform{}), "Custom transform without a callback is not animated");
    TEST_ASSERT(EvaluateTransform(CustomTransform{}, glm::mat4(2.0f), 1.0) == glm::mat4(2.0f),
                "Empty callback falls back to the base");
    TEST_PASS();
}

bool test_zero_rate_is_not_animated() {
    ConstantRotation rotation;
    rotation.degreesPerSecond = 0.0f;
    TEST_ASSERT(!IsAnimated(rotation), "Zero-rate rotation never changes");
    TEST_PASS();
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "================================================" << std::endl;
    std::cout << "Transform Update Policy Unit Tests" << std::endl;
    std::cout << "================================================" << std::endl;

    test_stationary_returns_base();
    test_default_rotation_axis();
    test_rotation_quarter_turn();
    test_rotation_applies_after_base();
    test_rotation_wraps_full_turns();
    test_degenerate_axis_is_ignored();
    test_custom_transform();
    test_zero_rate_is_not_animated();
    std::cout << "\n================================================" << std::endl;
    std::cout << "Results: " << g_testsPassed << " passed, " << g_testsFailed << " failed" << std::endl;
    std::cout << "================================================" << std::endl;

    return g_testsFailed > 0 ? 1 : 0;
}
