#pragma once

#include <functional>
#include <variant>

#include <glm/glm.hpp>

namespace Helios::Graphics {

// How an instance's world transform evolves from frame to frame.
struct Stationary {};

struct ConstantRotation {
    glm::vec3 axis = glm::normalize(glm::vec3(0.0f, 1.0f, 1.0f));
    float degreesPerSecond = 90.0f;
};

// Receives the base transform and total elapsed seconds, returns the world transform.
struct CustomTransform {
    std::function<glm::mat4(const glm::mat4& base, double elapsedSeconds)> evaluate;
};

using TransformUpdatePolicy = std::variant<Stationary, ConstantRotation, CustomTransform>;

[[nodiscard]] glm::mat4 EvaluateTransform(const TransformUpdatePolicy& policy,
                                          const glm::mat4& base,
                                          double elapsedSeconds);

// True when the policy can produce a different transform on a later frame.
[[nodiscard]] bool IsAnimated(const TransformUpdatePolicy& policy);

} // namespace Helios::Graphics
