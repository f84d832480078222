#include "TransformUpdatePolicy.h"

#include <cmath>
#include <type_traits>
#include <glm/gtc/matrix_transform.hpp>

namespace Helios::Graphics {

glm::mat4 EvaluateTransform(const TransformUpdatePolicy& policy,
                            const glm::mat4& base,
                            double elapsedSeconds) {
    return std::visit([&](auto&& arg) -> glm::mat4 {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, ConstantRotation>) {
            const float length = glm::length(arg.axis);
            if (length <= 0.0f) {
                return base;
            }
            // Wrap before converting to float so long sessions keep precision.
            const double degrees = std::fmod(elapsedSeconds * arg.degreesPerSecond, 360.0);
            const float radians = glm::radians(static_cast<float>(degrees));
            return base * glm::rotate(glm::mat4(1.0f), radians, arg.axis / length);
        } else if constexpr (std::is_same_v<T, CustomTransform>) {
            return arg.evaluate ? arg.evaluate(base, elapsedSeconds) : base;
        } else {
            return base;
        }
    }, policy);
}

bool IsAnimated(const TransformUpdatePolicy& policy) {
    if (const auto* rotation = std::get_if<ConstantRotation>(&policy)) {
        return rotation->degreesPerSecond != 0.0f;
    }
    if (const auto* custom = std::get_if<CustomTransform>(&policy)) {
        return static_cast<bool>(custom->evaluate);
    }
    return false;
}

} // namespace Helios::Graphics
