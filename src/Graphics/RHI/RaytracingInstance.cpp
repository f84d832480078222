#include "RaytracingInstance.h"

#include <spdlog/fmt/fmt.h>

namespace Helios::Graphics {

void ToRowMajor3x4(const glm::mat4& world, float out[3][4]) {
    // glm indexes [column][row]
    for (int row = 0; row < 3; ++row) {
        for (int col = 0; col < 4; ++col) {
            out[row][col] = world[col][row];
        }
    }
}

glm::mat4 FromRowMajor3x4(const float in[3][4]) {
    glm::mat4 world(1.0f);
    for (int row = 0; row < 3; ++row) {
        for (int col = 0; col < 4; ++col) {
            world[col][row] = in[row][col];
        }
    }
    return world;
}

Result<RaytracingInstanceDesc> EncodeInstance(const glm::mat4& world, const InstanceFields& fields) {
    if (fields.instanceId > kMaxInstanceId) {
        return Result<RaytracingInstanceDesc>::Err(ErrorCode::InvalidArgument,
            fmt::format("instance id 0x{:X} does not fit in 24 bits", fields.instanceId));
    }
    if (fields.mask > kMaxInstanceMask) {
        return Result<RaytracingInstanceDesc>::Err(ErrorCode::InvalidArgument,
            fmt::format("instance mask 0x{:X} does not fit in 8 bits", fields.mask));
    }
    if (fields.hitGroupOffset > kMaxHitGroupOffset) {
        return Result<RaytracingInstanceDesc>::Err(ErrorCode::InvalidArgument,
            fmt::format("hit group offset 0x{:X} does not fit in 24 bits", fields.hitGroupOffset));
    }
    if (fields.flags > kMaxInstanceFlags) {
        return Result<RaytracingInstanceDesc>::Err(ErrorCode::InvalidArgument,
            fmt::format("instance flags 0x{:X} do not fit in 8 bits", fields.flags));
    }

    RaytracingInstanceDesc desc{};
    ToRowMajor3x4(world, desc.transform);
    desc.instanceIdAndMask = fields.instanceId | (fields.mask << 24);
    desc.hitGroupOffsetAndFlags = fields.hitGroupOffset | (fields.flags << 24);
    desc.accelerationStructure = fields.accelerationStructure;
    return Result<RaytracingInstanceDesc>::Ok(desc);
}

InstanceFields DecodeInstanceFields(const RaytracingInstanceDesc& desc) {
    InstanceFields fields;
    fields.instanceId = desc.instanceIdAndMask & kMaxInstanceId;
    fields.mask = desc.instanceIdAndMask >> 24;
    fields.hitGroupOffset = desc.hitGroupOffsetAndFlags & kMaxHitGroupOffset;
    fields.flags = desc.hitGroupOffsetAndFlags >> 24;
    fields.accelerationStructure = desc.accelerationStructure;
    return fields;
}

} // namespace Helios::Graphics
