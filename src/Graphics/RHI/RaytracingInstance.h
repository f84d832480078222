#pragma once

#include <cstddef>
#include <cstdint>

#include <glm/glm.hpp>

#include "Utils/Result.h"

namespace Helios::Graphics {

// Field limits of the native top-level instance record.
inline constexpr uint32_t kMaxInstanceId = 0xFFFFFFu;
inline constexpr uint32_t kMaxInstanceMask = 0xFFu;
inline constexpr uint32_t kMaxHitGroupOffset = 0xFFFFFFu;
inline constexpr uint32_t kMaxInstanceFlags = 0xFFu;

// Byte-for-byte image of D3D12_RAYTRACING_INSTANCE_DESC. The bitfields are
// packed by hand so the layout does not depend on compiler bitfield rules:
//   word 0: InstanceID (bits 0-23) | InstanceMask (bits 24-31)
//   word 1: InstanceContributionToHitGroupIndex (bits 0-23) | Flags (bits 24-31)
struct RaytracingInstanceDesc {
    float transform[3][4];
    uint32_t instanceIdAndMask;
    uint32_t hitGroupOffsetAndFlags;
    uint64_t accelerationStructure;
};

static_assert(sizeof(RaytracingInstanceDesc) == 64, "instance record must be 64 bytes");
static_assert(offsetof(RaytracingInstanceDesc, instanceIdAndMask) == 48);
static_assert(offsetof(RaytracingInstanceDesc, accelerationStructure) == 56);

struct InstanceFields {
    uint32_t instanceId = 0;
    uint32_t mask = kMaxInstanceMask;
    uint32_t hitGroupOffset = 0;
    uint32_t flags = 0;
    uint64_t accelerationStructure = 0;  // GPU virtual address of the bottom-level result
};

// Row-major 3x4 object-to-world transform: the transpose of the column-major
// input with the projective row dropped.
void ToRowMajor3x4(const glm::mat4& world, float out[3][4]);
[[nodiscard]] glm::mat4 FromRowMajor3x4(const float in[3][4]);

// Rejects fields that do not fit their bit width instead of truncating them.
[[nodiscard]] Result<RaytracingInstanceDesc> EncodeInstance(const glm::mat4& world, const InstanceFields& fields);

[[nodiscard]] InstanceFields DecodeInstanceFields(const RaytracingInstanceDesc& desc);

} // namespace Helios::Graphics
