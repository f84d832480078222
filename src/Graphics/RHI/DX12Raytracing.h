#pragma once

#include "D3D12Includes.h"
#include "AccelerationBufferPolicy.h"
#include "DeferredReleaseQueue.h"
#include "DescriptorHeap.h"
#include "FenceValue.h"
#include "RaytracingInstance.h"
#include "Graphics/TransformUpdatePolicy.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <glm/glm.hpp>

namespace Helios::Graphics {

class DX12Device;
class DX12CommandQueue;

enum class BuildMode {
    FullBuild,
    Update,  // refit in place; requires ALLOW_UPDATE and a prior build
};

using RetiredBufferQueue = DeferredReleaseQueue<ComPtr<ID3D12Resource>>;

// Bottom-level acceleration structure over a fixed list of triangle geometries.
// Geometry is frozen by the first build; result and scratch buffers are
// allocated once at that point and never resized.
class BottomLevelAS {
public:
    BottomLevelAS(std::string name, D3D12_RAYTRACING_ACCELERATION_STRUCTURE_BUILD_FLAGS flags);

    BottomLevelAS(const BottomLevelAS&) = delete;
    BottomLevelAS& operator=(const BottomLevelAS&) = delete;
    BottomLevelAS(BottomLevelAS&&) = default;
    BottomLevelAS& operator=(BottomLevelAS&&) = default;

    void AddGeometry(const D3D12_RAYTRACING_GEOMETRY_DESC& geometry);

    // Only the per-geometry transform address may change between builds.
    void SetGeometryTransform(size_t geometryIndex, D3D12_GPU_VIRTUAL_ADDRESS transform3x4);

    // Records the build. Allocates buffers on the first call.
    Result<void> Build(DX12Device& device, ID3D12GraphicsCommandList4* cmdList, BuildMode mode);

    // Scratch is only needed again for updates.
    void ReleaseScratch() { m_scratch.Reset(); }

    [[nodiscard]] bool IsBuilt() const { return m_built; }
    [[nodiscard]] bool AllowsUpdate() const {
        return (m_flags & D3D12_RAYTRACING_ACCELERATION_STRUCTURE_BUILD_FLAG_ALLOW_UPDATE) != 0;
    }
    [[nodiscard]] size_t GetGeometryCount() const { return m_geometries.size(); }
    [[nodiscard]] ID3D12Resource* GetResult() const { return m_result.Get(); }
    [[nodiscard]] D3D12_GPU_VIRTUAL_ADDRESS GetGPUVirtualAddress() const {
        return m_result ? m_result->GetGPUVirtualAddress() : 0;
    }
    [[nodiscard]] const AccelerationBufferSizes& GetBufferSizes() const { return m_sizes; }
    [[nodiscard]] const std::string& GetName() const { return m_name; }

private:
    [[nodiscard]] D3D12_BUILD_RAYTRACING_ACCELERATION_STRUCTURE_INPUTS MakeInputs(BuildMode mode) const;
    Result<void> AllocateBuffers(DX12Device& device);

    std::string m_name;
    D3D12_RAYTRACING_ACCELERATION_STRUCTURE_BUILD_FLAGS m_flags;
    std::vector<D3D12_RAYTRACING_GEOMETRY_DESC> m_geometries;

    ComPtr<ID3D12Resource> m_result;
    ComPtr<ID3D12Resource> m_scratch;
    AccelerationBufferSizes m_sizes;
    bool m_built = false;
};

// Top-level acceleration structure. Always fully rebuilt; result and scratch
// buffers grow on demand and instance records are uploaded through a
// per-frame ring of upload buffers.
class TopLevelAS {
public:
    TopLevelAS() = default;
    TopLevelAS(std::string name,
               D3D12_RAYTRACING_ACCELERATION_STRUCTURE_BUILD_FLAGS flags,
               uint32_t framesInFlight);

    TopLevelAS(const TopLevelAS&) = delete;
    TopLevelAS& operator=(const TopLevelAS&) = delete;
    TopLevelAS(TopLevelAS&&) = default;
    TopLevelAS& operator=(TopLevelAS&&) = default;

    // Instance order is the InstanceIndex() seen by hit shaders.
    Result<uint32_t> AddInstance(const BottomLevelAS& blas, const glm::mat4& world, const InstanceFields& fields);
    void SetInstanceTransform(uint32_t instanceIndex, const glm::mat4& world);

    // Grow-only sizing. Returns true when the result buffer was reallocated,
    // i.e. its GPU address changed and views over it must be recreated.
    // Replaced buffers are parked in retired until lastUseFence completes.
    Result<bool> AllocateBuffers(DX12Device& device, RetiredBufferQueue& retired, FenceValue lastUseFence);

    // Writes the instance records into the upload buffer for frameSlot.
    Result<void> UploadInstances(DX12Device& device, uint32_t frameSlot,
                                 RetiredBufferQueue& retired, FenceValue lastUseFence);

    // Full build from the instance buffer last uploaded.
    void Build(ID3D12GraphicsCommandList4* cmdList);

    [[nodiscard]] uint32_t GetInstanceCount() const { return static_cast<uint32_t>(m_instances.size()); }
    [[nodiscard]] const std::vector<RaytracingInstanceDesc>& GetInstances() const { return m_instances; }
    [[nodiscard]] ID3D12Resource* GetResult() const { return m_result.Get(); }
    [[nodiscard]] D3D12_GPU_VIRTUAL_ADDRESS GetGPUVirtualAddress() const {
        return m_result ? m_result->GetGPUVirtualAddress() : 0;
    }
    [[nodiscard]] AccelerationBufferSizes GetBufferCapacity() const;
    [[nodiscard]] const std::string& GetName() const { return m_name; }

private:
    struct InstanceUploadBuffer {
        ComPtr<ID3D12Resource> buffer;
        uint32_t capacity = 0;  // in instances
    };

    [[nodiscard]] D3D12_BUILD_RAYTRACING_ACCELERATION_STRUCTURE_INPUTS MakeInputs() const;

    std::string m_name;
    D3D12_RAYTRACING_ACCELERATION_STRUCTURE_BUILD_FLAGS m_flags = D3D12_RAYTRACING_ACCELERATION_STRUCTURE_BUILD_FLAG_NONE;
    std::vector<RaytracingInstanceDesc> m_instances;

    std::vector<InstanceUploadBuffer> m_instanceBuffers;
    D3D12_GPU_VIRTUAL_ADDRESS m_currentInstanceAddress = 0;

    ComPtr<ID3D12Resource> m_result;
    ComPtr<ID3D12Resource> m_scratch;
};

// Per-geometry lookup table consumed by hit shaders. Entries are grouped by
// BLAS in geometry order, so an instance using the default instance id finds
// its geometry at MeshData[InstanceID() + GeometryIndex()]. Unset slots hold
// kInvalidDescriptorIndex. Layout must match the HLSL struct.
struct MeshData {
    uint32_t indexBufferIndex = kInvalidDescriptorIndex;
    uint32_t colorBufferIndex = kInvalidDescriptorIndex;
    uint32_t reserved[2] = { kInvalidDescriptorIndex, kInvalidDescriptorIndex };
};
static_assert(sizeof(MeshData) == 16, "MeshData must stay a 16-byte structured buffer element");

// Triangle mesh buffers handed to AddMesh. Buffers are owned by the caller and
// must outlive the scene.
struct MeshGeometry {
    ID3D12Resource* vertexBuffer = nullptr;
    uint32_t vertexCount = 0;
    uint32_t vertexStride = sizeof(float) * 3;
    DXGI_FORMAT vertexFormat = DXGI_FORMAT_R32G32B32_FLOAT;

    ID3D12Resource* indexBuffer = nullptr;
    uint32_t indexCount = 0;
    DXGI_FORMAT indexFormat = DXGI_FORMAT_R32_UINT;

    // Optional per-vertex colors exposed through MeshData.
    ID3D12Resource* colorBuffer = nullptr;

    // Optional caller-owned row-major 3x4 transform. Must be 0 when the mesh
    // is given an animated transform policy.
    D3D12_GPU_VIRTUAL_ADDRESS transformAddress = 0;

    bool opaque = true;
};

struct BlasId {
    uint32_t value = 0;
};

struct InstanceId {
    uint32_t value = 0;
};

struct InstanceOptions {
    uint32_t mask = kMaxInstanceMask;
    uint32_t hitGroupOffset = 0;
    uint32_t flags = D3D12_RAYTRACING_INSTANCE_FLAG_NONE;
    std::optional<uint32_t> instanceId;  // defaults to the BLAS's first MeshData index
    glm::mat4 baseTransform = glm::mat4(1.0f);
};

struct RaytracingSceneDesc {
    std::string name = "RaytracingScene";
    uint32_t framesInFlight = 3;
    D3D12_RAYTRACING_ACCELERATION_STRUCTURE_BUILD_FLAGS tlasFlags =
        D3D12_RAYTRACING_ACCELERATION_STRUCTURE_BUILD_FLAG_PREFER_FAST_BUILD;
};

// Owns every BLAS and the single TLAS of a scene.
//
// Build() performs the one-time full build on the direct queue and waits for
// it. Update() then records per-frame work into the caller's command list:
// BLAS refits, TLAS buffer growth, instance upload, TLAS rebuild and the
// barriers between them.
class RaytracingScene {
public:
    RaytracingScene() = default;
    ~RaytracingScene();

    RaytracingScene(const RaytracingScene&) = delete;
    RaytracingScene& operator=(const RaytracingScene&) = delete;
    RaytracingScene(RaytracingScene&&) = delete;
    RaytracingScene& operator=(RaytracingScene&&) = delete;

    Result<void> Initialize(DX12Device& device,
                            DX12CommandQueue& directQueue,
                            CbvSrvUavHeap& viewHeap,
                            const RaytracingSceneDesc& desc = {});

    // Waits for every frame that may reference scene buffers, then releases them.
    void Shutdown();

    BlasId AddBlas(D3D12_RAYTRACING_ACCELERATION_STRUCTURE_BUILD_FLAGS flags);

    // Appends a triangle geometry to an unbuilt BLAS. Animated transform
    // policies need the BLAS to allow updates.
    Result<void> AddMesh(BlasId blas, const MeshGeometry& mesh, TransformUpdatePolicy transformPolicy = Stationary{});

    Result<InstanceId> AddInstance(BlasId blas,
                                   TransformUpdatePolicy transformPolicy = Stationary{},
                                   const InstanceOptions& options = {});

    Result<void> Build();

    // elapsedSeconds is the scene time fed to every transform policy.
    Result<void> Update(ID3D12GraphicsCommandList4* cmdList, uint32_t frameIndex, double elapsedSeconds);

    [[nodiscard]] bool IsBuilt() const { return m_built; }
    [[nodiscard]] SrvHandle GetTlasSrv() const { return m_tlasSrv; }
    [[nodiscard]] D3D12_GPU_VIRTUAL_ADDRESS GetTlasAddress() const { return m_tlas.GetGPUVirtualAddress(); }
    [[nodiscard]] const TopLevelAS& GetTlas() const { return m_tlas; }
    [[nodiscard]] const BottomLevelAS& GetBlas(BlasId id) const;
    [[nodiscard]] size_t GetBlasCount() const { return m_blasList.size(); }
    [[nodiscard]] const std::vector<MeshData>& GetMeshData() const { return m_meshData; }
    // Index of the BLAS's first geometry in the MeshData table.
    [[nodiscard]] uint32_t GetMeshDataBaseIndex(BlasId id) const;
    [[nodiscard]] SrvHandle GetMeshDataSrv() const { return m_meshDataSrv; }
    [[nodiscard]] uint32_t GetTlasSrvRecreateCount() const { return m_tlasSrvRecreateCount; }
    [[nodiscard]] size_t GetRetiredBufferCount() const { return m_retired.GetPendingCount(); }

private:
    struct MeshRecord {
        BlasId blas;
        size_t geometryIndex = 0;
        TransformUpdatePolicy transformPolicy;
        uint32_t transformSlot = 0;  // index into the animated transform ring
    };

    struct InstanceRecord {
        BlasId blas;
        TransformUpdatePolicy transformPolicy;
        InstanceOptions options;
    };

    [[nodiscard]] InstanceFields MakeInstanceFields(const InstanceRecord& record) const;
    Result<void> CreateGeometryTransformRing();
    Result<void> WriteGeometryTransforms(uint32_t frameSlot, double elapsedSeconds);
    Result<void> CreateMeshDataBuffer();
    Result<void> RecordTlasBuild(ID3D12GraphicsCommandList4* cmdList, uint32_t frameSlot,
                                 double elapsedSeconds, FenceValue lastUseFence);
    void RecreateTlasSrv();

    DX12Device* m_device = nullptr;
    DX12CommandQueue* m_queue = nullptr;
    CbvSrvUavHeap* m_viewHeap = nullptr;
    RaytracingSceneDesc m_desc;

    std::vector<BottomLevelAS> m_blasList;
    std::vector<MeshRecord> m_meshes;
    std::vector<InstanceRecord> m_instances;
    std::vector<MeshData> m_meshData;
    TopLevelAS m_tlas;

    // framesInFlight x animated mesh count row-major 3x4 matrices.
    ComPtr<ID3D12Resource> m_geometryTransforms;
    uint32_t m_animatedMeshCount = 0;

    ComPtr<ID3D12Resource> m_meshDataBuffer;
    SrvHandle m_meshDataSrv;

    SrvHandle m_tlasSrv;
    uint32_t m_tlasSrvRecreateCount = 0;

    RetiredBufferQueue m_retired;
    bool m_built = false;
};

} // namespace Helios::Graphics
