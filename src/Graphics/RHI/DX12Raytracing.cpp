#include "DX12Raytracing.h"
#include "DX12Buffer.h"
#include "DX12CommandQueue.h"
#include "DX12Device.h"
#include "Utils/Verify.h"

#include <algorithm>
#include <cstddef>
#include <cstring>

#include <spdlog/spdlog.h>

namespace Helios::Graphics {

static_assert(sizeof(RaytracingInstanceDesc) == sizeof(D3D12_RAYTRACING_INSTANCE_DESC),
              "RaytracingInstanceDesc must match the native instance record");
static_assert(offsetof(RaytracingInstanceDesc, transform) == offsetof(D3D12_RAYTRACING_INSTANCE_DESC, Transform));
static_assert(offsetof(RaytracingInstanceDesc, accelerationStructure) ==
              offsetof(D3D12_RAYTRACING_INSTANCE_DESC, AccelerationStructure));

namespace {

constexpr uint64_t kMinAccelerationBufferBytes = D3D12_RAYTRACING_ACCELERATION_STRUCTURE_BYTE_ALIGNMENT;
constexpr uint64_t kTransform3x4Bytes = sizeof(float) * 12;

uint64_t AlignAccelerationSize(uint64_t bytes) {
    const uint64_t alignment = D3D12_RAYTRACING_ACCELERATION_STRUCTURE_BYTE_ALIGNMENT;
    return std::max(kMinAccelerationBufferBytes, (bytes + alignment - 1) & ~(alignment - 1));
}

uint64_t BufferWidth(ID3D12Resource* resource) {
    return resource ? resource->GetDesc().Width : 0;
}

} // namespace

// ========== BottomLevelAS ==========

BottomLevelAS::BottomLevelAS(std::string name, D3D12_RAYTRACING_ACCELERATION_STRUCTURE_BUILD_FLAGS flags)
    : m_name(std::move(name)), m_flags(flags) {}

void BottomLevelAS::AddGeometry(const D3D12_RAYTRACING_GEOMETRY_DESC& geometry) {
    HELIOS_VERIFY(!m_built, "{}: geometry cannot be added after the first build", m_name);
    m_geometries.push_back(geometry);
}

void BottomLevelAS::SetGeometryTransform(size_t geometryIndex, D3D12_GPU_VIRTUAL_ADDRESS transform3x4) {
    HELIOS_VERIFY(geometryIndex < m_geometries.size(), "{}: geometry index {} out of range ({} geometries)",
                  m_name, geometryIndex, m_geometries.size());
    m_geometries[geometryIndex].Triangles.Transform3x4 = transform3x4;
}

D3D12_BUILD_RAYTRACING_ACCELERATION_STRUCTURE_INPUTS BottomLevelAS::MakeInputs(BuildMode mode) const {
    D3D12_BUILD_RAYTRACING_ACCELERATION_STRUCTURE_INPUTS inputs{};
    inputs.Type = D3D12_RAYTRACING_ACCELERATION_STRUCTURE_TYPE_BOTTOM_LEVEL;
    inputs.Flags = m_flags;
    if (mode == BuildMode::Update) {
        inputs.Flags |= D3D12_RAYTRACING_ACCELERATION_STRUCTURE_BUILD_FLAG_PERFORM_UPDATE;
    }
    inputs.DescsLayout = D3D12_ELEMENTS_LAYOUT_ARRAY;
    inputs.NumDescs = static_cast<UINT>(m_geometries.size());
    inputs.pGeometryDescs = m_geometries.data();
    return inputs;
}

Result<void> BottomLevelAS::AllocateBuffers(DX12Device& device) {
    ID3D12Device5* device5 = device.GetDevice5();
    if (!device5) {
        return Result<void>::Err(ErrorCode::InvalidArgument, m_name + ": device does not expose ID3D12Device5");
    }

    auto inputs = MakeInputs(BuildMode::FullBuild);
    D3D12_RAYTRACING_ACCELERATION_STRUCTURE_PREBUILD_INFO prebuild{};
    device5->GetRaytracingAccelerationStructurePrebuildInfo(&inputs, &prebuild);
    if (prebuild.ResultDataMaxSizeInBytes == 0) {
        return Result<void>::Err(ErrorCode::DeviceCall, m_name + ": prebuild info reported a zero-sized result");
    }

    uint64_t scratchBytes = prebuild.ScratchDataSizeInBytes;
    if (AllowsUpdate()) {
        scratchBytes = std::max(scratchBytes, prebuild.UpdateScratchDataSizeInBytes);
    }

    // Geometry is frozen, so the result never needs to grow after this.
    if (!m_result) {
        m_sizes.resultBytes = AlignAccelerationSize(prebuild.ResultDataMaxSizeInBytes);
        auto result = CreateAccelerationStructureBuffer(device, m_sizes.resultBytes, m_name);
        if (result.IsErr()) {
            return Result<void>::Err(result.Error());
        }
        m_result = std::move(result).Value();
    }

    if (!m_scratch) {
        m_sizes.scratchBytes = AlignAccelerationSize(scratchBytes);
        auto scratch = CreateScratchBuffer(device, m_sizes.scratchBytes, m_name + "::scratch");
        if (scratch.IsErr()) {
            return Result<void>::Err(scratch.Error());
        }
        m_scratch = std::move(scratch).Value();
    }

    return Result<void>::Ok();
}

Result<void> BottomLevelAS::Build(DX12Device& device, ID3D12GraphicsCommandList4* cmdList, BuildMode mode) {
    HELIOS_VERIFY(!m_geometries.empty(), "{}: cannot build a bottom-level structure with no geometry", m_name);
    if (mode == BuildMode::Update) {
        HELIOS_VERIFY(m_built, "{}: update requested before the first full build", m_name);
        HELIOS_VERIFY(AllowsUpdate(), "{}: update requested on a structure built without ALLOW_UPDATE", m_name);
    }

    auto alloc = AllocateBuffers(device);
    if (alloc.IsErr()) {
        return Result<void>::Err(alloc.Error().Wrap("Failed to build BLAS " + m_name));
    }

    D3D12_BUILD_RAYTRACING_ACCELERATION_STRUCTURE_DESC buildDesc{};
    buildDesc.Inputs = MakeInputs(mode);
    buildDesc.DestAccelerationStructureData = m_result->GetGPUVirtualAddress();
    buildDesc.ScratchAccelerationStructureData = m_scratch->GetGPUVirtualAddress();
    if (mode == BuildMode::Update) {
        // Refit in place.
        buildDesc.SourceAccelerationStructureData = m_result->GetGPUVirtualAddress();
    }

    cmdList->BuildRaytracingAccelerationStructure(&buildDesc, 0, nullptr);
    m_built = true;
    return Result<void>::Ok();
}

// ========== TopLevelAS ==========

TopLevelAS::TopLevelAS(std::string name,
                       D3D12_RAYTRACING_ACCELERATION_STRUCTURE_BUILD_FLAGS flags,
                       uint32_t framesInFlight)
    : m_name(std::move(name)), m_flags(flags), m_instanceBuffers(std::max(framesInFlight, 1u)) {}

Result<uint32_t> TopLevelAS::AddInstance(const BottomLevelAS& blas, const glm::mat4& world, const InstanceFields& fields) {
    InstanceFields resolved = fields;
    resolved.accelerationStructure = blas.GetGPUVirtualAddress();

    auto encoded = EncodeInstance(world, resolved);
    if (encoded.IsErr()) {
        return Result<uint32_t>::Err(encoded.Error().Wrap(m_name + ": rejected instance"));
    }

    m_instances.push_back(encoded.Value());
    return Result<uint32_t>::Ok(static_cast<uint32_t>(m_instances.size() - 1));
}

void TopLevelAS::SetInstanceTransform(uint32_t instanceIndex, const glm::mat4& world) {
    HELIOS_VERIFY(instanceIndex < m_instances.size(), "{}: instance index {} out of range ({} instances)",
                  m_name, instanceIndex, m_instances.size());
    ToRowMajor3x4(world, m_instances[instanceIndex].transform);
}

D3D12_BUILD_RAYTRACING_ACCELERATION_STRUCTURE_INPUTS TopLevelAS::MakeInputs() const {
    D3D12_BUILD_RAYTRACING_ACCELERATION_STRUCTURE_INPUTS inputs{};
    inputs.Type = D3D12_RAYTRACING_ACCELERATION_STRUCTURE_TYPE_TOP_LEVEL;
    inputs.Flags = m_flags;
    inputs.DescsLayout = D3D12_ELEMENTS_LAYOUT_ARRAY;
    inputs.NumDescs = static_cast<UINT>(m_instances.size());
    inputs.InstanceDescs = m_currentInstanceAddress;
    return inputs;
}

AccelerationBufferSizes TopLevelAS::GetBufferCapacity() const {
    return AccelerationBufferSizes{BufferWidth(m_result.Get()), BufferWidth(m_scratch.Get())};
}

Result<bool> TopLevelAS::AllocateBuffers(DX12Device& device, RetiredBufferQueue& retired, FenceValue lastUseFence) {
    ID3D12Device5* device5 = device.GetDevice5();
    if (!device5) {
        return Result<bool>::Err(ErrorCode::InvalidArgument, m_name + ": device does not expose ID3D12Device5");
    }

    auto inputs = MakeInputs();
    D3D12_RAYTRACING_ACCELERATION_STRUCTURE_PREBUILD_INFO prebuild{};
    device5->GetRaytracingAccelerationStructurePrebuildInfo(&inputs, &prebuild);

    const AccelerationBufferSizes required{
        AlignAccelerationSize(prebuild.ResultDataMaxSizeInBytes),
        AlignAccelerationSize(prebuild.ScratchDataSizeInBytes)};
    const AccelerationBufferPlan plan = PlanAccelerationBuffers(GetBufferCapacity(), required);

    if (plan.reallocateScratch) {
        auto scratch = CreateScratchBuffer(device, plan.allocate.scratchBytes, m_name + "::scratch");
        if (scratch.IsErr()) {
            return Result<bool>::Err(scratch.Error().Wrap("Failed to grow TLAS scratch buffer"));
        }
        if (m_scratch) {
            spdlog::debug("{}: scratch buffer grown ({} -> {} bytes)", m_name,
                          BufferWidth(m_scratch.Get()), plan.allocate.scratchBytes);
            retired.Enqueue(std::move(m_scratch), lastUseFence);
        }
        m_scratch = std::move(scratch).Value();
    }

    if (!plan.reallocateResult) {
        return Result<bool>::Ok(false);
    }

    auto result = CreateAccelerationStructureBuffer(device, plan.allocate.resultBytes, m_name);
    if (result.IsErr()) {
        return Result<bool>::Err(result.Error().Wrap("Failed to grow TLAS result buffer"));
    }

    const D3D12_GPU_VIRTUAL_ADDRESS previousAddress = GetGPUVirtualAddress();
    if (m_result) {
        spdlog::debug("{}: result buffer grown ({} -> {} bytes)", m_name,
                      BufferWidth(m_result.Get()), plan.allocate.resultBytes);
        retired.Enqueue(std::move(m_result), lastUseFence);
    }
    m_result = std::move(result).Value();

    return Result<bool>::Ok(previousAddress != GetGPUVirtualAddress());
}

Result<void> TopLevelAS::UploadInstances(DX12Device& device, uint32_t frameSlot,
                                         RetiredBufferQueue& retired, FenceValue lastUseFence) {
    HELIOS_VERIFY(frameSlot < m_instanceBuffers.size(), "{}: frame slot {} out of range ({} slots)",
                  m_name, frameSlot, m_instanceBuffers.size());

    InstanceUploadBuffer& slot = m_instanceBuffers[frameSlot];
    const uint32_t instanceCount = GetInstanceCount();

    if (!slot.buffer || slot.capacity < instanceCount) {
        // An empty TLAS still gets a one-record buffer so the address is valid.
        const uint32_t capacity = std::max({instanceCount, slot.capacity * 2, 1u});

        BufferDesc desc;
        desc.sizeInBytes = static_cast<uint64_t>(capacity) * sizeof(RaytracingInstanceDesc);
        desc.heapType = D3D12_HEAP_TYPE_UPLOAD;
        desc.initialState = D3D12_RESOURCE_STATE_GENERIC_READ;
        desc.name = m_name + "::instances[" + std::to_string(frameSlot) + "]";

        auto buffer = CreateBuffer(device, desc);
        if (buffer.IsErr()) {
            return Result<void>::Err(buffer.Error().Wrap("Failed to create TLAS instance buffer"));
        }
        if (slot.buffer) {
            retired.Enqueue(std::move(slot.buffer), lastUseFence);
        }
        slot.buffer = std::move(buffer).Value();
        slot.capacity = capacity;
    }

    if (instanceCount > 0) {
        auto write = WriteUploadBuffer(slot.buffer.Get(), m_instances.data(),
                                       m_instances.size() * sizeof(RaytracingInstanceDesc));
        if (write.IsErr()) {
            return write;
        }
    }

    m_currentInstanceAddress = slot.buffer->GetGPUVirtualAddress();
    return Result<void>::Ok();
}

void TopLevelAS::Build(ID3D12GraphicsCommandList4* cmdList) {
    HELIOS_VERIFY(m_result && m_scratch, "{}: build recorded before buffers were allocated", m_name);
    HELIOS_VERIFY(m_currentInstanceAddress != 0, "{}: build recorded before instances were uploaded", m_name);

    D3D12_BUILD_RAYTRACING_ACCELERATION_STRUCTURE_DESC buildDesc{};
    buildDesc.Inputs = MakeInputs();
    buildDesc.DestAccelerationStructureData = m_result->GetGPUVirtualAddress();
    buildDesc.ScratchAccelerationStructureData = m_scratch->GetGPUVirtualAddress();

    cmdList->BuildRaytracingAccelerationStructure(&buildDesc, 0, nullptr);
}

// ========== RaytracingScene ==========

RaytracingScene::~RaytracingScene() {
    Shutdown();
}

Result<void> RaytracingScene::Initialize(DX12Device& device,
                                         DX12CommandQueue& directQueue,
                                         CbvSrvUavHeap& viewHeap,
                                         const RaytracingSceneDesc& desc) {
    if (!device.SupportsRaytracing() || !device.GetDevice5()) {
        return Result<void>::Err(ErrorCode::InvalidArgument,
                                 desc.name + ": device does not support DXR raytracing");
    }
    if (directQueue.GetType() != D3D12_COMMAND_LIST_TYPE_DIRECT) {
        return Result<void>::Err(ErrorCode::InvalidArgument,
                                 desc.name + ": acceleration structures must be built on a direct queue");
    }
    if (desc.framesInFlight == 0) {
        return Result<void>::Err(ErrorCode::InvalidArgument, desc.name + ": framesInFlight must be non-zero");
    }

    m_device = &device;
    m_queue = &directQueue;
    m_viewHeap = &viewHeap;
    m_desc = desc;
    m_tlas = TopLevelAS(desc.name + "::tlas", desc.tlasFlags, desc.framesInFlight);

    spdlog::info("RaytracingScene '{}' initialized ({} frames in flight)", desc.name, desc.framesInFlight);
    return Result<void>::Ok();
}

void RaytracingScene::Shutdown() {
    if (!m_queue) {
        return;
    }

    auto flush = m_queue->Flush();
    if (flush.IsErr()) {
        spdlog::error("RaytracingScene '{}': flush during shutdown failed: {}", m_desc.name, flush.Error().message);
    }

    m_retired.ReleaseAll();
    m_tlas = TopLevelAS();
    m_blasList.clear();
    m_meshes.clear();
    m_instances.clear();
    m_meshData.clear();
    m_geometryTransforms.Reset();
    m_meshDataBuffer.Reset();
    m_meshDataSrv = {};
    m_tlasSrv = {};
    m_animatedMeshCount = 0;
    m_built = false;

    m_device = nullptr;
    m_queue = nullptr;
    m_viewHeap = nullptr;
}

BlasId RaytracingScene::AddBlas(D3D12_RAYTRACING_ACCELERATION_STRUCTURE_BUILD_FLAGS flags) {
    HELIOS_VERIFY(m_device, "RaytracingScene::AddBlas called before Initialize");
    HELIOS_VERIFY(!m_built, "{}: bottom-level structures cannot be added after Build", m_desc.name);

    const auto index = static_cast<uint32_t>(m_blasList.size());
    m_blasList.emplace_back(m_desc.name + "::blas[" + std::to_string(index) + "]", flags);
    return BlasId{index};
}

const BottomLevelAS& RaytracingScene::GetBlas(BlasId id) const {
    HELIOS_VERIFY(id.value < m_blasList.size(), "{}: unknown BLAS id {}", m_desc.name, id.value);
    return m_blasList[id.value];
}

Result<void> RaytracingScene::AddMesh(BlasId blas, const MeshGeometry& mesh, TransformUpdatePolicy transformPolicy) {
    HELIOS_VERIFY(blas.value < m_blasList.size(), "{}: unknown BLAS id {}", m_desc.name, blas.value);
    BottomLevelAS& target = m_blasList[blas.value];
    HELIOS_VERIFY(!target.IsBuilt(), "{}: meshes cannot be added after the first build", target.GetName());

    if (!mesh.vertexBuffer || mesh.vertexCount == 0) {
        return Result<void>::Err(ErrorCode::InvalidArgument, target.GetName() + ": mesh has no vertex data");
    }
    if (mesh.indexBuffer && (mesh.indexCount == 0 || mesh.indexCount % 3 != 0)) {
        return Result<void>::Err(ErrorCode::InvalidArgument,
                                 target.GetName() + ": index count must be a non-zero multiple of 3");
    }
    const bool animated = IsAnimated(transformPolicy);
    if (animated && mesh.transformAddress != 0) {
        return Result<void>::Err(ErrorCode::InvalidArgument,
                                 target.GetName() + ": animated mesh cannot also supply a transform address");
    }
    if (animated && !target.AllowsUpdate()) {
        return Result<void>::Err(ErrorCode::InvalidArgument,
                                 target.GetName() + ": animated mesh requires a BLAS built with ALLOW_UPDATE");
    }

    D3D12_RAYTRACING_GEOMETRY_DESC geom{};
    geom.Type = D3D12_RAYTRACING_GEOMETRY_TYPE_TRIANGLES;
    geom.Flags = mesh.opaque ? D3D12_RAYTRACING_GEOMETRY_FLAG_OPAQUE : D3D12_RAYTRACING_GEOMETRY_FLAG_NONE;

    D3D12_RAYTRACING_GEOMETRY_TRIANGLES_DESC& tri = geom.Triangles;
    tri.Transform3x4 = mesh.transformAddress;
    tri.VertexFormat = mesh.vertexFormat;
    tri.VertexCount = mesh.vertexCount;
    tri.VertexBuffer.StartAddress = mesh.vertexBuffer->GetGPUVirtualAddress();
    tri.VertexBuffer.StrideInBytes = mesh.vertexStride;
    if (mesh.indexBuffer) {
        tri.IndexFormat = mesh.indexFormat;
        tri.IndexCount = mesh.indexCount;
        tri.IndexBuffer = mesh.indexBuffer->GetGPUVirtualAddress();
    } else {
        tri.IndexFormat = DXGI_FORMAT_UNKNOWN;
    }

    const uint32_t meshDataIndex = GetMeshDataBaseIndex(blas) + static_cast<uint32_t>(target.GetGeometryCount());

    MeshRecord record;
    record.blas = blas;
    record.geometryIndex = target.GetGeometryCount();
    record.transformPolicy = std::move(transformPolicy);
    if (animated) {
        record.transformSlot = m_animatedMeshCount++;
    }

    target.AddGeometry(geom);

    MeshData data;
    if (mesh.indexBuffer) {
        data.indexBufferIndex = m_viewHeap->CreateRawBufferSrv(
            mesh.indexBuffer, static_cast<uint32_t>(mesh.indexBuffer->GetDesc().Width)).Index();
    }
    if (mesh.colorBuffer) {
        data.colorBufferIndex = m_viewHeap->CreateRawBufferSrv(
            mesh.colorBuffer, static_cast<uint32_t>(mesh.colorBuffer->GetDesc().Width)).Index();
    }
    // Keep the table grouped by BLAS so InstanceID() + GeometryIndex() lands on it.
    m_meshData.insert(m_meshData.begin() + meshDataIndex, data);
    m_meshes.push_back(std::move(record));

    return Result<void>::Ok();
}

uint32_t RaytracingScene::GetMeshDataBaseIndex(BlasId id) const {
    HELIOS_VERIFY(id.value < m_blasList.size(), "{}: unknown BLAS id {}", m_desc.name, id.value);
    size_t base = 0;
    for (uint32_t i = 0; i < id.value; ++i) {
        base += m_blasList[i].GetGeometryCount();
    }
    return static_cast<uint32_t>(base);
}

InstanceFields RaytracingScene::MakeInstanceFields(const InstanceRecord& record) const {
    InstanceFields fields;
    fields.instanceId = record.options.instanceId.value_or(GetMeshDataBaseIndex(record.blas));
    fields.mask = record.options.mask;
    fields.hitGroupOffset = record.options.hitGroupOffset;
    fields.flags = record.options.flags;
    return fields;
}

Result<InstanceId> RaytracingScene::AddInstance(BlasId blas,
                                                TransformUpdatePolicy transformPolicy,
                                                const InstanceOptions& options) {
    HELIOS_VERIFY(blas.value < m_blasList.size(), "{}: unknown BLAS id {}", m_desc.name, blas.value);

    InstanceRecord record{blas, std::move(transformPolicy), options};
    const InstanceFields fields = MakeInstanceFields(record);

    // Reject bad fields now rather than at build time.
    auto check = EncodeInstance(options.baseTransform, fields);
    if (check.IsErr()) {
        return Result<InstanceId>::Err(check.Error().Wrap(m_desc.name + ": invalid instance"));
    }

    const auto index = static_cast<uint32_t>(m_instances.size());
    if (m_built) {
        const glm::mat4 world = EvaluateTransform(record.transformPolicy, options.baseTransform, 0.0);
        auto added = m_tlas.AddInstance(m_blasList[blas.value], world, fields);
        if (added.IsErr()) {
            return Result<InstanceId>::Err(added.Error());
        }
    }
    m_instances.push_back(std::move(record));
    return Result<InstanceId>::Ok(InstanceId{index});
}

Result<void> RaytracingScene::CreateGeometryTransformRing() {
    if (m_animatedMeshCount == 0) {
        return Result<void>::Ok();
    }

    BufferDesc desc;
    desc.sizeInBytes = static_cast<uint64_t>(m_desc.framesInFlight) * m_animatedMeshCount * kTransform3x4Bytes;
    desc.heapType = D3D12_HEAP_TYPE_UPLOAD;
    desc.initialState = D3D12_RESOURCE_STATE_GENERIC_READ;
    desc.name = m_desc.name + "::geometryTransforms";

    auto buffer = CreateBuffer(*m_device, desc);
    if (buffer.IsErr()) {
        return Result<void>::Err(buffer.Error().Wrap("Failed to create geometry transform buffer"));
    }
    m_geometryTransforms = std::move(buffer).Value();
    return Result<void>::Ok();
}

Result<void> RaytracingScene::WriteGeometryTransforms(uint32_t frameSlot, double elapsedSeconds) {
    if (m_animatedMeshCount == 0) {
        return Result<void>::Ok();
    }

    std::vector<float> transforms(static_cast<size_t>(m_animatedMeshCount) * 12);
    for (const MeshRecord& mesh : m_meshes) {
        if (!IsAnimated(mesh.transformPolicy)) {
            continue;
        }
        const glm::mat4 world = EvaluateTransform(mesh.transformPolicy, glm::mat4(1.0f), elapsedSeconds);
        float rows[3][4];
        ToRowMajor3x4(world, rows);
        std::memcpy(&transforms[static_cast<size_t>(mesh.transformSlot) * 12], rows, kTransform3x4Bytes);
    }

    const uint64_t slotBytes = static_cast<uint64_t>(m_animatedMeshCount) * kTransform3x4Bytes;
    const uint64_t slotOffset = static_cast<uint64_t>(frameSlot) * slotBytes;

    D3D12_RANGE readRange{0, 0};
    void* mapped = nullptr;
    HRESULT hr = m_geometryTransforms->Map(0, &readRange, &mapped);
    if (FAILED(hr) || !mapped) {
        return Result<void>::Err(MakeDeviceError("Failed to map geometry transform buffer", hr));
    }
    std::memcpy(static_cast<std::byte*>(mapped) + slotOffset, transforms.data(), slotBytes);
    D3D12_RANGE writtenRange{static_cast<SIZE_T>(slotOffset), static_cast<SIZE_T>(slotOffset + slotBytes)};
    m_geometryTransforms->Unmap(0, &writtenRange);

    const D3D12_GPU_VIRTUAL_ADDRESS base = m_geometryTransforms->GetGPUVirtualAddress() + slotOffset;
    for (const MeshRecord& mesh : m_meshes) {
        if (IsAnimated(mesh.transformPolicy)) {
            m_blasList[mesh.blas.value].SetGeometryTransform(
                mesh.geometryIndex, base + static_cast<uint64_t>(mesh.transformSlot) * kTransform3x4Bytes);
        }
    }
    return Result<void>::Ok();
}

Result<void> RaytracingScene::CreateMeshDataBuffer() {
    if (m_meshData.empty()) {
        return Result<void>::Ok();
    }

    BufferDesc desc;
    desc.sizeInBytes = m_meshData.size() * sizeof(MeshData);
    desc.heapType = D3D12_HEAP_TYPE_UPLOAD;
    desc.initialState = D3D12_RESOURCE_STATE_GENERIC_READ;
    desc.name = m_desc.name + "::meshData";

    auto buffer = CreateBuffer(*m_device, desc);
    if (buffer.IsErr()) {
        return Result<void>::Err(buffer.Error().Wrap("Failed to create mesh data buffer"));
    }
    m_meshDataBuffer = std::move(buffer).Value();

    auto write = WriteUploadBuffer(m_meshDataBuffer.Get(), m_meshData.data(), m_meshData.size() * sizeof(MeshData));
    if (write.IsErr()) {
        return write;
    }

    D3D12_SHADER_RESOURCE_VIEW_DESC srvDesc{};
    srvDesc.ViewDimension = D3D12_SRV_DIMENSION_BUFFER;
    srvDesc.Shader4ComponentMapping = D3D12_DEFAULT_SHADER_4_COMPONENT_MAPPING;
    srvDesc.Format = DXGI_FORMAT_UNKNOWN;
    srvDesc.Buffer.FirstElement = 0;
    srvDesc.Buffer.NumElements = static_cast<UINT>(m_meshData.size());
    srvDesc.Buffer.StructureByteStride = sizeof(MeshData);
    srvDesc.Buffer.Flags = D3D12_BUFFER_SRV_FLAG_NONE;
    m_meshDataSrv = m_viewHeap->CreateSrv(m_meshDataBuffer.Get(), &srvDesc);
    return Result<void>::Ok();
}

void RaytracingScene::RecreateTlasSrv() {
    // The heap is append-only, so a moved TLAS gets a fresh slot.
    m_tlasSrv = m_viewHeap->CreateAccelerationStructureSrv(m_tlas.GetGPUVirtualAddress());
    ++m_tlasSrvRecreateCount;
}

Result<void> RaytracingScene::RecordTlasBuild(ID3D12GraphicsCommandList4* cmdList, uint32_t frameSlot,
                                              double elapsedSeconds, FenceValue lastUseFence) {
    for (uint32_t i = 0; i < m_instances.size(); ++i) {
        const InstanceRecord& instance = m_instances[i];
        if (IsAnimated(instance.transformPolicy)) {
            m_tlas.SetInstanceTransform(
                i, EvaluateTransform(instance.transformPolicy, instance.options.baseTransform, elapsedSeconds));
        }
    }

    auto resized = m_tlas.AllocateBuffers(*m_device, m_retired, lastUseFence);
    if (resized.IsErr()) {
        return Result<void>::Err(resized.Error());
    }

    auto upload = m_tlas.UploadInstances(*m_device, frameSlot, m_retired, lastUseFence);
    if (upload.IsErr()) {
        return upload;
    }

    m_tlas.Build(cmdList);

    if (resized.Value() && m_built) {
        spdlog::debug("RaytracingScene '{}': TLAS moved, recreating its SRV", m_desc.name);
        RecreateTlasSrv();
    }

    UavBarrier(cmdList, m_tlas.GetResult());
    return Result<void>::Ok();
}

Result<void> RaytracingScene::Build() {
    HELIOS_VERIFY(m_device, "RaytracingScene::Build called before Initialize");
    HELIOS_VERIFY(!m_built, "{}: Build may only be called once", m_desc.name);

    auto geometryRing = CreateGeometryTransformRing();
    if (geometryRing.IsErr()) {
        return geometryRing;
    }
    auto transforms = WriteGeometryTransforms(0, 0.0);
    if (transforms.IsErr()) {
        return transforms;
    }

    auto ctxResult = m_queue->RequestContext();
    if (ctxResult.IsErr()) {
        return Result<void>::Err(ctxResult.Error());
    }
    CommandContext ctx = std::move(ctxResult).Value();

    for (BottomLevelAS& blas : m_blasList) {
        auto build = blas.Build(*m_device, ctx.GetCommandList(), BuildMode::FullBuild);
        if (build.IsErr()) {
            return build;
        }
        UavBarrier(ctx.GetCommandList(), blas.GetResult());
    }

    for (const InstanceRecord& instance : m_instances) {
        const glm::mat4 world = EvaluateTransform(instance.transformPolicy, instance.options.baseTransform, 0.0);
        auto added = m_tlas.AddInstance(m_blasList[instance.blas.value], world, MakeInstanceFields(instance));
        if (added.IsErr()) {
            return Result<void>::Err(added.Error());
        }
    }

    auto tlasBuild = RecordTlasBuild(ctx.GetCommandList(), 0, 0.0, m_queue->GetNextFenceValue());
    if (tlasBuild.IsErr()) {
        return tlasBuild;
    }

    auto meshData = CreateMeshDataBuffer();
    if (meshData.IsErr()) {
        return meshData;
    }

    auto fence = m_queue->Execute(std::move(ctx));
    if (fence.IsErr()) {
        return Result<void>::Err(fence.Error().Wrap("Failed to submit acceleration structure build"));
    }
    m_queue->Wait(fence.Value());

    // Static structures are never rebuilt, so their scratch memory can go.
    for (BottomLevelAS& blas : m_blasList) {
        if (!blas.AllowsUpdate()) {
            blas.ReleaseScratch();
        }
    }

    m_built = true;
    RecreateTlasSrv();

    spdlog::info("RaytracingScene '{}' built: {} BLAS, {} meshes, {} instances (TLAS {} bytes, SRV slot {})",
                 m_desc.name, m_blasList.size(), m_meshes.size(), m_tlas.GetInstanceCount(),
                 m_tlas.GetBufferCapacity().resultBytes, m_tlasSrv.Index());
    return Result<void>::Ok();
}

Result<void> RaytracingScene::Update(ID3D12GraphicsCommandList4* cmdList, uint32_t frameIndex, double elapsedSeconds) {
    HELIOS_VERIFY(m_built, "{}: Update called before Build", m_desc.name);
    HELIOS_VERIFY(cmdList, "{}: Update requires a recording command list", m_desc.name);

    m_retired.ReleaseCompleted(m_queue->GetCompletedFenceValue());

    // cmdList is submitted after everything already signaled, so anything it
    // stops referencing stays alive until its own fence.
    const FenceValue lastUseFence = m_queue->GetNextFenceValue();
    const uint32_t frameSlot = frameIndex % m_desc.framesInFlight;

    auto transforms = WriteGeometryTransforms(frameSlot, elapsedSeconds);
    if (transforms.IsErr()) {
        return transforms;
    }

    for (BottomLevelAS& blas : m_blasList) {
        if (!blas.AllowsUpdate()) {
            continue;
        }
        auto refit = blas.Build(*m_device, cmdList, BuildMode::Update);
        if (refit.IsErr()) {
            return refit;
        }
        UavBarrier(cmdList, blas.GetResult());
    }

    return RecordTlasBuild(cmdList, frameSlot, elapsedSeconds, lastUseFence);
}

} // namespace Helios::Graphics
