#include "DescriptorHeap.h"
#include "DX12Device.h"
#include "Utils/Verify.h"
#include <spdlog/spdlog.h>

namespace Helios::Graphics {

// ========== DescriptorHeap Implementation ==========

Result<void> DescriptorHeap::Initialize(
    DX12Device& device,
    D3D12_DESCRIPTOR_HEAP_TYPE type,
    uint32_t capacity,
    bool shaderVisible,
    const std::string& name)
{
    ID3D12Device* d3dDevice = device.GetDevice();
    if (!d3dDevice) {
        return Result<void>::Err(ErrorCode::InvalidArgument, "Device is not initialized");
    }
    if (capacity == 0) {
        return Result<void>::Err(ErrorCode::InvalidArgument, name + ": descriptor heap capacity must be non-zero");
    }

    D3D12_DESCRIPTOR_HEAP_DESC heapDesc = {};
    heapDesc.Type = type;
    heapDesc.NumDescriptors = capacity;
    heapDesc.Flags = shaderVisible ? D3D12_DESCRIPTOR_HEAP_FLAG_SHADER_VISIBLE : D3D12_DESCRIPTOR_HEAP_FLAG_NONE;
    heapDesc.NodeMask = 0;

    HRESULT hr = d3dDevice->CreateDescriptorHeap(&heapDesc, IID_PPV_ARGS(&m_heap));
    if (FAILED(hr)) {
        return Result<void>::Err(MakeDeviceError("Failed to create descriptor heap " + name, hr));
    }
    SetDebugName(m_heap.Get(), name);

    m_device = &device;
    m_type = type;
    m_shaderVisible = shaderVisible;
    m_slots = DescriptorSlotAllocator(name, capacity);

    // Increment size varies by type and GPU
    m_descriptorSize = d3dDevice->GetDescriptorHandleIncrementSize(type);

    m_cpuStart = m_heap->GetCPUDescriptorHandleForHeapStart();
    if (shaderVisible) {
        m_gpuStart = m_heap->GetGPUDescriptorHandleForHeapStart();
    }

    spdlog::info("Descriptor Heap '{}' created: {} descriptors{}", name, capacity,
                 shaderVisible ? " (shader-visible)" : "");

    return Result<void>::Ok();
}

void DescriptorHeap::Shutdown() {
    m_heap.Reset();
    m_device = nullptr;
    m_cpuStart = {};
    m_gpuStart = {};
}

DescriptorHandle DescriptorHeap::AllocateSlot() {
    HELIOS_VERIFY(m_heap, "Allocation from uninitialized descriptor heap '{}'", m_slots.GetHeapName());
    return GetHandle(m_slots.Allocate());
}

DescriptorHandle DescriptorHeap::GetHandle(uint32_t index) const {
    if (index >= m_slots.GetCapacity()) {
        return {};
    }

    DescriptorHandle handle;
    handle.index = index;
    handle.cpu.ptr = m_cpuStart.ptr + (static_cast<SIZE_T>(index) * m_descriptorSize);

    if (m_shaderVisible) {
        handle.gpu.ptr = m_gpuStart.ptr + (static_cast<UINT64>(index) * m_descriptorSize);
    }

    return handle;
}

ID3D12Device* DescriptorHeap::GetD3DDevice() const {
    return m_device ? m_device->GetDevice() : nullptr;
}

// ========== CbvSrvUavHeap ==========

Result<void> CbvSrvUavHeap::Initialize(DX12Device& device, uint32_t capacity, const std::string& name) {
    return DescriptorHeap::Initialize(device, D3D12_DESCRIPTOR_HEAP_TYPE_CBV_SRV_UAV, capacity, true, name);
}

CbvHandle CbvSrvUavHeap::CreateCbv(const D3D12_CONSTANT_BUFFER_VIEW_DESC& desc) {
    CbvHandle handle{AllocateSlot()};
    GetD3DDevice()->CreateConstantBufferView(&desc, handle.Cpu());
    return handle;
}

SrvHandle CbvSrvUavHeap::CreateSrv(ID3D12Resource* resource, const D3D12_SHADER_RESOURCE_VIEW_DESC* desc) {
    SrvHandle handle{AllocateSlot()};
    GetD3DDevice()->CreateShaderResourceView(resource, desc, handle.Cpu());
    return handle;
}

SrvHandle CbvSrvUavHeap::CreateRawBufferSrv(ID3D12Resource* buffer, uint32_t sizeInBytes) {
    D3D12_SHADER_RESOURCE_VIEW_DESC desc = {};
    desc.ViewDimension = D3D12_SRV_DIMENSION_BUFFER;
    desc.Shader4ComponentMapping = D3D12_DEFAULT_SHADER_4_COMPONENT_MAPPING;
    desc.Format = DXGI_FORMAT_R32_TYPELESS;
    desc.Buffer.FirstElement = 0;
    desc.Buffer.NumElements = sizeInBytes / 4;
    desc.Buffer.Flags = D3D12_BUFFER_SRV_FLAG_RAW;
    return CreateSrv(buffer, &desc);
}

SrvHandle CbvSrvUavHeap::CreateAccelerationStructureSrv(D3D12_GPU_VIRTUAL_ADDRESS location) {
    D3D12_SHADER_RESOURCE_VIEW_DESC desc = {};
    desc.ViewDimension = D3D12_SRV_DIMENSION_RAYTRACING_ACCELERATION_STRUCTURE;
    desc.Shader4ComponentMapping = D3D12_DEFAULT_SHADER_4_COMPONENT_MAPPING;
    desc.Format = DXGI_FORMAT_UNKNOWN;
    desc.RaytracingAccelerationStructure.Location = location;
    return CreateSrv(nullptr, &desc);
}

UavHandle CbvSrvUavHeap::CreateUav(ID3D12Resource* resource,
                                   const D3D12_UNORDERED_ACCESS_VIEW_DESC* desc,
                                   ID3D12Resource* counter) {
    UavHandle handle{AllocateSlot()};
    GetD3DDevice()->CreateUnorderedAccessView(resource, counter, desc, handle.Cpu());
    return handle;
}

// ========== RtvHeap / DsvHeap ==========

Result<void> RtvHeap::Initialize(DX12Device& device, uint32_t capacity, const std::string& name) {
    return DescriptorHeap::Initialize(device, D3D12_DESCRIPTOR_HEAP_TYPE_RTV, capacity, false, name);
}

RtvHandle RtvHeap::CreateRtv(ID3D12Resource* resource, const D3D12_RENDER_TARGET_VIEW_DESC* desc) {
    RtvHandle handle{AllocateSlot()};
    GetD3DDevice()->CreateRenderTargetView(resource, desc, handle.Cpu());
    return handle;
}

Result<void> DsvHeap::Initialize(DX12Device& device, uint32_t capacity, const std::string& name) {
    return DescriptorHeap::Initialize(device, D3D12_DESCRIPTOR_HEAP_TYPE_DSV, capacity, false, name);
}

DsvHandle DsvHeap::CreateDsv(ID3D12Resource* resource, const D3D12_DEPTH_STENCIL_VIEW_DESC* desc) {
    DsvHandle handle{AllocateSlot()};
    GetD3DDevice()->CreateDepthStencilView(resource, desc, handle.Cpu());
    return handle;
}

} // namespace Helios::Graphics
