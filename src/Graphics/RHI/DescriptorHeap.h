#pragma once

#include "D3D12Includes.h"
#include "DescriptorSlotAllocator.h"
#include <cstdint>
#include <string>

namespace Helios::Graphics {

class DX12Device;

inline constexpr uint32_t kInvalidDescriptorIndex = 0xFFFFFFFFu;

// Slot in a descriptor heap. gpu is only set for shader-visible heaps.
struct DescriptorHandle {
    D3D12_CPU_DESCRIPTOR_HANDLE cpu = {};
    D3D12_GPU_DESCRIPTOR_HANDLE gpu = {};
    uint32_t index = kInvalidDescriptorIndex;

    [[nodiscard]] bool IsValid() const { return cpu.ptr != 0; }
    [[nodiscard]] bool IsShaderVisible() const { return gpu.ptr != 0; }
};

// Distinct handle types per view kind so an RTV cannot be bound where an SRV is expected.
template<typename Tag>
struct ViewHandle {
    DescriptorHandle descriptor;

    [[nodiscard]] uint32_t Index() const { return descriptor.index; }
    [[nodiscard]] D3D12_CPU_DESCRIPTOR_HANDLE Cpu() const { return descriptor.cpu; }
    [[nodiscard]] D3D12_GPU_DESCRIPTOR_HANDLE Gpu() const { return descriptor.gpu; }
    [[nodiscard]] bool IsValid() const { return descriptor.IsValid(); }
};

using CbvHandle = ViewHandle<struct CbvTag>;
using SrvHandle = ViewHandle<struct SrvTag>;
using UavHandle = ViewHandle<struct UavTag>;
using RtvHandle = ViewHandle<struct RtvTag>;
using DsvHandle = ViewHandle<struct DsvTag>;

// Fixed-capacity, append-only descriptor heap. Views are written at the next
// free slot and keep that slot for the lifetime of the heap.
class DescriptorHeap {
public:
    DescriptorHeap() = default;
    ~DescriptorHeap() = default;

    DescriptorHeap(const DescriptorHeap&) = delete;
    DescriptorHeap& operator=(const DescriptorHeap&) = delete;
    DescriptorHeap(DescriptorHeap&&) = default;
    DescriptorHeap& operator=(DescriptorHeap&&) = default;

    void Shutdown();

    [[nodiscard]] DescriptorHandle GetHandle(uint32_t index) const;

    [[nodiscard]] ID3D12DescriptorHeap* GetHeap() const { return m_heap.Get(); }
    [[nodiscard]] D3D12_DESCRIPTOR_HEAP_TYPE GetType() const { return m_type; }
    [[nodiscard]] uint32_t GetCapacity() const { return m_slots.GetCapacity(); }
    [[nodiscard]] uint32_t GetUsedCount() const { return m_slots.GetAllocatedCount(); }
    [[nodiscard]] bool HasSpace() const { return m_slots.HasSpace(); }
    [[nodiscard]] uint32_t GetDescriptorSize() const { return m_descriptorSize; }

protected:
    Result<void> Initialize(DX12Device& device,
                            D3D12_DESCRIPTOR_HEAP_TYPE type,
                            uint32_t capacity,
                            bool shaderVisible,
                            const std::string& name);

    // Fatal when the heap is full.
    [[nodiscard]] DescriptorHandle AllocateSlot();

    [[nodiscard]] ID3D12Device* GetD3DDevice() const;

private:
    DX12Device* m_device = nullptr;
    ComPtr<ID3D12DescriptorHeap> m_heap;
    D3D12_DESCRIPTOR_HEAP_TYPE m_type = D3D12_DESCRIPTOR_HEAP_TYPE_CBV_SRV_UAV;
    DescriptorSlotAllocator m_slots;
    uint32_t m_descriptorSize = 0;
    bool m_shaderVisible = false;

    D3D12_CPU_DESCRIPTOR_HANDLE m_cpuStart = {};
    D3D12_GPU_DESCRIPTOR_HANDLE m_gpuStart = {};
};

// Shader-visible table for constant buffer, shader resource and unordered access views.
class CbvSrvUavHeap : public DescriptorHeap {
public:
    Result<void> Initialize(DX12Device& device, uint32_t capacity, const std::string& name = "CbvSrvUavHeap");

    CbvHandle CreateCbv(const D3D12_CONSTANT_BUFFER_VIEW_DESC& desc);
    SrvHandle CreateSrv(ID3D12Resource* resource, const D3D12_SHADER_RESOURCE_VIEW_DESC* desc);
    // Raw (ByteAddressBuffer) view over a whole buffer.
    SrvHandle CreateRawBufferSrv(ID3D12Resource* buffer, uint32_t sizeInBytes);
    // Acceleration structure views carry the GPU address instead of a resource.
    SrvHandle CreateAccelerationStructureSrv(D3D12_GPU_VIRTUAL_ADDRESS location);
    UavHandle CreateUav(ID3D12Resource* resource,
                        const D3D12_UNORDERED_ACCESS_VIEW_DESC* desc,
                        ID3D12Resource* counter = nullptr);
};

class RtvHeap : public DescriptorHeap {
public:
    Result<void> Initialize(DX12Device& device, uint32_t capacity, const std::string& name = "RtvHeap");

    RtvHandle CreateRtv(ID3D12Resource* resource, const D3D12_RENDER_TARGET_VIEW_DESC* desc = nullptr);
};

class DsvHeap : public DescriptorHeap {
public:
    Result<void> Initialize(DX12Device& device, uint32_t capacity, const std::string& name = "DsvHeap");

    DsvHandle CreateDsv(ID3D12Resource* resource, const D3D12_DEPTH_STENCIL_VIEW_DESC* desc = nullptr);
};

} // namespace Helios::Graphics
