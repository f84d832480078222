#pragma once

#include "D3D12Includes.h"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace Helios::Graphics {

class DX12Device;
class DX12CommandQueue;

struct BufferDesc {
    uint64_t sizeInBytes = 0;
    D3D12_HEAP_TYPE heapType = D3D12_HEAP_TYPE_DEFAULT;
    D3D12_RESOURCE_FLAGS flags = D3D12_RESOURCE_FLAG_NONE;
    D3D12_RESOURCE_STATES initialState = D3D12_RESOURCE_STATE_COMMON;
    std::string name;
};

// Committed buffer. Upload heaps must start in GENERIC_READ.
Result<ComPtr<ID3D12Resource>> CreateBuffer(DX12Device& device, const BufferDesc& desc);

// Default-heap buffer for acceleration structure results.
Result<ComPtr<ID3D12Resource>> CreateAccelerationStructureBuffer(DX12Device& device, uint64_t sizeInBytes, const std::string& name);

// Default-heap UAV buffer used as build scratch memory.
Result<ComPtr<ID3D12Resource>> CreateScratchBuffer(DX12Device& device, uint64_t sizeInBytes, const std::string& name);

// Copies bytes into a mapped upload buffer starting at offset 0.
Result<void> WriteUploadBuffer(ID3D12Resource* uploadBuffer, const void* data, size_t sizeInBytes);

// Creates a default-heap buffer filled with data through the copy queue.
// Blocks until the copy has completed; the buffer is left in COMMON.
Result<ComPtr<ID3D12Resource>> UploadBuffer(DX12Device& device,
                                            DX12CommandQueue& copyQueue,
                                            std::span<const std::byte> data,
                                            const std::string& name);

void UavBarrier(ID3D12GraphicsCommandList* cmdList, ID3D12Resource* resource);

} // namespace Helios::Graphics
