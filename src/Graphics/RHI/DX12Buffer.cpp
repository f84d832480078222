#include "DX12Buffer.h"
#include "DX12CommandQueue.h"
#include "DX12Device.h"
#include <cstring>
#include <spdlog/spdlog.h>

namespace Helios::Graphics {

Result<ComPtr<ID3D12Resource>> CreateBuffer(DX12Device& device, const BufferDesc& desc) {
    if (!device.GetDevice()) {
        return Result<ComPtr<ID3D12Resource>>::Err(ErrorCode::InvalidArgument, "Device is not initialized");
    }
    if (desc.sizeInBytes == 0) {
        return Result<ComPtr<ID3D12Resource>>::Err(ErrorCode::InvalidArgument,
            "Buffer '" + desc.name + "' has zero size");
    }

    D3D12_HEAP_PROPERTIES heapProps{};
    heapProps.Type = desc.heapType;
    heapProps.CPUPageProperty = D3D12_CPU_PAGE_PROPERTY_UNKNOWN;
    heapProps.MemoryPoolPreference = D3D12_MEMORY_POOL_UNKNOWN;
    heapProps.CreationNodeMask = 1;
    heapProps.VisibleNodeMask = 1;

    D3D12_RESOURCE_DESC bufDesc{};
    bufDesc.Dimension = D3D12_RESOURCE_DIMENSION_BUFFER;
    bufDesc.Alignment = 0;
    bufDesc.Width = desc.sizeInBytes;
    bufDesc.Height = 1;
    bufDesc.DepthOrArraySize = 1;
    bufDesc.MipLevels = 1;
    bufDesc.Format = DXGI_FORMAT_UNKNOWN;
    bufDesc.SampleDesc.Count = 1;
    bufDesc.SampleDesc.Quality = 0;
    bufDesc.Layout = D3D12_TEXTURE_LAYOUT_ROW_MAJOR;
    bufDesc.Flags = desc.flags;

    ComPtr<ID3D12Resource> buffer;
    HRESULT hr = device.GetDevice()->CreateCommittedResource(
        &heapProps,
        D3D12_HEAP_FLAG_NONE,
        &bufDesc,
        desc.initialState,
        nullptr,
        IID_PPV_ARGS(&buffer));
    if (FAILED(hr)) {
        spdlog::error("Failed to create buffer '{}' ({} bytes, hr=0x{:08X})",
                      desc.name, desc.sizeInBytes, static_cast<unsigned int>(hr));
        return Result<ComPtr<ID3D12Resource>>::Err(MakeDeviceError("Failed to create buffer " + desc.name, hr));
    }
    SetDebugName(buffer.Get(), desc.name);

    return Result<ComPtr<ID3D12Resource>>::Ok(std::move(buffer));
}

Result<ComPtr<ID3D12Resource>> CreateAccelerationStructureBuffer(DX12Device& device, uint64_t sizeInBytes, const std::string& name) {
    BufferDesc desc;
    desc.sizeInBytes = sizeInBytes;
    desc.heapType = D3D12_HEAP_TYPE_DEFAULT;
    desc.flags = D3D12_RESOURCE_FLAG_ALLOW_UNORDERED_ACCESS;
    desc.initialState = D3D12_RESOURCE_STATE_RAYTRACING_ACCELERATION_STRUCTURE;
    desc.name = name;
    return CreateBuffer(device, desc);
}

Result<ComPtr<ID3D12Resource>> CreateScratchBuffer(DX12Device& device, uint64_t sizeInBytes, const std::string& name) {
    BufferDesc desc;
    desc.sizeInBytes = sizeInBytes;
    desc.heapType = D3D12_HEAP_TYPE_DEFAULT;
    desc.flags = D3D12_RESOURCE_FLAG_ALLOW_UNORDERED_ACCESS;
    desc.initialState = D3D12_RESOURCE_STATE_UNORDERED_ACCESS;
    desc.name = name;
    return CreateBuffer(device, desc);
}

Result<void> WriteUploadBuffer(ID3D12Resource* uploadBuffer, const void* data, size_t sizeInBytes) {
    if (!uploadBuffer) {
        return Result<void>::Err(ErrorCode::InvalidArgument, "Upload buffer is null");
    }
    if (sizeInBytes == 0) {
        return Result<void>::Ok();
    }

    void* mapped = nullptr;
    D3D12_RANGE readRange{0, 0};
    HRESULT hr = uploadBuffer->Map(0, &readRange, &mapped);
    if (FAILED(hr) || !mapped) {
        return Result<void>::Err(MakeDeviceError("Failed to map upload buffer", hr));
    }

    std::memcpy(mapped, data, sizeInBytes);
    D3D12_RANGE writtenRange{0, sizeInBytes};
    uploadBuffer->Unmap(0, &writtenRange);
    return Result<void>::Ok();
}

Result<ComPtr<ID3D12Resource>> UploadBuffer(DX12Device& device,
                                            DX12CommandQueue& copyQueue,
                                            std::span<const std::byte> data,
                                            const std::string& name) {
    BufferDesc defaultDesc;
    defaultDesc.sizeInBytes = data.size();
    defaultDesc.heapType = D3D12_HEAP_TYPE_DEFAULT;
    defaultDesc.initialState = D3D12_RESOURCE_STATE_COMMON;
    defaultDesc.name = name;
    auto bufferResult = CreateBuffer(device, defaultDesc);
    if (bufferResult.IsErr()) {
        return bufferResult;
    }
    ComPtr<ID3D12Resource> buffer = std::move(bufferResult).Value();

    BufferDesc stagingDesc;
    stagingDesc.sizeInBytes = data.size();
    stagingDesc.heapType = D3D12_HEAP_TYPE_UPLOAD;
    stagingDesc.initialState = D3D12_RESOURCE_STATE_GENERIC_READ;
    stagingDesc.name = name + "::staging";
    auto stagingResult = CreateBuffer(device, stagingDesc);
    if (stagingResult.IsErr()) {
        return stagingResult;
    }
    ComPtr<ID3D12Resource> staging = std::move(stagingResult).Value();

    auto writeResult = WriteUploadBuffer(staging.Get(), data.data(), data.size());
    if (writeResult.IsErr()) {
        return Result<ComPtr<ID3D12Resource>>::Err(writeResult.Error().Wrap(name));
    }

    auto ctxResult = copyQueue.RequestContext();
    if (ctxResult.IsErr()) {
        return Result<ComPtr<ID3D12Resource>>::Err(ctxResult.Error().Wrap(name));
    }
    CommandContext ctx = std::move(ctxResult).Value();

    // Buffers decay to COMMON after the copy queue is done with them, so the
    // graphics queue can promote them to any read state without a barrier.
    ctx->CopyBufferRegion(buffer.Get(), 0, staging.Get(), 0, data.size());

    auto fenceResult = copyQueue.Execute(std::move(ctx));
    if (fenceResult.IsErr()) {
        return Result<ComPtr<ID3D12Resource>>::Err(fenceResult.Error().Wrap(name));
    }
    copyQueue.Wait(fenceResult.Value());

    spdlog::debug("Uploaded buffer '{}' ({} bytes)", name, data.size());
    return Result<ComPtr<ID3D12Resource>>::Ok(std::move(buffer));
}

void UavBarrier(ID3D12GraphicsCommandList* cmdList, ID3D12Resource* resource) {
    D3D12_RESOURCE_BARRIER barrier{};
    barrier.Type = D3D12_RESOURCE_BARRIER_TYPE_UAV;
    barrier.Flags = D3D12_RESOURCE_BARRIER_FLAG_NONE;
    barrier.UAV.pResource = resource;
    cmdList->ResourceBarrier(1, &barrier);
}

} // namespace Helios::Graphics
