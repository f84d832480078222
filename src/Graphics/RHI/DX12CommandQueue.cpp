#include "DX12CommandQueue.h"
#include "DX12Device.h"
#include "Utils/Verify.h"
#include <spdlog/spdlog.h>

namespace Helios::Graphics {

namespace {
    // GetCompletedValue reports this once the device has been removed.
    constexpr FenceValue kDeviceRemovedFenceValue = UINT64_MAX;
}

DX12CommandQueue::~DX12CommandQueue() {
    Shutdown();
}

Result<void> DX12CommandQueue::Initialize(DX12Device& device, D3D12_COMMAND_LIST_TYPE type, std::string name) {
    ID3D12Device* d3dDevice = device.GetDevice();
    if (!d3dDevice) {
        return Result<void>::Err(ErrorCode::InvalidArgument, "Device is not initialized");
    }

    m_device = &device;
    m_type = type;
    m_name = std::move(name);

    D3D12_COMMAND_QUEUE_DESC queueDesc = {};
    queueDesc.Type = type;
    queueDesc.Priority = D3D12_COMMAND_QUEUE_PRIORITY_NORMAL;
    queueDesc.Flags = D3D12_COMMAND_QUEUE_FLAG_NONE;
    queueDesc.NodeMask = 0;

    HRESULT hr = d3dDevice->CreateCommandQueue(&queueDesc, IID_PPV_ARGS(&m_commandQueue));
    if (FAILED(hr)) {
        return Result<void>::Err(MakeDeviceError("Failed to create command queue " + m_name, hr));
    }
    SetDebugName(m_commandQueue.Get(), m_name);

    hr = d3dDevice->CreateFence(kNoFenceValue, D3D12_FENCE_FLAG_NONE, IID_PPV_ARGS(&m_fence));
    if (FAILED(hr)) {
        m_commandQueue.Reset();
        return Result<void>::Err(MakeDeviceError("Failed to create fence for " + m_name, hr));
    }
    SetDebugName(m_fence.Get(), m_name + "::fence");

    m_fenceEvent = CreateEvent(nullptr, FALSE, FALSE, nullptr);
    if (!m_fenceEvent) {
        m_fence.Reset();
        m_commandQueue.Reset();
        return Result<void>::Err(MakeDeviceError("Failed to create fence event for " + m_name,
                                                 HRESULT_FROM_WIN32(GetLastError())));
    }

    m_lastSignaledValue = kNoFenceValue;

    spdlog::info("Command Queue '{}' initialized", m_name);
    return Result<void>::Ok();
}

void DX12CommandQueue::Shutdown() {
    // Safe after a partial Initialize: only flush what was created.
    if (m_commandQueue && m_fence) {
        auto flushResult = Flush();
        if (flushResult.IsErr()) {
            spdlog::error("Command Queue '{}': flush during shutdown failed: {}", m_name, flushResult.Error().message);
        }
    }

    m_pool.Clear();

    if (m_fenceEvent) {
        CloseHandle(m_fenceEvent);
        m_fenceEvent = nullptr;
    }

    if (m_commandQueue) {
        spdlog::info("Command Queue '{}' shut down", m_name);
    }

    m_fence.Reset();
    m_commandQueue.Reset();
    m_device = nullptr;
}

Result<ComPtr<ID3D12CommandAllocator>> DX12CommandQueue::AcquireAllocator() {
    if (auto pooled = m_pool.TryAcquireAllocator(GetCompletedFenceValue())) {
        ComPtr<ID3D12CommandAllocator> allocator = std::move(*pooled);
        HRESULT hr = allocator->Reset();
        if (FAILED(hr)) {
            m_pool.DiscardAllocator();
            return Result<ComPtr<ID3D12CommandAllocator>>::Err(
                MakeDeviceError("Failed to reset command allocator on " + m_name, hr));
        }
        return Result<ComPtr<ID3D12CommandAllocator>>::Ok(std::move(allocator));
    }

    ComPtr<ID3D12CommandAllocator> allocator;
    HRESULT hr = m_device->GetDevice()->CreateCommandAllocator(m_type, IID_PPV_ARGS(&allocator));
    if (FAILED(hr)) {
        return Result<ComPtr<ID3D12CommandAllocator>>::Err(
            MakeDeviceError("Failed to create command allocator on " + m_name, hr));
    }
    m_pool.TrackNewAllocator();

    const size_t index = m_pool.GetCreatedAllocatorCount() - 1;
    SetDebugName(allocator.Get(), fmt::format("{}::allocators[{}]", m_name, index));
    spdlog::debug("Command Queue '{}': created allocator {} (pooled={})",
                  m_name, index, m_pool.GetPooledAllocatorCount());

    return Result<ComPtr<ID3D12CommandAllocator>>::Ok(std::move(allocator));
}

Result<CommandContext> DX12CommandQueue::RequestContext() {
    HELIOS_VERIFY(m_commandQueue, "RequestContext on uninitialized queue '{}'", m_name);

    auto allocatorResult = AcquireAllocator();
    if (allocatorResult.IsErr()) {
        return Result<CommandContext>::Err(allocatorResult.Error());
    }
    ComPtr<ID3D12CommandAllocator> allocator = std::move(allocatorResult).Value();

    ComPtr<ID3D12GraphicsCommandList4> commandList;
    if (auto pooled = m_pool.TryAcquireCommandList()) {
        commandList = std::move(*pooled);
        HRESULT hr = commandList->Reset(allocator.Get(), nullptr);
        if (FAILED(hr)) {
            m_pool.DiscardCommandList();
            m_pool.DiscardAllocator();
            return Result<CommandContext>::Err(MakeDeviceError("Failed to reset command list on " + m_name, hr));
        }
    } else {
        // Created in the recording state, bound to the allocator.
        HRESULT hr = m_device->GetDevice()->CreateCommandList(
            0, m_type, allocator.Get(), nullptr, IID_PPV_ARGS(&commandList));
        if (FAILED(hr)) {
            m_pool.DiscardAllocator();
            return Result<CommandContext>::Err(MakeDeviceError("Failed to create command list on " + m_name, hr));
        }
        m_pool.TrackNewCommandList();
        SetDebugName(commandList.Get(),
                     fmt::format("{}::commandLists[{}]", m_name, m_pool.GetCreatedCommandListCount() - 1));
    }

    return Result<CommandContext>::Ok(CommandContext(std::move(allocator), std::move(commandList), m_type));
}

Result<FenceValue> DX12CommandQueue::Execute(CommandContext&& context) {
    HELIOS_VERIFY(context.IsValid(), "Execute called with an empty command context on '{}'", m_name);
    HELIOS_VERIFY(context.GetType() == m_type, "Command context submitted to the wrong queue '{}'", m_name);

    CommandContext submitted = std::move(context);

    HRESULT hr = submitted.m_commandList->Close();
    if (FAILED(hr)) {
        // Nothing reached the GPU, so both objects can simply be dropped.
        m_pool.DiscardCommandList();
        m_pool.DiscardAllocator();
        return Result<FenceValue>::Err(MakeDeviceError("Failed to close command list on " + m_name, hr));
    }

    ID3D12CommandList* const commandLists[] = { submitted.m_commandList.Get() };
    m_commandQueue->ExecuteCommandLists(1, commandLists);

    // The list may be reset right away; the allocator has to wait for the fence.
    m_pool.ReturnCommandList(std::move(submitted.m_commandList));
    m_pool.ReturnAllocator(std::move(submitted.m_allocator), GetNextFenceValue());

    return Signal();
}

Result<FenceValue> DX12CommandQueue::Signal() {
    HELIOS_VERIFY(m_commandQueue && m_fence, "Signal on uninitialized queue '{}'", m_name);

    const FenceValue fenceValue = m_lastSignaledValue + 1;
    HRESULT hr = m_commandQueue->Signal(m_fence.Get(), fenceValue);
    if (FAILED(hr)) {
        spdlog::error("Failed to signal command queue '{}' fence: 0x{:08X}",
                      m_name, static_cast<unsigned int>(hr));
        return Result<FenceValue>::Err(MakeDeviceError("Failed to signal fence on " + m_name, hr));
    }
    m_lastSignaledValue = fenceValue;
    return Result<FenceValue>::Ok(fenceValue);
}

void DX12CommandQueue::Wait(FenceValue fenceValue) {
    HELIOS_VERIFY(fenceValue <= m_lastSignaledValue,
                  "Wait on '{}' for fence {} which was never signaled (last {})",
                  m_name, fenceValue, m_lastSignaledValue);

    if (GetCompletedFenceValue() == kDeviceRemovedFenceValue) {
        HELIOS_REPORT_DEVICE_REMOVED(*m_device, "DX12CommandQueue::Wait",
                                     m_device->GetDevice()->GetDeviceRemovedReason());
    }
    if (IsFenceComplete(fenceValue)) {
        return;
    }

    HRESULT hr = m_fence->SetEventOnCompletion(fenceValue, m_fenceEvent);
    if (FAILED(hr)) {
        HELIOS_REPORT_DEVICE_REMOVED(*m_device, "DX12CommandQueue::Wait(SetEventOnCompletion)", hr);
    }

    // No timeout: a hung device is fatal rather than something to retry.
    const DWORD waitResult = WaitForSingleObject(m_fenceEvent, INFINITE);
    if (waitResult != WAIT_OBJECT_0) {
        HELIOS_REPORT_DEVICE_REMOVED(*m_device, "DX12CommandQueue::Wait(WaitForSingleObject)",
                                     HRESULT_FROM_WIN32(GetLastError()));
    }

    if (m_fence->GetCompletedValue() == kDeviceRemovedFenceValue) {
        HELIOS_REPORT_DEVICE_REMOVED(*m_device, "DX12CommandQueue::Wait",
                                     m_device->GetDevice()->GetDeviceRemovedReason());
    }
}

Result<void> DX12CommandQueue::Flush() {
    auto signalResult = Signal();
    if (signalResult.IsErr()) {
        return Result<void>::Err(signalResult.Error());
    }
    Wait(signalResult.Value());
    return Result<void>::Ok();
}

bool DX12CommandQueue::IsFenceComplete(FenceValue fenceValue) const {
    return IsFenceValueComplete(fenceValue, GetCompletedFenceValue());
}

FenceValue DX12CommandQueue::GetCompletedFenceValue() const {
    if (!m_fence) {
        return kNoFenceValue;
    }
    return m_fence->GetCompletedValue();
}

} // namespace Helios::Graphics
