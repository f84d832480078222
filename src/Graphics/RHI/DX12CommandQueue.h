#pragma once

#include "D3D12Includes.h"
#include "CommandContextPool.h"
#include "FenceValue.h"
#include <cstdint>
#include <string>

namespace Helios::Graphics {

class DX12Device;

// One allocator + command list pair checked out for a single record/submit
// cycle. Move-only; handing it back to DX12CommandQueue::Execute consumes it.
class CommandContext {
public:
    CommandContext() = default;
    ~CommandContext() = default;

    CommandContext(const CommandContext&) = delete;
    CommandContext& operator=(const CommandContext&) = delete;
    CommandContext(CommandContext&&) = default;
    CommandContext& operator=(CommandContext&&) = default;

    [[nodiscard]] ID3D12GraphicsCommandList4* GetCommandList() const { return m_commandList.Get(); }
    ID3D12GraphicsCommandList4* operator->() const { return m_commandList.Get(); }
    [[nodiscard]] bool IsValid() const { return m_allocator && m_commandList; }
    [[nodiscard]] D3D12_COMMAND_LIST_TYPE GetType() const { return m_type; }

private:
    friend class DX12CommandQueue;

    CommandContext(ComPtr<ID3D12CommandAllocator> allocator,
                   ComPtr<ID3D12GraphicsCommandList4> commandList,
                   D3D12_COMMAND_LIST_TYPE type)
        : m_allocator(std::move(allocator)), m_commandList(std::move(commandList)), m_type(type) {}

    ComPtr<ID3D12CommandAllocator> m_allocator;
    ComPtr<ID3D12GraphicsCommandList4> m_commandList;
    D3D12_COMMAND_LIST_TYPE m_type = D3D12_COMMAND_LIST_TYPE_DIRECT;
};

// Command queue wrapper: context recycling, submission and fence sync.
// Single-threaded: recording, submission and waits happen on one thread.
class DX12CommandQueue {
public:
    DX12CommandQueue() = default;
    ~DX12CommandQueue();

    DX12CommandQueue(const DX12CommandQueue&) = delete;
    DX12CommandQueue& operator=(const DX12CommandQueue&) = delete;
    DX12CommandQueue(DX12CommandQueue&&) = delete;
    DX12CommandQueue& operator=(DX12CommandQueue&&) = delete;

    Result<void> Initialize(DX12Device& device,
                            D3D12_COMMAND_LIST_TYPE type = D3D12_COMMAND_LIST_TYPE_DIRECT,
                            std::string name = "DirectQueue");

    // Flushes, drops pooled allocators and lists, and closes the fence event.
    // Idempotent; the destructor calls it for any path that skipped it.
    void Shutdown();

    // Never blocks. Reuses the oldest completed allocator or creates a new pair.
    Result<CommandContext> RequestContext();

    // Closes and submits the context, then signals. The returned value
    // completes once the submitted work has retired.
    Result<FenceValue> Execute(CommandContext&& context);

    // Signals the next fence value without submitting work.
    Result<FenceValue> Signal();

    // Blocks until fenceValue completes. Device loss here is fatal.
    void Wait(FenceValue fenceValue);

    Result<void> Flush();

    [[nodiscard]] bool IsFenceComplete(FenceValue fenceValue) const;

    [[nodiscard]] ID3D12CommandQueue* GetCommandQueue() const { return m_commandQueue.Get(); }
    [[nodiscard]] ID3D12Fence* GetFence() const { return m_fence.Get(); }
    [[nodiscard]] D3D12_COMMAND_LIST_TYPE GetType() const { return m_type; }
    [[nodiscard]] const std::string& GetName() const { return m_name; }
    [[nodiscard]] FenceValue GetCompletedFenceValue() const;
    [[nodiscard]] FenceValue GetLastSignaledFenceValue() const { return m_lastSignaledValue; }
    // Value the next Signal or Execute will stamp.
    [[nodiscard]] FenceValue GetNextFenceValue() const { return m_lastSignaledValue + 1; }

    [[nodiscard]] size_t GetPooledAllocatorCount() const { return m_pool.GetPooledAllocatorCount(); }
    [[nodiscard]] size_t GetLiveAllocatorCount() const { return m_pool.GetLiveAllocatorCount(); }
    [[nodiscard]] size_t GetPooledCommandListCount() const { return m_pool.GetPooledCommandListCount(); }

private:
    using ContextPool = CommandContextPool<ComPtr<ID3D12CommandAllocator>, ComPtr<ID3D12GraphicsCommandList4>>;

    Result<ComPtr<ID3D12CommandAllocator>> AcquireAllocator();

    DX12Device* m_device = nullptr;
    ComPtr<ID3D12CommandQueue> m_commandQueue;
    ComPtr<ID3D12Fence> m_fence;
    D3D12_COMMAND_LIST_TYPE m_type = D3D12_COMMAND_LIST_TYPE_DIRECT;
    std::string m_name;

    ContextPool m_pool;

    HANDLE m_fenceEvent = nullptr;
    FenceValue m_lastSignaledValue = kNoFenceValue;
};

} // namespace Helios::Graphics
