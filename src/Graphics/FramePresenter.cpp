#include "FramePresenter.h"
#include "RHI/DX12Device.h"
#include "Utils/Verify.h"

#include <spdlog/spdlog.h>

namespace Helios::Graphics {

Result<void> CheckPresentResult(DX12Device& device, HRESULT hr) {
    if (IsDeviceRemovedError(hr)) {
        HELIOS_REPORT_DEVICE_REMOVED(device, "FramePresenter::Present", hr);
    }
    if (FAILED(hr)) {
        return Result<void>::Err(MakeDeviceError("Swap chain Present failed", hr));
    }
    return Result<void>::Ok();
}

FramePresenter::~FramePresenter() {
    Shutdown();
}

Result<void> FramePresenter::Initialize(DX12Device& device,
                                        DX12CommandQueue& queue,
                                        IDXGISwapChain3* swapChain,
                                        uint32_t bufferCount,
                                        bool vsync,
                                        bool allowTearing) {
    if (bufferCount < 2 || bufferCount > kMaxBufferCount) {
        return Result<void>::Err(ErrorCode::InvalidArgument,
                                 fmt::format("Frame presenter buffer count must be between 2 and {} (got {})",
                                             kMaxBufferCount, bufferCount));
    }
    if (queue.GetType() != D3D12_COMMAND_LIST_TYPE_DIRECT) {
        return Result<void>::Err(ErrorCode::InvalidArgument, "Frame presenter requires a direct queue");
    }
    if (swapChain) {
        DXGI_SWAP_CHAIN_DESC1 swapDesc = {};
        HRESULT hr = swapChain->GetDesc1(&swapDesc);
        if (FAILED(hr)) {
            return Result<void>::Err(MakeDeviceError("Failed to query swap chain description", hr));
        }
        if (swapDesc.BufferCount != bufferCount) {
            return Result<void>::Err(ErrorCode::InvalidArgument,
                                     fmt::format("Swap chain has {} buffers but the presenter was given {}",
                                                 swapDesc.BufferCount, bufferCount));
        }
    }

    m_device = &device;
    m_queue = &queue;
    m_swapChain = swapChain;
    m_bufferCount = bufferCount;
    m_vsync = vsync;
    m_allowTearing = allowTearing && !vsync;
    m_frameFences.fill(kNoFenceValue);
    m_frameCount = 0;
    m_backBufferIndex = m_swapChain ? m_swapChain->GetCurrentBackBufferIndex() : 0;

    spdlog::info("Frame presenter initialized: {} buffers, vsync={}, tearing={}{}",
                 m_bufferCount, m_vsync, m_allowTearing, m_swapChain ? "" : " (headless)");
    return Result<void>::Ok();
}

void FramePresenter::Shutdown() {
    if (!m_queue) {
        return;
    }

    auto idle = WaitForIdle();
    if (idle.IsErr()) {
        spdlog::error("Frame presenter: wait during shutdown failed: {}", idle.Error().message);
    }

    m_swapChain.Reset();
    m_queue = nullptr;
    m_device = nullptr;
}

Result<FenceValue> FramePresenter::Present(CommandContext&& frameContext) {
    auto executed = m_queue->Execute(std::move(frameContext));
    if (executed.IsErr()) {
        return Result<FenceValue>::Err(executed.Error().Wrap("Frame submission failed"));
    }

    if (m_swapChain) {
        const UINT syncInterval = m_vsync ? 1 : 0;
        const UINT presentFlags = m_allowTearing ? DXGI_PRESENT_ALLOW_TEARING : 0;
        auto presented = CheckPresentResult(*m_device, m_swapChain->Present(syncInterval, presentFlags));
        if (presented.IsErr()) {
            return Result<FenceValue>::Err(presented.Error());
        }
    }

    // Stamp the frame after Present so the fence also covers the flip.
    auto signaled = m_queue->Signal();
    if (signaled.IsErr()) {
        return Result<FenceValue>::Err(signaled.Error().Wrap("Frame fence signal failed"));
    }
    m_frameFences[m_backBufferIndex] = signaled.Value();
    ++m_frameCount;

    m_backBufferIndex = m_swapChain ? m_swapChain->GetCurrentBackBufferIndex()
                                    : (m_backBufferIndex + 1) % m_bufferCount;
    HELIOS_VERIFY(m_backBufferIndex < m_bufferCount, "Back buffer index {} exceeds buffer count {}",
                  m_backBufferIndex, m_bufferCount);

    const FenceValue pending = m_frameFences[m_backBufferIndex];
    if (pending != kNoFenceValue && !m_queue->IsFenceComplete(pending)) {
        spdlog::debug("Frame presenter waiting for GPU: backBuffer={}, expected={}, completed={}",
                      m_backBufferIndex, pending, m_queue->GetCompletedFenceValue());
        m_queue->Wait(pending);
    }

    return Result<FenceValue>::Ok(signaled.Value());
}

Result<void> FramePresenter::WaitForIdle() {
    if (!m_queue) {
        return Result<void>::Err(ErrorCode::InvalidArgument, "Frame presenter is not initialized");
    }
    return m_queue->Flush();
}

} // namespace Helios::Graphics
