#pragma once

#include "RHI/D3D12Includes.h"
#include "RHI/DX12CommandQueue.h"
#include "RHI/FenceValue.h"

#include <array>
#include <cstdint>

namespace Helios::Graphics {

class DX12Device;

// Maps a swap chain Present result. Device loss goes through
// DX12Device::ReportDeviceRemoved and does not return.
Result<void> CheckPresentResult(DX12Device& device, HRESULT hr);

// Paces the CPU against the GPU: keeps at most bufferCount frames in flight
// by stamping a fence per back buffer and waiting on it before reuse.
// Without a swap chain it runs headless and cycles back buffers round-robin.
class FramePresenter {
public:
    static constexpr uint32_t kMaxBufferCount = 3;

    FramePresenter() = default;
    ~FramePresenter();

    FramePresenter(const FramePresenter&) = delete;
    FramePresenter& operator=(const FramePresenter&) = delete;

    // bufferCount must equal the swap chain's own buffer count.
    Result<void> Initialize(DX12Device& device,
                            DX12CommandQueue& queue,
                            IDXGISwapChain3* swapChain,
                            uint32_t bufferCount,
                            bool vsync,
                            bool allowTearing);
    void Shutdown();

    // Submits the frame's work, presents, and blocks until the next back
    // buffer's previous frame has retired. Returns the fence stamped for
    // this frame. Device removal during Present is fatal.
    Result<FenceValue> Present(CommandContext&& frameContext);

    // Blocks until every submitted frame has completed.
    Result<void> WaitForIdle();

    [[nodiscard]] uint32_t GetBackBufferIndex() const { return m_backBufferIndex; }
    [[nodiscard]] uint32_t GetBufferCount() const { return m_bufferCount; }
    [[nodiscard]] uint64_t GetFrameCount() const { return m_frameCount; }
    [[nodiscard]] bool IsHeadless() const { return m_swapChain == nullptr; }

private:
    DX12Device* m_device = nullptr;
    DX12CommandQueue* m_queue = nullptr;
    ComPtr<IDXGISwapChain3> m_swapChain;

    uint32_t m_bufferCount = 0;
    uint32_t m_backBufferIndex = 0;
    uint64_t m_frameCount = 0;
    bool m_vsync = true;
    bool m_allowTearing = false;

    std::array<FenceValue, kMaxBufferCount> m_frameFences{};
};

} // namespace Helios::Graphics
