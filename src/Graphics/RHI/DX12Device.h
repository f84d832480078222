#pragma once

#include "D3D12Includes.h"
#include <cstdint>
#include <string>

namespace Helios::Graphics {

struct DeviceConfig {
    bool enableDebugLayer = true;
    bool enableGPUValidation = false;
    // Falls back to WARP when no hardware adapter qualifies.
    bool allowSoftwareAdapter = false;
    bool requireRaytracing = true;
    D3D_FEATURE_LEVEL minFeatureLevel = D3D_FEATURE_LEVEL_12_0;
};

// Owns the D3D12 device and DXGI factory. Every other RHI object holds a
// non-owning reference to this and must be shut down before it.
class DX12Device {
public:
    DX12Device() = default;
    ~DX12Device();

    DX12Device(const DX12Device&) = delete;
    DX12Device& operator=(const DX12Device&) = delete;
    DX12Device(DX12Device&&) = delete;
    DX12Device& operator=(DX12Device&&) = delete;

    Result<void> Initialize(const DeviceConfig& config = {});
    void Shutdown();

    [[nodiscard]] ID3D12Device* GetDevice() const { return m_device.Get(); }
    [[nodiscard]] ID3D12Device5* GetDevice5() const { return m_device5.Get(); }
    [[nodiscard]] IDXGIFactory6* GetFactory() const { return m_factory.Get(); }
    [[nodiscard]] IDXGIAdapter1* GetAdapter() const { return m_adapter.Get(); }
    [[nodiscard]] const std::string& GetAdapterName() const { return m_adapterName; }

    [[nodiscard]] bool SupportsRaytracing() const { return m_raytracingTier >= D3D12_RAYTRACING_TIER_1_0; }
    [[nodiscard]] D3D12_RAYTRACING_TIER GetRaytracingTier() const { return m_raytracingTier; }
    [[nodiscard]] bool SupportsTearing() const { return m_supportsTearing; }
    [[nodiscard]] bool IsDebugLayerEnabled() const { return m_debugLayerEnabled; }
    [[nodiscard]] bool IsSoftwareAdapter() const { return m_softwareAdapter; }

    // Dumps live DXGI/D3D12 objects to the debugger output. Debug layer only.
    void ReportLiveObjects() const;

    // Logs the removal reason and DRED page-fault data, then goes fatal.
    [[noreturn]] void ReportDeviceRemoved(const char* context, HRESULT hr, const char* file, int line) const;

private:
    Result<void> CreateFactory();
    Result<void> SelectAdapter(const DeviceConfig& config);
    Result<void> CreateDevice(D3D_FEATURE_LEVEL minFeatureLevel);
    void CheckFeatureSupport();
    void EnableDRED();
    void RegisterInfoQueueCallback();
    void UnregisterInfoQueueCallback();

    static void CALLBACK InfoQueueCallback(D3D12_MESSAGE_CATEGORY category,
                                           D3D12_MESSAGE_SEVERITY severity,
                                           D3D12_MESSAGE_ID id,
                                           LPCSTR pDescription,
                                           void* pContext);

    ComPtr<IDXGIFactory6> m_factory;
    ComPtr<IDXGIAdapter1> m_adapter;
    ComPtr<ID3D12Device> m_device;
    ComPtr<ID3D12Device5> m_device5;

    std::string m_adapterName;
    D3D12_RAYTRACING_TIER m_raytracingTier = D3D12_RAYTRACING_TIER_NOT_SUPPORTED;

    bool m_supportsTearing = false;
    bool m_debugLayerEnabled = false;
    bool m_softwareAdapter = false;

    bool m_infoQueueCallbackRegistered = false;
    DWORD m_infoQueueCallbackCookie = 0;
};

// Captures the call site for DX12Device::ReportDeviceRemoved.
#define HELIOS_REPORT_DEVICE_REMOVED(device, ctx, hr) \
    (device).ReportDeviceRemoved((ctx), (hr), __FILE__, __LINE__)

} // namespace Helios::Graphics
