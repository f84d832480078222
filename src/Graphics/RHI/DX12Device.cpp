#include "DX12Device.h"
#include "Utils/Verify.h"
#include <spdlog/spdlog.h>
#include <dxgidebug.h>
#include <Windows.h>

namespace Helios::Graphics {

namespace {
    const char* SeverityName(D3D12_MESSAGE_SEVERITY severity) {
        switch (severity) {
            case D3D12_MESSAGE_SEVERITY_CORRUPTION: return "CORRUPTION";
            case D3D12_MESSAGE_SEVERITY_ERROR:      return "ERROR";
            case D3D12_MESSAGE_SEVERITY_WARNING:    return "WARNING";
            case D3D12_MESSAGE_SEVERITY_INFO:       return "INFO";
            case D3D12_MESSAGE_SEVERITY_MESSAGE:    return "MESSAGE";
            default:                                return "UNKNOWN";
        }
    }

    std::string NarrowAdapterName(const WCHAR* description) {
        char adapterName[128] = {};
        size_t converted = 0;
        wcstombs_s(&converted, adapterName, sizeof(adapterName), description, _TRUNCATE);
        return adapterName;
    }

    // Checks with a throwaway device; the real one is created after selection.
    bool AdapterMeetsRequirements(IDXGIAdapter1* adapter, const DeviceConfig& config) {
        ComPtr<ID3D12Device> probeDevice;
        if (FAILED(D3D12CreateDevice(adapter, config.minFeatureLevel, IID_PPV_ARGS(&probeDevice)))) {
            return false;
        }
        if (!config.requireRaytracing) {
            return true;
        }
        D3D12_FEATURE_DATA_D3D12_OPTIONS5 options5 = {};
        if (FAILED(probeDevice->CheckFeatureSupport(D3D12_FEATURE_D3D12_OPTIONS5, &options5, sizeof(options5)))) {
            return false;
        }
        return options5.RaytracingTier >= D3D12_RAYTRACING_TIER_1_0;
    }
}

DX12Device::~DX12Device() {
    Shutdown();
}

Result<void> DX12Device::Initialize(const DeviceConfig& config) {
    spdlog::info("Initializing DX12 Device...");

    // The debug layer is optional; a missing SDK layer just means a release device.
    bool debugLayerEnabled = false;
    if (config.enableDebugLayer || config.enableGPUValidation) {
        ComPtr<ID3D12Debug> debugController;
        if (SUCCEEDED(D3D12GetDebugInterface(IID_PPV_ARGS(&debugController)))) {
            debugController->EnableDebugLayer();
            spdlog::info("D3D12 Debug Layer enabled");

            ComPtr<ID3D12Debug1> debugController1;
            if (SUCCEEDED(debugController.As(&debugController1))) {
                debugController1->SetEnableGPUBasedValidation(config.enableGPUValidation ? TRUE : FALSE);
                if (config.enableGPUValidation) {
                    spdlog::info("GPU-based validation enabled");
                }
            }
            debugLayerEnabled = true;
        } else {
            spdlog::warn("Failed to enable D3D12 Debug Layer, continuing without it");
        }
    }

    m_debugLayerEnabled = debugLayerEnabled;

    if (debugLayerEnabled) {
        EnableDRED();
    }

    auto factoryResult = CreateFactory();
    if (factoryResult.IsErr()) {
        return factoryResult;
    }

    auto adapterResult = SelectAdapter(config);
    if (adapterResult.IsErr()) {
        return adapterResult;
    }

    auto deviceResult = CreateDevice(config.minFeatureLevel);
    if (deviceResult.IsErr()) {
        return deviceResult;
    }

    CheckFeatureSupport();

    if (config.requireRaytracing && !SupportsRaytracing()) {
        return Result<void>::Err(ErrorCode::DeviceCall,
            "Selected adapter '" + m_adapterName + "' does not support DXR tier 1.0");
    }

    spdlog::info("DX12 Device initialized successfully");
    return Result<void>::Ok();
}

void DX12Device::Shutdown() {
    if (!m_device && !m_factory) {
        return;
    }

    UnregisterInfoQueueCallback();
    m_device5.Reset();
    m_device.Reset();
    m_adapter.Reset();
    m_factory.Reset();
    m_adapterName.clear();
    m_raytracingTier = D3D12_RAYTRACING_TIER_NOT_SUPPORTED;

    spdlog::info("DX12 Device shut down");
}

Result<void> DX12Device::CreateFactory() {
    UINT dxgiFactoryFlags = m_debugLayerEnabled ? DXGI_CREATE_FACTORY_DEBUG : 0;

    HRESULT hr = CreateDXGIFactory2(dxgiFactoryFlags, IID_PPV_ARGS(&m_factory));
    if (FAILED(hr) && dxgiFactoryFlags != 0) {
        spdlog::warn("DXGI debug factory unavailable (hr=0x{:08X}), retrying without it",
                     static_cast<unsigned int>(hr));
        hr = CreateDXGIFactory2(0, IID_PPV_ARGS(&m_factory));
    }
    if (FAILED(hr)) {
        return Result<void>::Err(MakeDeviceError("Failed to create DXGI Factory", hr));
    }

    return Result<void>::Ok();
}

Result<void> DX12Device::SelectAdapter(const DeviceConfig& config) {
    ComPtr<IDXGIAdapter1> adapter;

    for (UINT adapterIndex = 0;
         SUCCEEDED(m_factory->EnumAdapterByGpuPreference(
             adapterIndex,
             DXGI_GPU_PREFERENCE_HIGH_PERFORMANCE,
             IID_PPV_ARGS(&adapter)));
         ++adapterIndex)
    {
        DXGI_ADAPTER_DESC1 desc;
        adapter->GetDesc1(&desc);

        if (desc.Flags & DXGI_ADAPTER_FLAG_SOFTWARE) {
            continue;
        }

        if (AdapterMeetsRequirements(adapter.Get(), config)) {
            m_adapter = adapter;
            m_adapterName = NarrowAdapterName(desc.Description);
            m_softwareAdapter = false;

            spdlog::info("Selected GPU: {}", m_adapterName);
            spdlog::info("  Dedicated Video Memory: {} MB", desc.DedicatedVideoMemory / (1024 * 1024));
            return Result<void>::Ok();
        }

        spdlog::info("Skipping GPU '{}': feature level or raytracing requirement not met",
                     NarrowAdapterName(desc.Description));
    }

    if (config.allowSoftwareAdapter) {
        HRESULT hr = m_factory->EnumWarpAdapter(IID_PPV_ARGS(&adapter));
        if (SUCCEEDED(hr) && !AdapterMeetsRequirements(adapter.Get(), config)) {
            return Result<void>::Err(ErrorCode::DeviceCall, "WARP adapter does not meet the feature requirements");
        }
        if (SUCCEEDED(hr)) {
            DXGI_ADAPTER_DESC1 desc;
            adapter->GetDesc1(&desc);
            m_adapter = adapter;
            m_adapterName = NarrowAdapterName(desc.Description);
            m_softwareAdapter = true;
            spdlog::warn("No hardware adapter found, using WARP: {}", m_adapterName);
            return Result<void>::Ok();
        }
        return Result<void>::Err(MakeDeviceError("Failed to enumerate WARP adapter", hr));
    }

    return Result<void>::Err(ErrorCode::DeviceCall, "No compatible GPU adapter found");
}

Result<void> DX12Device::CreateDevice(D3D_FEATURE_LEVEL minFeatureLevel) {
    HRESULT hr = D3D12CreateDevice(
        m_adapter.Get(),
        minFeatureLevel,
        IID_PPV_ARGS(&m_device)
    );

    if (FAILED(hr)) {
        return Result<void>::Err(MakeDeviceError("Failed to create D3D12 device", hr));
    }
    SetDebugName(m_device.Get(), "Helios::Device");

    // ID3D12Device5 is the entry point for acceleration structure builds.
    hr = m_device.As(&m_device5);
    if (FAILED(hr)) {
        spdlog::warn("ID3D12Device5 not available (hr=0x{:08X}); raytracing disabled",
                     static_cast<unsigned int>(hr));
        m_device5.Reset();
    }

    // Break on corruption only under a debugger; otherwise it is a hard crash for users.
    ComPtr<ID3D12InfoQueue> infoQueue;
    if (m_debugLayerEnabled && SUCCEEDED(m_device.As(&infoQueue))) {
        infoQueue->SetBreakOnSeverity(D3D12_MESSAGE_SEVERITY_CORRUPTION,
                                      IsDebuggerPresent() ? TRUE : FALSE);
        infoQueue->SetBreakOnSeverity(D3D12_MESSAGE_SEVERITY_ERROR, FALSE);
        infoQueue->SetBreakOnSeverity(D3D12_MESSAGE_SEVERITY_WARNING, FALSE);

        D3D12_MESSAGE_SEVERITY severities[] = { D3D12_MESSAGE_SEVERITY_INFO };
        D3D12_INFO_QUEUE_FILTER filter = {};
        filter.DenyList.NumSeverities = _countof(severities);
        filter.DenyList.pSeverityList = severities;
        infoQueue->PushStorageFilter(&filter);
    }

    RegisterInfoQueueCallback();

    return Result<void>::Ok();
}

void DX12Device::CheckFeatureSupport() {
    D3D12_FEATURE_DATA_D3D12_OPTIONS5 options5 = {};
    if (m_device5 &&
        SUCCEEDED(m_device->CheckFeatureSupport(D3D12_FEATURE_D3D12_OPTIONS5, &options5, sizeof(options5)))) {
        m_raytracingTier = options5.RaytracingTier;
    }
    spdlog::info("Raytracing tier: 0x{:X}", static_cast<unsigned int>(m_raytracingTier));

    BOOL allowTearing = FALSE;
    ComPtr<IDXGIFactory5> factory5;
    if (SUCCEEDED(m_factory.As(&factory5))) {
        HRESULT hr = factory5->CheckFeatureSupport(
            DXGI_FEATURE_PRESENT_ALLOW_TEARING,
            &allowTearing,
            sizeof(allowTearing)
        );

        m_supportsTearing = SUCCEEDED(hr) && allowTearing;

        if (m_supportsTearing) {
            spdlog::info("Variable refresh rate (tearing) supported");
        }
    }
}

void DX12Device::EnableDRED() {
    ComPtr<ID3D12DeviceRemovedExtendedDataSettings> dredSettings;
    if (SUCCEEDED(D3D12GetDebugInterface(IID_PPV_ARGS(&dredSettings)))) {
        dredSettings->SetAutoBreadcrumbsEnablement(D3D12_DRED_ENABLEMENT_FORCED_ON);
        dredSettings->SetPageFaultEnablement(D3D12_DRED_ENABLEMENT_FORCED_ON);
        spdlog::info("DX12 DRED (auto-breadcrumbs + page fault reporting) enabled");
    } else {
        spdlog::warn("DX12 DRED settings interface not available; device-removed diagnostics limited");
    }
}

void DX12Device::ReportLiveObjects() const {
    if (!m_debugLayerEnabled) {
        return;
    }

    ComPtr<IDXGIDebug1> dxgiDebug;
    if (SUCCEEDED(DXGIGetDebugInterface1(0, IID_PPV_ARGS(&dxgiDebug)))) {
        dxgiDebug->ReportLiveObjects(
            DXGI_DEBUG_ALL,
            static_cast<DXGI_DEBUG_RLO_FLAGS>(DXGI_DEBUG_RLO_DETAIL | DXGI_DEBUG_RLO_IGNORE_INTERNAL));
    }
}

void DX12Device::ReportDeviceRemoved(const char* context, HRESULT hr, const char* file, int line) const {
    HRESULT reason = S_OK;
    if (m_device) {
        reason = m_device->GetDeviceRemovedReason();
    }

    spdlog::error("DX12 device removed or GPU fault in '{}' (hr=0x{:08X}, reason=0x{:08X}, adapter='{}', at {}:{})",
                  context ? context : "Unknown",
                  static_cast<unsigned int>(hr),
                  static_cast<unsigned int>(reason),
                  m_adapterName,
                  file ? file : "unknown",
                  line);

    ComPtr<ID3D12DeviceRemovedExtendedData> dred;
    if (m_device && SUCCEEDED(m_device.As(&dred))) {
        D3D12_DRED_PAGE_FAULT_OUTPUT pageFault = {};
        if (SUCCEEDED(dred->GetPageFaultAllocationOutput(&pageFault)) && pageFault.PageFaultVA != 0) {
            spdlog::error("DRED page fault at GPU VA 0x{:016X}",
                          static_cast<unsigned long long>(pageFault.PageFaultVA));
        }
    }

    HELIOS_FATAL("GPU device lost in '{}'", context ? context : "Unknown");
}

void DX12Device::RegisterInfoQueueCallback() {
    if (!m_device || !m_debugLayerEnabled || m_infoQueueCallbackRegistered) {
        return;
    }

    ComPtr<ID3D12InfoQueue1> infoQueue1;
    if (FAILED(m_device.As(&infoQueue1)) || !infoQueue1) {
        return;
    }

    const HRESULT hr = infoQueue1->RegisterMessageCallback(
        &DX12Device::InfoQueueCallback,
        D3D12_MESSAGE_CALLBACK_FLAG_NONE,
        this,
        &m_infoQueueCallbackCookie);
    if (SUCCEEDED(hr)) {
        m_infoQueueCallbackRegistered = true;
        spdlog::info("DX12 InfoQueue callback registered");
    }
}

void DX12Device::UnregisterInfoQueueCallback() {
    if (!m_device || !m_infoQueueCallbackRegistered) {
        return;
    }

    ComPtr<ID3D12InfoQueue1> infoQueue1;
    if (SUCCEEDED(m_device.As(&infoQueue1)) && infoQueue1) {
        infoQueue1->UnregisterMessageCallback(m_infoQueueCallbackCookie);
    }

    m_infoQueueCallbackRegistered = false;
    m_infoQueueCallbackCookie = 0;
}

void CALLBACK DX12Device::InfoQueueCallback(D3D12_MESSAGE_CATEGORY category,
                                           D3D12_MESSAGE_SEVERITY severity,
                                           D3D12_MESSAGE_ID id,
                                           LPCSTR pDescription,
                                           void* pContext) {
    (void)category;
    (void)pContext;

    if (!pDescription) {
        return;
    }

    const char* name = SeverityName(severity);
    switch (severity) {
        case D3D12_MESSAGE_SEVERITY_CORRUPTION:
        case D3D12_MESSAGE_SEVERITY_ERROR:
            spdlog::error("D3D12 [{}] id={} {}", name, static_cast<int>(id), pDescription);
            break;
        case D3D12_MESSAGE_SEVERITY_WARNING:
            spdlog::warn("D3D12 [{}] id={} {}", name, static_cast<int>(id), pDescription);
            break;
        default:
            spdlog::debug("D3D12 [{}] id={} {}", name, static_cast<int>(id), pDescription);
            break;
    }
}

} // namespace Helios::Graphics
