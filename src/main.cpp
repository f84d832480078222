#include "Graphics/FramePresenter.h"
#include "Graphics/RHI/DX12Buffer.h"
#include "Graphics/RHI/DX12CommandQueue.h"
#include "Graphics/RHI/DX12Device.h"
#include "Graphics/RHI/DX12Raytracing.h"
#include "Graphics/RHI/DescriptorHeap.h"
#include "Utils/ConfigLoader.h"
#include "Utils/Log.h"
#include "Utils/Verify.h"

#include <spdlog/spdlog.h>
#include <windows.h>

#include <array>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <span>
#include <string>

using namespace Helios;
using namespace Helios::Graphics;

namespace {

struct LaunchOptions {
    std::string configPath = "assets/config/renderer.json";
    uint32_t frameCount = 120;
};

LaunchOptions ParseCommandLine(int argc, char* argv[]) {
    // Supported flags:
    //   --config <path>   renderer JSON
    //   --frames <n>      number of frames to run before exiting
    LaunchOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            options.configPath = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            options.configPath = arg.substr(std::string("--config=").size());
        } else if (arg == "--frames" && i + 1 < argc) {
            options.frameCount = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (arg.rfind("--frames=", 0) == 0) {
            options.frameCount = static_cast<uint32_t>(
                std::strtoul(arg.substr(std::string("--frames=").size()).c_str(), nullptr, 10));
        } else {
            spdlog::warn("Ignoring unknown argument '{}'", arg);
        }
    }
    return options;
}

LONG WINAPI HeliosCrashHandler(EXCEPTION_POINTERS* info) {
    if (info && info->ExceptionRecord) {
        spdlog::critical("Unhandled SEH exception 0x{:08X} at {}",
                         static_cast<unsigned int>(info->ExceptionRecord->ExceptionCode),
                         info->ExceptionRecord->ExceptionAddress);
    }
    Utils::ShutdownLogging();
    return EXCEPTION_EXECUTE_HANDLER;
}

template<typename T>
std::span<const std::byte> AsBytes(const T& values) {
    return std::as_bytes(std::span(values));
}

// Uploads one triangle, builds its acceleration structures, then spins the
// frame loop with the instance rotating.
Result<void> RunHeadlessScene(const Utils::RendererConfig& config, uint32_t frameCount) {
    DeviceConfig deviceConfig;
    deviceConfig.enableDebugLayer = config.device.enableDebugLayer;
    deviceConfig.enableGPUValidation = config.device.enableGPUValidation;
    deviceConfig.allowSoftwareAdapter = config.device.allowSoftwareAdapter;
    if (const char* envDisableDebug = std::getenv("HELIOS_DISABLE_DEBUG_LAYER")) {
        std::string v = envDisableDebug;
        if (!v.empty() && v != "0" && v != "false" && v != "FALSE") {
            deviceConfig.enableDebugLayer = false;
            deviceConfig.enableGPUValidation = false;
            spdlog::warn("DX12 debug layer disabled via HELIOS_DISABLE_DEBUG_LAYER");
        }
    }

    DX12Device device;
    if (auto r = device.Initialize(deviceConfig); r.IsErr()) {
        return r;
    }

    DX12CommandQueue directQueue;
    if (auto r = directQueue.Initialize(device, D3D12_COMMAND_LIST_TYPE_DIRECT, "DirectQueue"); r.IsErr()) {
        return r;
    }
    DX12CommandQueue copyQueue;
    if (auto r = copyQueue.Initialize(device, D3D12_COMMAND_LIST_TYPE_COPY, "CopyQueue"); r.IsErr()) {
        return r;
    }

    CbvSrvUavHeap viewHeap;
    if (auto r = viewHeap.Initialize(device, config.descriptors.cbvSrvUavCapacity); r.IsErr()) {
        return r;
    }

    const std::array<float, 9> positions = {
         0.0f,  0.5f, 0.0f,
         0.5f, -0.5f, 0.0f,
        -0.5f, -0.5f, 0.0f,
    };
    const std::array<uint32_t, 3> indices = {0, 1, 2};
    const std::array<float, 12> colors = {
        1.0f, 0.0f, 0.0f, 1.0f,
        0.0f, 1.0f, 0.0f, 1.0f,
        0.0f, 0.0f, 1.0f, 1.0f,
    };

    auto vertexBuffer = UploadBuffer(device, copyQueue, AsBytes(positions), "Triangle::positions");
    if (vertexBuffer.IsErr()) {
        return Result<void>::Err(vertexBuffer.Error());
    }
    auto indexBuffer = UploadBuffer(device, copyQueue, AsBytes(indices), "Triangle::indices");
    if (indexBuffer.IsErr()) {
        return Result<void>::Err(indexBuffer.Error());
    }
    auto colorBuffer = UploadBuffer(device, copyQueue, AsBytes(colors), "Triangle::colors");
    if (colorBuffer.IsErr()) {
        return Result<void>::Err(colorBuffer.Error());
    }

    RaytracingSceneDesc sceneDesc;
    sceneDesc.name = "SmokeScene";
    sceneDesc.framesInFlight = config.frames.bufferCount;

    RaytracingScene scene;
    if (auto r = scene.Initialize(device, directQueue, viewHeap, sceneDesc); r.IsErr()) {
        return r;
    }

    D3D12_RAYTRACING_ACCELERATION_STRUCTURE_BUILD_FLAGS blasFlags = config.raytracing.preferFastTrace
        ? D3D12_RAYTRACING_ACCELERATION_STRUCTURE_BUILD_FLAG_PREFER_FAST_TRACE
        : D3D12_RAYTRACING_ACCELERATION_STRUCTURE_BUILD_FLAG_PREFER_FAST_BUILD;
    if (config.raytracing.allowBlasUpdate) {
        blasFlags |= D3D12_RAYTRACING_ACCELERATION_STRUCTURE_BUILD_FLAG_ALLOW_UPDATE;
    }
    const BlasId triangleBlas = scene.AddBlas(blasFlags);

    MeshGeometry triangle;
    triangle.vertexBuffer = vertexBuffer.Value().Get();
    triangle.vertexCount = 3;
    triangle.indexBuffer = indexBuffer.Value().Get();
    triangle.indexCount = static_cast<uint32_t>(indices.size());
    triangle.colorBuffer = colorBuffer.Value().Get();
    if (auto r = scene.AddMesh(triangleBlas, triangle); r.IsErr()) {
        return r;
    }

    auto instance = scene.AddInstance(triangleBlas, ConstantRotation{});
    if (instance.IsErr()) {
        return Result<void>::Err(instance.Error());
    }

    if (auto r = scene.Build(); r.IsErr()) {
        return r;
    }

    FramePresenter presenter;
    if (auto r = presenter.Initialize(device, directQueue, nullptr, config.frames.bufferCount,
                                      config.frames.vsync, device.SupportsTearing());
        r.IsErr()) {
        return r;
    }

    // Fixed 60 Hz timestep so runs are reproducible.
    constexpr double kFrameSeconds = 1.0 / 60.0;
    for (uint32_t frame = 0; frame < frameCount; ++frame) {
        auto ctx = directQueue.RequestContext();
        if (ctx.IsErr()) {
            return Result<void>::Err(ctx.Error());
        }
        CommandContext frameContext = std::move(ctx).Value();

        ID3D12DescriptorHeap* heaps[] = {viewHeap.GetHeap()};
        frameContext->SetDescriptorHeaps(1, heaps);

        if (auto r = scene.Update(frameContext.GetCommandList(), frame, frame * kFrameSeconds); r.IsErr()) {
            return r;
        }

        auto presented = presenter.Present(std::move(frameContext));
        if (presented.IsErr()) {
            return Result<void>::Err(presented.Error());
        }

        if (frame % 60 == 0) {
            spdlog::info("Frame {}: fence={}, TLAS SRV slot={}, heap {}/{}", frame, presented.Value(),
                         scene.GetTlasSrv().Index(), viewHeap.GetUsedCount(), viewHeap.GetCapacity());
        }
    }

    if (auto r = presenter.WaitForIdle(); r.IsErr()) {
        return r;
    }

    spdlog::info("Ran {} frames; TLAS SRV recreated {} time(s), {} allocator(s) pooled",
                 frameCount, scene.GetTlasSrvRecreateCount(), directQueue.GetPooledAllocatorCount());

    // Teardown order: everything that references the device goes first.
    presenter.Shutdown();
    scene.Shutdown();
    viewHeap.Shutdown();
    copyQueue.Shutdown();
    directQueue.Shutdown();
    // Only the device itself should be left alive at this point.
    device.ReportLiveObjects();
    device.Shutdown();
    return Result<void>::Ok();
}

} // namespace

int main(int argc, char* argv[]) {
    const LaunchOptions options = ParseCommandLine(argc, argv);

    auto configResult = Utils::ConfigLoader::LoadRendererConfig(options.configPath);
    if (configResult.IsErr()) {
        spdlog::error("Failed to load config '{}': {}", options.configPath, configResult.Error().message);
        return EXIT_FAILURE;
    }
    const Utils::RendererConfig config = configResult.Value();

    Utils::LogConfig logConfig;
    logConfig.level = config.logging.level;
    logConfig.filePath = config.logging.file;
    Utils::InitializeLogging(logConfig);

    SetUnhandledExceptionFilter(HeliosCrashHandler);

    spdlog::info("===================================");
    spdlog::info("  Helios renderer core smoke run");
    spdlog::info("===================================");

    int exitCode = EXIT_SUCCESS;
    try {
        auto result = RunHeadlessScene(config, options.frameCount);
        if (result.IsErr()) {
            spdlog::critical("Helios failed [{}]: {}", ToString(result.Error().code), result.Error().message);
            exitCode = EXIT_FAILURE;
        }
    } catch (const std::exception& e) {
        spdlog::critical("Fatal exception: {}", e.what());
        exitCode = EXIT_FAILURE;
    }

    Utils::ShutdownLogging();
    return exitCode;
}
