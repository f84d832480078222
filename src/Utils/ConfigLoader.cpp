// ConfigLoader.cpp
// JSON parsing for the renderer core configuration.

#include "ConfigLoader.h"
#include "Utils/FileUtils.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace Helios::Utils {

namespace {
    uint32_t ClampWithWarning(const char* key, uint32_t value, uint32_t minValue, uint32_t maxValue) {
        const uint32_t clamped = std::clamp(value, minValue, maxValue);
        if (clamped != value) {
            spdlog::warn("Config '{}' = {} out of range [{}, {}], using {}", key, value, minValue, maxValue, clamped);
        }
        return clamped;
    }
}

Result<RendererConfig> ConfigLoader::LoadRendererConfig(const std::string& path) {
    if (!FileExists(path)) {
        spdlog::warn("Config file {} not found. Using defaults.", path);
        return Result<RendererConfig>::Ok(RendererConfig{});
    }

    auto textResult = ReadTextFile(path);
    if (textResult.IsErr()) {
        return Result<RendererConfig>::Err(textResult.Error());
    }

    nlohmann::json j = nlohmann::json::parse(textResult.Value(), nullptr, false);
    if (j.is_discarded()) {
        return Result<RendererConfig>::Err(ErrorCode::Parse, "JSON parse error in " + path);
    }

    auto configResult = ParseRendererConfig(j);
    if (configResult.IsOk()) {
        spdlog::info("Loaded renderer config from {}", path);
    }
    return configResult;
}

Result<RendererConfig> ConfigLoader::ParseRendererConfig(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Result<RendererConfig>::Err(ErrorCode::Parse, "Renderer config root must be a JSON object");
    }

    RendererConfig config;

    if (j.contains("device")) {
        const auto& d = j["device"];
        config.device.enableDebugLayer = GetOr(d, "enableDebugLayer", true);
        config.device.enableGPUValidation = GetOr(d, "enableGPUValidation", false);
        config.device.allowSoftwareAdapter = GetOr(d, "allowSoftwareAdapter", false);
    }

    if (j.contains("frames")) {
        const auto& f = j["frames"];
        config.frames.bufferCount = ClampWithWarning(
            "frames.bufferCount", GetOr(f, "bufferCount", 3u), kMinBufferCount, kMaxBufferCount);
        config.frames.vsync = GetOr(f, "vsync", true);
    }

    if (j.contains("descriptors")) {
        const auto& d = j["descriptors"];
        config.descriptors.cbvSrvUavCapacity = ClampWithWarning(
            "descriptors.cbvSrvUavCapacity", GetOr(d, "cbvSrvUavCapacity", 100u), 1u, 1000000u);
    }

    if (j.contains("raytracing")) {
        const auto& r = j["raytracing"];
        config.raytracing.allowBlasUpdate = GetOr(r, "allowBlasUpdate", true);
        config.raytracing.preferFastTrace = GetOr(r, "preferFastTrace", true);
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        config.logging.level = GetOr<std::string>(l, "level", "info");
        config.logging.file = GetOr<std::string>(l, "file", "helios.log");
    }

    return Result<RendererConfig>::Ok(std::move(config));
}

} // namespace Helios::Utils
