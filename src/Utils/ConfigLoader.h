#pragma once

// ConfigLoader.h
// Loads the renderer core configuration from JSON.
// Missing keys keep their defaults; out-of-range values are clamped.

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "Utils/Result.h"

namespace Helios::Utils {

struct RendererConfig {
    struct Device {
        bool enableDebugLayer = true;
        bool enableGPUValidation = false;
        bool allowSoftwareAdapter = false;
    } device;

    struct Frames {
        uint32_t bufferCount = 3;
        bool vsync = true;
    } frames;

    // Shader-visible view heap capacity, fixed for the process lifetime.
    struct Descriptors {
        uint32_t cbvSrvUavCapacity = 100;
    } descriptors;

    struct Raytracing {
        bool allowBlasUpdate = true;
        bool preferFastTrace = true;
    } raytracing;

    struct Logging {
        std::string level = "info";
        std::string file = "helios.log";
    } logging;
};

class ConfigLoader {
public:
    static constexpr uint32_t kMinBufferCount = 2;
    static constexpr uint32_t kMaxBufferCount = 3;

    // A missing file yields defaults with a warning; a malformed file is a Parse error.
    static Result<RendererConfig> LoadRendererConfig(const std::string& path);

    static Result<RendererConfig> ParseRendererConfig(const nlohmann::json& j);

private:
    template<typename T>
    static T GetOr(const nlohmann::json& j, const std::string& key, T defaultValue) {
        if (j.contains(key)) {
            try {
                return j[key].get<T>();
            } catch (const nlohmann::json::exception&) {
                return defaultValue;
            }
        }
        return defaultValue;
    }
};

} // namespace Helios::Utils
