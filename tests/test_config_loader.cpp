// test_config_loader.cpp
// Unit tests for renderer config parsing
// Run: test_config_loader.exe
//
// These tests verify that:
// 1. Missing sections and keys keep their defaults
// 2. Out-of-range values are clamped instead of rejected
// 3. Wrongly typed values fall back to the default
// 4. Malformed or non-object documents are Parse errors

#include "Utils/ConfigLoader.h"

#include <filesystem>
#include <fstream>
#include <iostream>

using namespace Helios;
using namespace Helios::Utils;
using nlohmann::json;

// ============================================================================
// Test Framework (minimal)
// ============================================================================

static int g_testsPassed = 0;
static int g_testsFailed = 0;

#define TEST_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            std::cerr << "[FAIL] " << __FUNCTION__ << ": " << message << std::endl; \
            g_testsFailed++; \
            return false; \
        } \
    } while(0)

#define TEST_PASS() \
    do { \
        std::cout << "[PASS] " << __FUNCTION__ << std::endl; \
        g_testsPassed++; \
        return true; \
    } while(0)

static std::filesystem::path WriteTempFile(const char* name, const char* contents) {
    std::filesystem::path path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::trunc);
    out << contents;
    return path;
}

// ============================================================================
// Parsing
// ============================================================================

bool test_empty_object_gives_defaults() {
    auto result = ConfigLoader::ParseRendererConfig(json::object());
    TEST_ASSERT(result.IsOk(), "Empty object should parse");

    const RendererConfig& config = result.Value();
    TEST_ASSERT(config.device.enableDebugLayer, "Debug layer defaults on");
    TEST_ASSERT(!config.device.enableGPUValidation, "GPU validation defaults off");
    TEST_ASSERT(config.frames.bufferCount == 3, "Triple buffering by default");
    TEST_ASSERT(config.descriptors.cbvSrvUavCapacity == 100, "Default CBV/SRV/UAV capacity is 100");
    TEST_ASSERT(config.logging.level == "info", "Default log level is info");
    TEST_PASS();
}

bool test_values_are_read() {
    json j = {
        {"device", {{"enableDebugLayer", false}, {"allowSoftwareAdapter", true}}},
        {"frames", {{"bufferCount", 2}, {"vsync", false}}},
        {"descriptors", {{"cbvSrvUavCapacity", 512}}},
        {"raytracing", {{"allowBlasUpdate", false}}},
        {"logging", {{"level", "debug"}, {"file", "run.log"}}},
    };

    auto result = ConfigLoader::ParseRendererConfig(j);
    TEST_ASSERT(result.IsOk(), "Valid document should parse");

    const RendererConfig& config = result.Value();
    TEST_ASSERT(!config.device.enableDebugLayer, "enableDebugLayer should be read");
    TEST_ASSERT(config.device.allowSoftwareAdapter, "allowSoftwareAdapter should be read");
    TEST_ASSERT(config.frames.bufferCount == 2, "bufferCount should be read");
    TEST_ASSERT(!config.frames.vsync, "vsync should be read");
    TEST_ASSERT(config.descriptors.cbvSrvUavCapacity == 512, "cbvSrvUavCapacity should be read");
    TEST_ASSERT(!config.raytracing.allowBlasUpdate, "allowBlasUpdate should be read");
    TEST_ASSERT(config.raytracing.preferFastTrace, "Unset preferFastTrace keeps its default");
    TEST_ASSERT(config.logging.level == "debug" && config.logging.file == "run.log", "Logging should be read");
    TEST_PASS();
}

bool test_out_of_range_values_are_clamped() {
    json j = {
        {"frames", {{"bufferCount", 8}}},
        {"descriptors", {{"cbvSrvUavCapacity", 0}}},
    };

    auto result = ConfigLoader::ParseRendererConfig(j);
    TEST_ASSERT(result.IsOk(), "Out-of-range values are clamped, not rejected");
    TEST_ASSERT(result.Value().frames.bufferCount == ConfigLoader::kMaxBufferCount, "bufferCount clamps to the max");
    TEST_ASSERT(result.Value().descriptors.cbvSrvUavCapacity == 1, "Zero capacity clamps to 1");

    auto low = ConfigLoader::ParseRendererConfig(json{{"frames", {{"bufferCount", 1}}}});
    TEST_ASSERT(low.IsOk() && low.Value().frames.bufferCount == ConfigLoader::kMinBufferCount,
                "bufferCount clamps to the min");
    TEST_PASS();
}

bool test_wrong_types_fall_back() {
    json j = {
        {"frames", {{"bufferCount", "three"}, {"vsync", 1.5}}},
        {"logging", {{"level", 42}}},
    };

    auto result = ConfigLoader::ParseRendererConfig(j);
    TEST_ASSERT(result.IsOk(), "Type mismatches should not fail the load");
    TEST_ASSERT(result.Value().frames.bufferCount == 3, "String bufferCount falls back to default");
    TEST_ASSERT(result.Value().logging.level == "info", "Numeric level falls back to default");
    TEST_PASS();
}

bool test_non_object_root_is_parse_error() {
    auto result = ConfigLoader::ParseRendererConfig(json::array({1, 2, 3}));
    TEST_ASSERT(result.IsErr(), "Array root should be rejected");
    TEST_ASSERT(result.Error().code == ErrorCode::Parse, "Rejection should be a Parse error");
    TEST_PASS();
}

// ============================================================================
// Files
// ============================================================================

bool test_missing_file_gives_defaults() {
    auto result = ConfigLoader::LoadRendererConfig("definitely/not/here/renderer.json");
    TEST_ASSERT(result.IsOk(), "Missing file should fall back to defaults");
    TEST_ASSERT(result.Value().frames.bufferCount == 3, "Defaults expected for a missing file");
    TEST_PASS();
}

bool test_malformed_file_is_parse_error() {
    const auto path = WriteTempFile("helios_malformed_config.json", "{ \"frames\": { \"bufferCount\": 2, ");
    auto result = ConfigLoader::LoadRendererConfig(path.string());
    std::filesystem::remove(path);

    TEST_ASSERT(result.IsErr(), "Truncated JSON should be rejected");
    TEST_ASSERT(result.Error().code == ErrorCode::Parse, "Truncated JSON should be a Parse error");
    TEST_PASS();
}

bool test_file_round_trip() {
    const auto path = WriteTempFile("helios_valid_config.json",
                                    R"({ "frames": { "bufferCount": 2 }, "descriptors": { "cbvSrvUavCapacity": 64 } })");
    auto result = ConfigLoader::LoadRendererConfig(path.string());
    std::filesystem::remove(path);

    TEST_ASSERT(result.IsOk(), "Valid file should load");
    TEST_ASSERT(result.Value().frames.bufferCount == 2, "bufferCount should come from the file");
    TEST_ASSERT(result.Value().descriptors.cbvSrvUavCapacity == 64, "Capacity should come from the file");
    TEST_PASS();
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "================================================" << std::endl;
    std::cout << "Renderer Config Loader Unit Tests" << std::endl;
    std::cout << "================================================" << std::endl;

    test_empty_object_gives_defaults();
    test_values_are_read();
    test_out_of_range_values_are_clamped();
    test_wrong_types_fall_back();
    test_non_object_root_is_parse_error();

    std::cout << "\n--- File Loading ---" << std::endl;
    test_missing_file_gives_defaults();
    test_malformed_file_is_parse_error();
    test_file_round_trip();
    std::cout << "\n================================================" << std::endl;
    std::cout << "Results: " << g_testsPassed << " passed, " << g_testsFailed << " failed" << std::endl;
    std::cout << "================================================" << std::endl;

    return g_testsFailed > 0 ? 1 : 0;
}
