// test_result_verify.cpp
// Unit tests for Result/Error propagation and the fatal precondition path
// Run: test_result_verify.exe

#include "Utils/Log.h"
#include "Utils/Result.h"
#include "Utils/Verify.h"

#include <iostream>
#include <string>

using namespace Helios;

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

static Result<int> ParsePositive(int value) {
    if (value <= 0) {
        return Result<int>::Err(ErrorCode::InvalidArgument, "value must be positive");
    }
    return Result<int>::Ok(value);
}

static Result<void> Forward(int value) {
    auto parsed = ParsePositive(value);
    if (parsed.IsErr()) {
        return Result<void>::Err(parsed.Error().Wrap("Forward"));
    }
    return Result<void>::Ok();
}

// ============================================================================
// Result
// ============================================================================

bool test_ok_and_err() {
    auto ok = ParsePositive(5);
    TEST_ASSERT(ok.IsOk() && !ok.IsErr(), "Positive value should be Ok");
    TEST_ASSERT(ok.Value() == 5, "Ok should carry the value");

    auto err = ParsePositive(-1);
    TEST_ASSERT(err.IsErr(), "Negative value should be Err");
    TEST_ASSERT(err.Error().code == ErrorCode::InvalidArgument, "Error code should be preserved");
    TEST_ASSERT(err.ValueOr(7) == 7, "ValueOr should fall back on Err");
    TEST_PASS();
}

bool test_wrap_keeps_code() {
    auto result = Forward(0);
    TEST_ASSERT(result.IsErr(), "Error should propagate");
    TEST_ASSERT(result.Error().code == ErrorCode::InvalidArgument, "Wrap must keep the original code");
    TEST_ASSERT(result.Error().message == "Forward: value must be positive", "Wrap should prefix context");
    TEST_ASSERT(Forward(3).IsOk(), "Ok should propagate");
    TEST_PASS();
}

bool test_error_code_names() {
    TEST_ASSERT(std::string(ToString(ErrorCode::DeviceRemoved)) == "DeviceRemoved", "DeviceRemoved name");
    TEST_ASSERT(std::string(ToString(ErrorCode::OutOfMemory)) == "OutOfMemory", "OutOfMemory name");
    TEST_ASSERT(std::string(ToString(ErrorCode::Parse)) == "Parse", "Parse name");
    TEST_PASS();
}

// ============================================================================
// Fatal Path
// ============================================================================

bool test_verify_passes_silently() {
    bool threw = false;
    try {
        HELIOS_VERIFY(1 + 1 == 2, "arithmetic is broken");
    } catch (const Utils::FatalError&) {
        threw = true;
    }
    TEST_ASSERT(!threw, "Passing check must not go fatal");
    TEST_PASS();
}

bool test_verify_failure_reports_message() {
    std::string message;
    try {
        const int capacity = 4;
        HELIOS_VERIFY(capacity > 8, "capacity {} below {}", capacity, 8);
    } catch (const Utils::FatalError& e) {
        message = e.what();
    }
    TEST_ASSERT(message.find("capacity 4 below 8") != std::string::npos, "Formatted message expected, got: " + message);
    TEST_ASSERT(message.find("capacity > 8") != std::string::npos, "Failed expression should be reported");
    TEST_PASS();
}

bool test_fatal_macro() {
    bool threw = false;
    try {
        HELIOS_FATAL("device lost in {}", "test");
    } catch (const Utils::FatalError& e) {
        threw = std::string(e.what()).find("device lost in test") != std::string::npos;
    }
    TEST_ASSERT(threw, "HELIOS_FATAL should reach the handler with its message");
    TEST_PASS();
}

bool test_handler_swap_returns_previous() {
    int calls = 0;
    auto previous = Utils::SetFatalHandler([&calls](const std::string&) {
        ++calls;
        throw Utils::FatalError("counted");
    });

    try {
        HELIOS_FATAL("first");
    } catch (const Utils::FatalError&) {
    }

    auto counting = Utils::SetFatalHandler(std::move(previous));
    TEST_ASSERT(calls == 1, "Installed handler should have run once");
    TEST_ASSERT(static_cast<bool>(counting), "SetFatalHandler should hand back the replaced handler");
    TEST_PASS();
}

bool test_fatal_is_logged_before_handler() {
    Utils::LogConfig logConfig;
    logConfig.level = "warn";
    logConfig.filePath.clear();
    logConfig.ringBufferEntries = 16;
    Utils::InitializeLogging(logConfig);

    try {
        HELIOS_FATAL("heap {} exhausted", "Rtv");
    } catch (const Utils::FatalError&) {
    }

    const auto lines = Utils::GetRecentLogLines(1);
    TEST_ASSERT(lines.size() == 1, "Ring buffer should hold the fatal line");
    TEST_ASSERT(lines[0].find("heap Rtv exhausted") != std::string::npos, "Logged line: " + lines[0]);
    TEST_ASSERT(lines[0].find("critical") != std::string::npos, "Fatal should log at critical level");
    Utils::ShutdownLogging();
    TEST_PASS();
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "================================================" << std::endl;
    std::cout << "Result / Fatal Check Unit Tests" << std::endl;
    std::cout << "================================================" << std::endl;

    test_ok_and_err();
    test_wrap_keeps_code();
    test_error_code_names();

    auto previousHandler = Utils::InstallThrowingFatalHandler();
    std::cout << "\n--- Fatal Path ---" << std::endl;
    test_verify_passes_silently();
    test_verify_failure_reports_message();
    test_fatal_macro();
    test_handler_swap_returns_previous();
    test_fatal_is_logged_before_handler();
    Utils::SetFatalHandler(std::move(previousHandler));
    std::cout << "\n================================================" << std::endl;
    std::cout << "Results: " << g_testsPassed << " passed, " << g_testsFailed << " failed" << std::endl;
    std::cout << "================================================" << std::endl;

    return g_testsFailed > 0 ? 1 : 0;
}
