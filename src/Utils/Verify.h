#pragma once

#include <functional>
#include <stdexcept>
#include <string>

#include <spdlog/fmt/fmt.h>

namespace Helios::Utils {

// Thrown by the test fatal handler so precondition failures can be asserted on.
class FatalError : public std::runtime_error {
public:
    explicit FatalError(const std::string& message) : std::runtime_error(message) {}
};

// Invoked after the failure has been logged. Returning from the handler aborts.
using FatalHandler = std::function<void(const std::string& message)>;

// Returns the previously installed handler.
FatalHandler SetFatalHandler(FatalHandler handler);

// Logs at critical level, runs the fatal handler, then aborts.
[[noreturn]] void ReportFatal(const char* file, int line, const char* expression, const std::string& message);

// Installs a handler that throws FatalError. Used by tests.
FatalHandler InstallThrowingFatalHandler();

} // namespace Helios::Utils

// Precondition check that stays on in release builds.
#define HELIOS_VERIFY(cond, ...)                                                          \
    do {                                                                                  \
        if (!(cond)) {                                                                    \
            ::Helios::Utils::ReportFatal(__FILE__, __LINE__, #cond, fmt::format(__VA_ARGS__)); \
        }                                                                                 \
    } while (0)

#define HELIOS_FATAL(...) \
    ::Helios::Utils::ReportFatal(__FILE__, __LINE__, nullptr, fmt::format(__VA_ARGS__))
