#include "Verify.h"

#include <cstdlib>
#include <utility>

#include <spdlog/spdlog.h>

namespace Helios::Utils {

namespace {
    FatalHandler& GetFatalHandlerSlot() {
        static FatalHandler handler;
        return handler;
    }
}

FatalHandler SetFatalHandler(FatalHandler handler) {
    FatalHandler previous = std::move(GetFatalHandlerSlot());
    GetFatalHandlerSlot() = std::move(handler);
    return previous;
}

void ReportFatal(const char* file, int line, const char* expression, const std::string& message) {
    std::string full = expression
        ? fmt::format("{} (check '{}' failed at {}:{})", message, expression, file ? file : "unknown", line)
        : fmt::format("{} (at {}:{})", message, file ? file : "unknown", line);

    spdlog::critical("{}", full);
    if (auto logger = spdlog::default_logger()) {
        logger->flush();
    }

    if (const FatalHandler& handler = GetFatalHandlerSlot()) {
        handler(full);
    }

    std::abort();
}

FatalHandler InstallThrowingFatalHandler() {
    return SetFatalHandler([](const std::string& message) {
        throw FatalError(message);
    });
}

} // namespace Helios::Utils
