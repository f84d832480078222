#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace Helios::Utils {

struct LogConfig {
    std::string level = "info";
    // Empty path disables the file sink.
    std::filesystem::path filePath = "helios.log";
    size_t ringBufferEntries = 4096;
};

// Replaces the default spdlog logger with console + file + ring-buffer sinks.
void InitializeLogging(const LogConfig& config);

// Most recent formatted lines from the ring-buffer sink, oldest first.
std::vector<std::string> GetRecentLogLines(size_t limit = 0);

// Flushes every sink. Safe to call more than once.
void ShutdownLogging();

} // namespace Helios::Utils
