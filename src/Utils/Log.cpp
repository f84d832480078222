#include "Log.h"

#include <memory>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/ringbuffer_sink.h>

namespace Helios::Utils {

namespace {

struct LogState {
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> ringSink;
};

LogState& GetLogState() {
    static LogState s{};
    return s;
}

} // namespace

void InitializeLogging(const LogConfig& config) {
    auto& state = GetLogState();

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    bool fileSinkFailed = false;
    if (!config.filePath.empty()) {
        std::error_code ec;
        if (config.filePath.has_parent_path()) {
            std::filesystem::create_directories(config.filePath.parent_path(), ec);
        }
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.filePath.string(), true));
        } catch (const spdlog::spdlog_ex&) {
            fileSinkFailed = true;
        }
    }

    state.ringSink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(
        config.ringBufferEntries > 0 ? config.ringBufferEntries : 1);
    sinks.push_back(state.ringSink);

    auto logger = std::make_shared<spdlog::logger>("helios", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    spdlog::set_level(spdlog::level::from_str(config.level));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::flush_on(spdlog::level::warn);

    if (fileSinkFailed) {
        spdlog::warn("Could not open log file '{}'; logging to console only", config.filePath.string());
    }
}

std::vector<std::string> GetRecentLogLines(size_t limit) {
    auto& state = GetLogState();
    if (!state.ringSink) {
        return {};
    }
    return state.ringSink->last_formatted(limit);
}

void ShutdownLogging() {
    if (auto logger = spdlog::default_logger()) {
        logger->flush();
    }
}

} // namespace Helios::Utils
