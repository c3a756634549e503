#include "extmgr/utils/logging.hpp"

#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace extmgr {
namespace utils {

namespace {
    const char* kLoggerName = "extmgr";

    std::mutex& loggerMutex() {
        static std::mutex mutex;
        return mutex;
    }

    std::shared_ptr<spdlog::logger> createDefaultLogger() {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto log = std::make_shared<spdlog::logger>(kLoggerName, sink);
        log->set_level(spdlog::level::info);
        return log;
    }
}

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(loggerMutex());
    auto log = spdlog::get(kLoggerName);
    if (!log) {
        log = createDefaultLogger();
        spdlog::register_logger(log);
    }
    return log;
}

void configure_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!config.file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file));
    }

    auto log = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    log->set_level(spdlog::level::from_str(config.level));
    log->set_pattern(config.pattern);

    std::lock_guard<std::mutex> lock(loggerMutex());
    spdlog::drop(kLoggerName);
    spdlog::register_logger(log);
}

} // namespace utils
} // namespace extmgr
