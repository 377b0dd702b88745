#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "logging/logging_config.h"
#include "logging/logging_export.h"

namespace spdlog {
namespace details {
class thread_pool;
}
}  // namespace spdlog

namespace flakeid::logging {

// Owns the named spdlog loggers declared by a LoggingConfig. Loading a new config
// drops every logger created by the previous one.
class LoggingManager {
public:
    FLAKEID_LOGGING_API LoggingManager();
    FLAKEID_LOGGING_API ~LoggingManager();

    LoggingManager(const LoggingManager&) = delete;
    LoggingManager& operator=(const LoggingManager&) = delete;

    FLAKEID_LOGGING_API void LoadConfig(const LoggingConfig& config);
    FLAKEID_LOGGING_API void LoadConfigFromFile(const std::string& file_path);

    FLAKEID_LOGGING_API std::shared_ptr<spdlog::logger> GetLogger(std::string_view name) const;
    FLAKEID_LOGGING_API bool HasLogger(std::string_view name) const;
    FLAKEID_LOGGING_API void Shutdown();

private:
    std::shared_ptr<spdlog::logger> CreateLogger(const LoggerConfig& config);
    std::vector<spdlog::sink_ptr> BuildSinks(const LoggerConfig& config);
    void DropAllLoggers();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers_;
    std::vector<std::shared_ptr<spdlog::details::thread_pool>> async_pools_;
};

FLAKEID_LOGGING_API LoggingManager& LoggingManagerInstance();

#define FLAKEID_LOGGING_LOG(level, logger_name, ...)                                         \
    do {                                                                                     \
        auto _flakeid_logger_ptr =                                                           \
            ::flakeid::logging::LoggingManagerInstance().GetLogger(logger_name);             \
        if (_flakeid_logger_ptr) {                                                           \
            _flakeid_logger_ptr->log(level, __VA_ARGS__);                                    \
        }                                                                                    \
    } while (0)

}  // namespace flakeid::logging
