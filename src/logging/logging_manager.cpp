#include "logging/logging_manager.h"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <stdexcept>

#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/hourly_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace flakeid::logging {
namespace {

void EnsureParentDirectory(const std::string& file_path) {
    const auto parent = std::filesystem::path(file_path).parent_path();
    if (parent.empty()) {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw std::runtime_error("Failed to create log directory: " + parent.string());
    }
}

std::uint16_t MaxFiles(const RotationPolicy& policy) {
    return static_cast<std::uint16_t>(
        std::min<std::size_t>(policy.max_files, std::numeric_limits<std::uint16_t>::max()));
}

}  // namespace

LoggingManager::LoggingManager() = default;

LoggingManager::~LoggingManager() {
    Shutdown();
}

void LoggingManager::LoadConfig(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    DropAllLoggers();

    for (const auto& logger_config : config.loggers) {
        auto logger = CreateLogger(logger_config);
        spdlog::register_logger(logger);
        loggers_.emplace(logger_config.name, std::move(logger));
    }
}

void LoggingManager::LoadConfigFromFile(const std::string& file_path) {
    LoadConfig(LoadLoggingConfigFromFile(file_path));
}

std::shared_ptr<spdlog::logger> LoggingManager::GetLogger(std::string_view name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto iter = loggers_.find(std::string(name));
    if (iter == loggers_.end()) {
        return nullptr;
    }
    return iter->second;
}

bool LoggingManager::HasLogger(std::string_view name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loggers_.find(std::string(name)) != loggers_.end();
}

void LoggingManager::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    DropAllLoggers();
}

std::shared_ptr<spdlog::logger> LoggingManager::CreateLogger(const LoggerConfig& config) {
    auto sinks = BuildSinks(config);

    std::shared_ptr<spdlog::logger> logger;
    if (config.async.enabled) {
        auto pool = std::make_shared<spdlog::details::thread_pool>(config.async.queue_size,
                                                                   config.async.thread_count);
        async_pools_.push_back(pool);
        logger = std::make_shared<spdlog::async_logger>(config.name, sinks.begin(), sinks.end(),
                                                        pool, config.async.overflow_policy);
    } else {
        logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    }

    logger->set_level(config.level);
    logger->set_pattern(config.pattern.empty() ? "%+" : config.pattern);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

std::vector<spdlog::sink_ptr> LoggingManager::BuildSinks(const LoggerConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.enable_console) {
        sinks.emplace_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    if (!config.file_path.empty()) {
        EnsureParentDirectory(config.file_path);
        const auto& rotation = config.rotation;

        switch (rotation.type) {
            case RotationType::kDaily:
                sinks.emplace_back(std::make_shared<spdlog::sinks::daily_file_sink_mt>(
                    config.file_path, rotation.hour, rotation.minute, rotation.truncate,
                    MaxFiles(rotation)));
                break;
            case RotationType::kHourly:
                sinks.emplace_back(std::make_shared<spdlog::sinks::hourly_file_sink_mt>(
                    config.file_path, rotation.truncate, MaxFiles(rotation)));
                break;
            case RotationType::kSize:
                sinks.emplace_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    config.file_path, rotation.max_size_bytes,
                    std::max<std::size_t>(rotation.max_files, 1)));
                break;
            case RotationType::kNone:
            default:
                sinks.emplace_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                    config.file_path, rotation.truncate));
                break;
        }
    }

    if (sinks.empty()) {
        throw std::runtime_error("Logger " + config.name + " has no sinks configured");
    }
    return sinks;
}

void LoggingManager::DropAllLoggers() {
    for (auto& [name, logger] : loggers_) {
        if (logger) {
            logger->flush();
            spdlog::drop(name);
        }
    }
    loggers_.clear();
    async_pools_.clear();
}

LoggingManager& LoggingManagerInstance() {
    static LoggingManager instance;
    return instance;
}

}  // namespace flakeid::logging
