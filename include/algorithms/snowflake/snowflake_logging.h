#pragma once

#include <string_view>

#include <spdlog/spdlog.h>

#include "logging/logging_manager.h"

namespace flakeid::algorithms {

inline constexpr std::string_view kSnowflakeLoggerName{"snowflake"};

}  // namespace flakeid::algorithms

#define FLAKEID_SNOWFLAKE_LOG_WITH_LEVEL(level, ...)                                         \
    FLAKEID_LOGGING_LOG(level, ::flakeid::algorithms::kSnowflakeLoggerName, __VA_ARGS__)

#define FLAKEID_SNOWFLAKE_LOG_TRACE(...) FLAKEID_SNOWFLAKE_LOG_WITH_LEVEL(spdlog::level::trace, __VA_ARGS__)
#define FLAKEID_SNOWFLAKE_LOG_DEBUG(...) FLAKEID_SNOWFLAKE_LOG_WITH_LEVEL(spdlog::level::debug, __VA_ARGS__)
#define FLAKEID_SNOWFLAKE_LOG_INFO(...) FLAKEID_SNOWFLAKE_LOG_WITH_LEVEL(spdlog::level::info, __VA_ARGS__)
#define FLAKEID_SNOWFLAKE_LOG_WARN(...) FLAKEID_SNOWFLAKE_LOG_WITH_LEVEL(spdlog::level::warn, __VA_ARGS__)
#define FLAKEID_SNOWFLAKE_LOG_ERROR(...) FLAKEID_SNOWFLAKE_LOG_WITH_LEVEL(spdlog::level::err, __VA_ARGS__)
