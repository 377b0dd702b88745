#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "algorithms/snowflake/id_arithmetic.h"
#include "algorithms/snowflake/sequence_resolver.h"
#include "algorithms/snowflake/snowflake_export.h"
#include "algorithms/snowflake/snowflake_generator.h"
#include "json/json_value.h"

namespace flakeid::algorithms {

enum class SequenceBackend {
    kLocal,
    kRedis
};

struct SequenceConfig {
    SequenceBackend backend{SequenceBackend::kLocal};
    std::string key_prefix{"snowflakes"};
    std::chrono::milliseconds ttl{std::chrono::milliseconds(1000)};
    // Raw "redis" section, parsed by the Redis layer.
    std::optional<json::JsonValue> redis;
};

struct SnowflakeConfig {
    // Kept as read; anything outside [0, 31], -1 included, gets a random id from the generator.
    std::int64_t datacenter_id{-1};
    std::int64_t worker_id{-1};
    bool is_cli{false};
    std::optional<std::int64_t> start_timestamp_ms;
    ArithmeticMode arithmetic{ArithmeticMode::kAuto};
    std::chrono::microseconds backoff{1};
    std::size_t max_backoff_attempts{0};
    SequenceConfig sequence;
};

// Reads the "snowflake" section of root, or root itself when it has no such section.
// Throws std::runtime_error on malformed values.
FLAKEID_SNOWFLAKE_API SnowflakeConfig LoadSnowflakeConfigFromJson(const json::JsonValue& root);
// Same, with fields absent from the config keeping their value in defaults.
FLAKEID_SNOWFLAKE_API SnowflakeConfig LoadSnowflakeConfigFromJson(const json::JsonValue& root,
                                                                  SnowflakeConfig defaults);
FLAKEID_SNOWFLAKE_API SnowflakeConfig LoadSnowflakeConfigFromFile(const std::string& file_path);

FLAKEID_SNOWFLAKE_API ArithmeticMode ParseArithmeticMode(const std::string& value);

// Applies the configured start timestamp; its std::invalid_argument propagates.
FLAKEID_SNOWFLAKE_API std::unique_ptr<SnowflakeGenerator> CreateSnowflakeGenerator(
    const SnowflakeConfig& config,
    std::shared_ptr<SequenceResolver> resolver,
    SnowflakeGenerator::Clock clock = {});

}  // namespace flakeid::algorithms
