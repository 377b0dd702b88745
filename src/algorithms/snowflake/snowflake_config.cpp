#include "algorithms/snowflake/snowflake_config.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>

#include "datetime/datetime.h"
#include "json/json_reader.h"

namespace flakeid::algorithms {
namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

template <typename T>
std::optional<T> ReadField(const json::JsonValue& node, std::string_view key) {
    if (!node.Contains(key)) {
        return std::nullopt;
    }
    auto value = node.GetAs<T>(key);
    if (!value.has_value()) {
        throw std::runtime_error("snowflake config field '" + std::string(key) +
                                 "' has an unexpected type");
    }
    return value;
}

// Integral JSON numbers only; fractions and values beyond int64 are rejected instead of narrowed.
std::optional<std::int64_t> ReadInteger(const json::JsonValue& node, std::string_view key) {
    const auto value = node.Get(key);
    if (!value.has_value()) {
        return std::nullopt;
    }
    const auto& raw = value->Raw();
    if (!raw.is_number_integer() ||
        (raw.is_number_unsigned() &&
         raw.get<std::uint64_t>() >
             static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))) {
        throw std::runtime_error("snowflake config field '" + std::string(key) +
                                 "' must be an integer");
    }
    return raw.get<std::int64_t>();
}

SequenceBackend ParseBackend(const std::string& value) {
    const auto lowered = ToLower(value);
    if (lowered == "local" || lowered == "none" || lowered.empty()) {
        return SequenceBackend::kLocal;
    }
    if (lowered == "redis") {
        return SequenceBackend::kRedis;
    }
    throw std::runtime_error("Unsupported sequence backend: " + value);
}

SequenceConfig ParseSequence(const json::JsonValue& node) {
    if (!node.IsObject()) {
        throw std::runtime_error("snowflake 'sequence' section must be an object");
    }

    SequenceConfig config;
    if (auto backend = ReadField<std::string>(node, "backend")) {
        config.backend = ParseBackend(*backend);
    }
    if (auto prefix = ReadField<std::string>(node, "key_prefix")) {
        config.key_prefix = *prefix;
    }
    if (auto ttl = ReadInteger(node, "ttl_ms")) {
        if (*ttl <= 0) {
            throw std::runtime_error("snowflake sequence ttl_ms must be positive");
        }
        config.ttl = std::chrono::milliseconds(*ttl);
    }
    config.redis = node.Get("redis");

    if (config.backend == SequenceBackend::kRedis &&
        (!config.redis.has_value() || !config.redis->IsObject())) {
        throw std::runtime_error("redis sequence backend requires a 'redis' section");
    }
    return config;
}

std::optional<std::int64_t> ParseStartTime(const json::JsonValue& node) {
    auto timestamp = ReadInteger(node, "start_timestamp_ms");
    auto date = ReadField<std::string>(node, "start_date");
    if (timestamp && date) {
        throw std::runtime_error("set either start_timestamp_ms or start_date, not both");
    }
    if (timestamp) {
        return timestamp;
    }
    if (!date) {
        return std::nullopt;
    }

    const auto timezone = ReadField<std::string>(node, "timezone").value_or("UTC");
    try {
        return datetime::DateTime::ToUnixMilliseconds(
            datetime::DateTime::Parse(*date, "%Y-%m-%d %H:%M:%S", timezone));
    } catch (const std::invalid_argument& ex) {
        throw std::runtime_error(std::string("invalid snowflake start_date: ") + ex.what());
    }
}

}  // namespace

ArithmeticMode ParseArithmeticMode(const std::string& value) {
    const auto lowered = ToLower(value);
    if (lowered == "auto" || lowered.empty()) {
        return ArithmeticMode::kAuto;
    }
    if (lowered == "native" || lowered == "64bit") {
        return ArithmeticMode::kNative;
    }
    if (lowered == "emulated" || lowered == "32bit") {
        return ArithmeticMode::kEmulated;
    }
    throw std::runtime_error("Unsupported arithmetic mode: " + value);
}

SnowflakeConfig LoadSnowflakeConfigFromJson(const json::JsonValue& root) {
    return LoadSnowflakeConfigFromJson(root, SnowflakeConfig{});
}

SnowflakeConfig LoadSnowflakeConfigFromJson(const json::JsonValue& root, SnowflakeConfig defaults) {
    const auto section = root.Get("snowflake");
    const auto& node = section.has_value() ? *section : root;
    if (!node.IsObject()) {
        throw std::runtime_error("snowflake config must be an object");
    }

    SnowflakeConfig config = std::move(defaults);
    config.datacenter_id = ReadInteger(node, "datacenter_id").value_or(config.datacenter_id);
    config.worker_id = ReadInteger(node, "worker_id").value_or(config.worker_id);
    config.is_cli = ReadField<bool>(node, "is_cli").value_or(config.is_cli);
    if (auto start = ParseStartTime(node)) {
        config.start_timestamp_ms = start;
    }

    if (auto arithmetic = ReadField<std::string>(node, "arithmetic")) {
        config.arithmetic = ParseArithmeticMode(*arithmetic);
    }
    if (auto backoff = ReadInteger(node, "backoff_us")) {
        if (*backoff < 0) {
            throw std::runtime_error("snowflake backoff_us must not be negative");
        }
        config.backoff = std::chrono::microseconds(*backoff);
    }
    if (auto attempts = ReadInteger(node, "max_backoff_attempts")) {
        if (*attempts < 0) {
            throw std::runtime_error("snowflake max_backoff_attempts must not be negative");
        }
        config.max_backoff_attempts = static_cast<std::size_t>(*attempts);
    }
    if (auto sequence = node.Get("sequence")) {
        config.sequence = ParseSequence(*sequence);
    }
    return config;
}

SnowflakeConfig LoadSnowflakeConfigFromFile(const std::string& file_path) {
    json::JsonReader reader;
    auto root = reader.ParseFile(file_path);
    if (!root.has_value()) {
        throw std::runtime_error("Unable to read snowflake config: " + file_path);
    }
    return LoadSnowflakeConfigFromJson(*root);
}

std::unique_ptr<SnowflakeGenerator> CreateSnowflakeGenerator(
    const SnowflakeConfig& config,
    std::shared_ptr<SequenceResolver> resolver,
    SnowflakeGenerator::Clock clock) {
    SnowflakeGenerator::Options options;
    options.arithmetic = config.arithmetic;
    options.backoff = config.backoff;
    options.max_backoff_attempts = config.max_backoff_attempts;
    options.clock = std::move(clock);

    auto generator = std::make_unique<SnowflakeGenerator>(
        config.datacenter_id, config.worker_id, std::move(resolver), config.is_cli,
        std::move(options));
    if (config.start_timestamp_ms.has_value()) {
        generator->SetStartTimeStamp(*config.start_timestamp_ms);
    }
    return generator;
}

}  // namespace flakeid::algorithms
