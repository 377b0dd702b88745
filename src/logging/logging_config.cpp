#include "logging/logging_config.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

#include "json/json_reader.h"

namespace flakeid::logging {
namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

spdlog::level::level_enum ParseLevel(const std::string& value) {
    const auto level = spdlog::level::from_str(ToLower(value));
    // from_str maps unknown names to "off"; only accept "off" when it was asked for.
    if (level == spdlog::level::off && ToLower(value) != "off") {
        throw std::runtime_error("Unknown log level: " + value);
    }
    return level;
}

spdlog::async_overflow_policy ParseOverflowPolicy(const std::string& value) {
    const auto lowered = ToLower(value);
    if (lowered == "block") {
        return spdlog::async_overflow_policy::block;
    }
    if (lowered == "overrun_oldest") {
        return spdlog::async_overflow_policy::overrun_oldest;
    }
    throw std::runtime_error("Unsupported async overflow policy: " + value);
}

RotationType ParseRotationType(const std::string& value) {
    const auto lowered = ToLower(value);
    if (lowered == "none" || lowered.empty()) {
        return RotationType::kNone;
    }
    if (lowered == "daily") {
        return RotationType::kDaily;
    }
    if (lowered == "hourly") {
        return RotationType::kHourly;
    }
    if (lowered == "size") {
        return RotationType::kSize;
    }
    throw std::runtime_error("Unsupported rotation type: " + value);
}

std::size_t ReadSize(const json::JsonValue& node, std::string_view field, std::size_t fallback) {
    if (!node.Contains(field)) {
        return fallback;
    }
    auto value = node.GetAs<std::size_t>(field);
    if (!value) {
        throw std::runtime_error("Expected numeric field: " + std::string(field));
    }
    return *value;
}

RotationPolicy ParseRotation(const json::JsonValue& node) {
    RotationPolicy policy;
    if (!node.IsObject()) {
        return policy;
    }

    policy.type = ParseRotationType(node.GetAs<std::string>("type").value_or("none"));
    policy.truncate = node.GetAs<bool>("truncate").value_or(false);
    policy.hour = node.GetAs<int>("hour").value_or(0);
    policy.minute = node.GetAs<int>("minute").value_or(0);
    policy.max_files = ReadSize(node, "max_files", 0);

    if (policy.type == RotationType::kSize) {
        policy.max_size_bytes = ReadSize(node, "max_size", 0);
        if (policy.max_size_bytes == 0) {
            policy.max_size_bytes = ReadSize(node, "max_size_mb", 0) * 1024 * 1024;
        }
        if (policy.max_size_bytes == 0) {
            throw std::runtime_error("size rotation requires max_size/max_size_mb");
        }
    }
    return policy;
}

AsyncPolicy ParseAsync(const json::JsonValue& node) {
    AsyncPolicy policy;
    if (!node.IsObject()) {
        return policy;
    }

    policy.enabled = node.GetAs<bool>("enabled").value_or(true);
    policy.queue_size = ReadSize(node, "queue_size", policy.queue_size);
    policy.thread_count = ReadSize(node, "thread_count", policy.thread_count);
    if (auto overflow = node.GetAs<std::string>("overflow_policy")) {
        policy.overflow_policy = ParseOverflowPolicy(*overflow);
    }
    return policy;
}

LoggerConfig ParseLogger(const json::JsonValue& node) {
    if (!node.IsObject()) {
        throw std::runtime_error("Each logger entry must be an object");
    }

    LoggerConfig config;
    config.name = node.GetAs<std::string>("name").value_or("");
    if (config.name.empty()) {
        throw std::runtime_error("Logger name is required");
    }

    config.file_path = node.GetAs<std::string>("file").value_or("");
    config.enable_console = node.GetAs<bool>("console").value_or(false);
    if (config.file_path.empty() && !config.enable_console) {
        throw std::runtime_error("Logger " + config.name +
                                 " must enable console output or provide a file path");
    }

    if (auto pattern = node.GetAs<std::string>("pattern")) {
        config.pattern = *pattern;
    }
    if (auto level = node.GetAs<std::string>("level")) {
        config.level = ParseLevel(*level);
    }
    if (!config.file_path.empty()) {
        if (auto rotation = node.Get("rotation")) {
            config.rotation = ParseRotation(*rotation);
        }
    }
    if (auto async = node.Get("async")) {
        config.async = ParseAsync(*async);
    }
    return config;
}

}  // namespace

LoggingConfig LoadLoggingConfigFromJson(const json::JsonValue& root) {
    const auto loggers = root.Get("loggers");
    if (!loggers.has_value() || !loggers->IsArray()) {
        throw std::runtime_error("Logging config must contain a 'loggers' array");
    }

    LoggingConfig config;
    for (std::size_t i = 0; i < loggers->Size(); ++i) {
        config.loggers.emplace_back(ParseLogger(*loggers->Get(i)));
    }

    if (config.loggers.empty()) {
        throw std::runtime_error("Logging config must declare at least one logger");
    }
    return config;
}

LoggingConfig LoadLoggingConfigFromFile(const std::string& file_path) {
    json::JsonReader reader;
    auto root = reader.ParseFile(file_path);
    if (!root.has_value()) {
        throw std::runtime_error("Unable to read logging config: " + file_path);
    }
    return LoadLoggingConfigFromJson(*root);
}

}  // namespace flakeid::logging
