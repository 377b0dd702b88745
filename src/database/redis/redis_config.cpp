#include "database/redis/redis_config.h"

#include <algorithm>
#include <utility>

namespace flakeid::database::redis {
namespace {

RedisEndpoint ReadEndpoint(const json::JsonValue& value) {
    RedisEndpoint endpoint;
    if (auto host = value.GetAs<std::string>("host")) {
        endpoint.host = *host;
    }
    if (auto port = value.GetAs<std::uint16_t>("port")) {
        endpoint.port = *port;
    }
    if (auto db = value.GetAs<int>("db")) {
        endpoint.db = *db;
    }
    if (auto password = value.GetAs<std::string>("password")) {
        endpoint.password = *password;
    }
    return endpoint;
}

}  // namespace

std::optional<RedisConfig> RedisConfig::FromJson(const json::JsonValue& value) {
    if (!value.IsObject()) {
        return std::nullopt;
    }

    RedisConfig config;
    config.cluster_mode = value.GetAs<bool>("cluster").value_or(false);

    if (auto pool = value.GetAs<int>("pool_size")) {
        config.pool_size = static_cast<std::size_t>(std::max(1, *pool));
    }
    if (auto username = value.GetAs<std::string>("username")) {
        config.username = username;
    }
    if (auto password = value.GetAs<std::string>("password")) {
        config.password = password;
    }
    if (auto connect_timeout_ms = value.GetAs<int>("connect_timeout_ms")) {
        config.connect_timeout = std::chrono::milliseconds(*connect_timeout_ms);
    }
    if (auto socket_timeout_ms = value.GetAs<int>("socket_timeout_ms")) {
        config.socket_timeout = std::chrono::milliseconds(*socket_timeout_ms);
    }

    if (auto endpoints = value.Get("endpoints"); endpoints.has_value() && endpoints->IsArray()) {
        for (std::size_t i = 0; i < endpoints->Size(); ++i) {
            auto entry = endpoints->Get(i);
            if (entry.has_value() && entry->IsObject()) {
                config.endpoints.push_back(ReadEndpoint(*entry));
            }
        }
    }

    if (config.endpoints.empty()) {
        config.endpoints.push_back(ReadEndpoint(value));
    }
    return config;
}

}  // namespace flakeid::database::redis
