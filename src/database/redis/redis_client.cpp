#include "database/redis/redis_client.h"

#include <utility>

namespace flakeid::database::redis {

RedisClient::RedisClient(RedisConfig config) : config_(std::move(config)) {}

bool RedisClient::Connect() {
    if (config_.endpoints.empty()) {
        return false;
    }

    const auto pool_options = BuildPoolOptions();
    Connection fresh;

    if (config_.cluster_mode) {
        // Any reachable seed node is enough to discover the slot map.
        for (const auto& endpoint : config_.endpoints) {
            try {
                fresh.cluster = std::make_shared<sw::redis::RedisCluster>(
                    BuildConnectionOptions(endpoint), pool_options);
                break;
            } catch (const sw::redis::Error&) {
                fresh.cluster.reset();
            }
        }
    } else {
        try {
            fresh.redis = std::make_shared<sw::redis::Redis>(
                BuildConnectionOptions(config_.endpoints.front()), pool_options);
            fresh.redis->ping();
        } catch (const sw::redis::Error&) {
            fresh.redis.reset();
        }
    }

    if (!fresh.redis && !fresh.cluster) {
        return false;
    }
    std::lock_guard<std::mutex> lock(connection_mutex_);
    connection_ = std::move(fresh);
    return true;
}

bool RedisClient::IsConnected() const {
    const auto connection = Snapshot();
    return config_.cluster_mode ? connection.cluster != nullptr : connection.redis != nullptr;
}

RedisClient::Connection RedisClient::Snapshot() const {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    return connection_;
}

std::optional<RedisClient::Connection> RedisClient::EnsureConnected() {
    if (IsConnected() || Connect()) {
        return Snapshot();
    }
    return std::nullopt;
}

std::optional<long long> RedisClient::EvalInteger(const std::string& script,
                                                  const std::vector<std::string>& keys,
                                                  const std::vector<std::string>& args) {
    const auto connection = EnsureConnected();
    if (!connection.has_value()) {
        return std::nullopt;
    }
    // The pool reconnects broken sockets on the next command, so errors leave it in place.
    try {
        return Run(*connection, [&](auto& client) {
            return client.template eval<long long>(script, keys.begin(), keys.end(),
                                                   args.begin(), args.end());
        });
    } catch (const sw::redis::Error&) {
        return std::nullopt;
    }
}

sw::redis::ConnectionOptions RedisClient::BuildConnectionOptions(
    const RedisEndpoint& endpoint) const {
    sw::redis::ConnectionOptions options;
    options.host = endpoint.host;
    options.port = endpoint.port;
    options.db = endpoint.db;
    options.socket_timeout = config_.socket_timeout;
    options.connect_timeout = config_.connect_timeout;
    if (endpoint.password.has_value()) {
        options.password = *endpoint.password;
    } else if (config_.password.has_value()) {
        options.password = *config_.password;
    }
    if (config_.username.has_value()) {
        options.user = *config_.username;
    }
    return options;
}

sw::redis::ConnectionPoolOptions RedisClient::BuildPoolOptions() const {
    sw::redis::ConnectionPoolOptions pool;
    pool.size = config_.pool_size;
    pool.wait_timeout = config_.socket_timeout;
    return pool;
}

}  // namespace flakeid::database::redis
