#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <sw/redis++/redis++.h>

#include "database/redis/redis_config.h"
#include "database/redis/redis_export.h"

namespace flakeid::database::redis {

// Blocking redis-plus-plus client over a single node or a cluster, safe to share between
// threads. Commands return nullopt when the server cannot be reached or rejects the
// command; redis errors never escape.
class RedisClient {
public:
    FLAKEID_REDIS_API explicit RedisClient(RedisConfig config);

    // Builds a fresh connection pool and swaps it in; a failed attempt keeps the current one.
    // Commands already running finish on the pool they started with.
    FLAKEID_REDIS_API bool Connect();
    FLAKEID_REDIS_API bool IsConnected() const;
    FLAKEID_REDIS_API bool IsCluster() const noexcept { return config_.cluster_mode; }

    // Runs a script whose reply is an integer.
    FLAKEID_REDIS_API std::optional<long long> EvalInteger(const std::string& script,
                                                           const std::vector<std::string>& keys,
                                                           const std::vector<std::string>& args);

private:
    struct Connection {
        std::shared_ptr<sw::redis::Redis> redis;
        std::shared_ptr<sw::redis::RedisCluster> cluster;
    };

    Connection Snapshot() const;
    std::optional<Connection> EnsureConnected();

    template <typename Command>
    auto Run(const Connection& connection, Command&& command)
        -> decltype(command(std::declval<sw::redis::Redis&>()));

    sw::redis::ConnectionOptions BuildConnectionOptions(const RedisEndpoint& endpoint) const;
    sw::redis::ConnectionPoolOptions BuildPoolOptions() const;

    const RedisConfig config_;
    mutable std::mutex connection_mutex_;
    Connection connection_;
};

template <typename Command>
auto RedisClient::Run(const Connection& connection, Command&& command)
    -> decltype(command(std::declval<sw::redis::Redis&>())) {
    if (config_.cluster_mode) {
        return command(*connection.cluster);
    }
    return command(*connection.redis);
}

}  // namespace flakeid::database::redis
