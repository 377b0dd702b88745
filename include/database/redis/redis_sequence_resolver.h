#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "algorithms/snowflake/sequence_resolver.h"
#include "algorithms/snowflake/snowflake_config.h"
#include "database/redis/redis_client.h"
#include "database/redis/redis_export.h"

namespace flakeid::database::redis {

// Shares per-millisecond sequence numbers through Redis. Each millisecond owns the counter
// "<key_prefix>:seq:<ms>", created on first use with a short expiry; the first caller in a
// millisecond receives 0.
class FLAKEID_REDIS_API RedisSequenceResolver final : public algorithms::SequenceResolver {
public:
    struct Options {
        std::string key_prefix{"snowflakes"};
        std::chrono::milliseconds ttl{std::chrono::milliseconds(1000)};
        // How long to wait before trying a lost server again.
        std::chrono::milliseconds retry_interval{std::chrono::milliseconds(5000)};
    };

    explicit RedisSequenceResolver(std::shared_ptr<RedisClient> client);
    RedisSequenceResolver(std::shared_ptr<RedisClient> client, Options options);

    bool IsAvailable() override;

    // Throws std::runtime_error and marks the resolver unavailable when the script fails.
    std::int64_t Sequence(std::int64_t current_time_ms) override;

    std::string KeyFor(std::int64_t current_time_ms) const;

private:
    void MarkUnavailable();

    std::shared_ptr<RedisClient> client_;
    Options options_;
    std::atomic<bool> available_{false};
    std::atomic<std::int64_t> retry_at_ms_{0};
};

// Builds the resolver a SequenceConfig asks for: nullptr for the local backend, a
// RedisSequenceResolver otherwise. Throws std::runtime_error on an invalid redis section.
FLAKEID_REDIS_API std::shared_ptr<algorithms::SequenceResolver> CreateSequenceResolver(
    const algorithms::SequenceConfig& config);

}  // namespace flakeid::database::redis
