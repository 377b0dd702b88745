#include "database/redis/redis_sequence_resolver.h"

#include <stdexcept>
#include <utility>
#include <vector>

#include "algorithms/snowflake/snowflake_logging.h"

namespace flakeid::database::redis {
namespace {

constexpr const char* kSequenceScript =
    "local value = redis.call('INCR', KEYS[1]) "
    "if value == 1 then redis.call('PEXPIRE', KEYS[1], ARGV[1]) end "
    "return value - 1";

std::int64_t SteadyMilliseconds() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

}  // namespace

RedisSequenceResolver::RedisSequenceResolver(std::shared_ptr<RedisClient> client)
    : RedisSequenceResolver(std::move(client), Options{}) {}

RedisSequenceResolver::RedisSequenceResolver(std::shared_ptr<RedisClient> client,
                                             Options options)
    : client_(std::move(client)), options_(std::move(options)) {
    if (!client_) {
        throw std::invalid_argument("RedisSequenceResolver requires a client");
    }
    available_ = client_->IsConnected() || client_->Connect();
    if (!available_) {
        retry_at_ms_ = SteadyMilliseconds() + options_.retry_interval.count();
        FLAKEID_SNOWFLAKE_LOG_WARN("redis sequence backend unreachable, using local sequences");
    }
}

bool RedisSequenceResolver::IsAvailable() {
    if (available_) {
        return true;
    }
    const auto now = SteadyMilliseconds();
    auto due = retry_at_ms_.load();
    if (now < due) {
        return false;
    }
    // One caller per interval reconnects; the others keep using local sequences meanwhile.
    if (!retry_at_ms_.compare_exchange_strong(due, now + options_.retry_interval.count())) {
        return available_;
    }

    if (!client_->Connect()) {
        return false;
    }
    available_ = true;
    FLAKEID_SNOWFLAKE_LOG_INFO("redis sequence backend reachable again");
    return true;
}

std::int64_t RedisSequenceResolver::Sequence(std::int64_t current_time_ms) {
    const std::vector<std::string> keys{KeyFor(current_time_ms)};
    const std::vector<std::string> args{std::to_string(options_.ttl.count())};

    auto sequence = client_->EvalInteger(kSequenceScript, keys, args);
    if (!sequence.has_value()) {
        MarkUnavailable();
        throw std::runtime_error("redis sequence script failed for " + keys.front());
    }
    return static_cast<std::int64_t>(*sequence);
}

std::string RedisSequenceResolver::KeyFor(std::int64_t current_time_ms) const {
    return options_.key_prefix + ":seq:" + std::to_string(current_time_ms);
}

void RedisSequenceResolver::MarkUnavailable() {
    available_ = false;
    retry_at_ms_ = SteadyMilliseconds() + options_.retry_interval.count();
}

std::shared_ptr<algorithms::SequenceResolver> CreateSequenceResolver(
    const algorithms::SequenceConfig& config) {
    if (config.backend == algorithms::SequenceBackend::kLocal) {
        return nullptr;
    }

    auto redis_config = config.redis ? RedisConfig::FromJson(*config.redis) : std::nullopt;
    if (!redis_config.has_value()) {
        throw std::runtime_error("redis sequence backend requires a 'redis' object");
    }

    RedisSequenceResolver::Options options;
    options.key_prefix = config.key_prefix;
    options.ttl = config.ttl;
    return std::make_shared<RedisSequenceResolver>(
        std::make_shared<RedisClient>(std::move(*redis_config)), std::move(options));
}

}  // namespace flakeid::database::redis
