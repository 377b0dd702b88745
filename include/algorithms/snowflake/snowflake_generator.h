#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>

#include "algorithms/snowflake/id_arithmetic.h"
#include "algorithms/snowflake/sequence_resolver.h"
#include "algorithms/snowflake/snowflake_export.h"

namespace flakeid::algorithms {

// 2025-01-01T00:00:00Z
inline constexpr std::int64_t kDefaultStartTimeStamp = 1735689600000LL;

class FLAKEID_SNOWFLAKE_API SnowflakeGenerator {
public:
    // Milliseconds since the Unix epoch.
    using Clock = std::function<std::int64_t()>;

    struct Options {
        ArithmeticMode arithmetic{ArithmeticMode::kAuto};
        std::chrono::microseconds backoff{1};
        // Saturated milliseconds tolerated by one NextId() call; 0 retries forever.
        std::size_t max_backoff_attempts{0};
        // Empty means the system clock.
        Clock clock;
    };

    // Out-of-range datacenter or worker ids are replaced by a random id in [0, 31].
    // A null resolver behaves like a coordinator that is never available.
    SnowflakeGenerator(std::int64_t datacenter_id,
                       std::int64_t worker_id,
                       std::shared_ptr<SequenceResolver> resolver,
                       bool is_cli);
    SnowflakeGenerator(std::int64_t datacenter_id,
                       std::int64_t worker_id,
                       std::shared_ptr<SequenceResolver> resolver,
                       bool is_cli,
                       Options options);

    SnowflakeGenerator(const SnowflakeGenerator&) = delete;
    SnowflakeGenerator& operator=(const SnowflakeGenerator&) = delete;

    // Blocks while the resolver reports the current millisecond as saturated. Throws
    // std::runtime_error once max_backoff_attempts is spent and std::out_of_range when the
    // clock is behind the start timestamp or more than 2^42 - 1 ms past it.
    SnowflakeValue NextId();

    // Throws std::invalid_argument, leaving the previous value in place, when the start
    // time lies in the future or further back than the timestamp field can express.
    SnowflakeGenerator& SetStartTimeStamp(std::int64_t millisecond);
    std::int64_t GetStartTimeStamp() const noexcept;

    std::int64_t GetCurrentMillisecond() const;

    int DatacenterId() const noexcept { return datacenter_id_; }
    int WorkerId() const noexcept { return worker_id_; }
    bool IsCli() const noexcept { return is_cli_; }
    const IdArithmetic& Arithmetic() const noexcept { return arithmetic_; }

    static SnowflakeParts ParseId(SnowflakeValue id);
    static SnowflakeParts ParseId(SnowflakeValue id, ArithmeticMode mode);

private:
    std::int64_t CallResolver(std::int64_t current_time);
    std::int64_t FallbackSequence(std::int64_t current_time);
    std::int64_t RandomSequence();

    const int datacenter_id_;
    const int worker_id_;
    const bool is_cli_;
    const std::shared_ptr<SequenceResolver> resolver_;
    const Options options_;
    const IdArithmetic& arithmetic_;
    std::optional<std::int64_t> start_time_;

    std::mutex fallback_mutex_;
    std::int64_t last_timestamp_{-1};
    std::int64_t sequence_{0};
    std::mt19937_64 rng_;
    std::uint64_t token_counter_{0};
};

}  // namespace flakeid::algorithms
