#pragma once

#include <cstdint>
#include <optional>

#include "algorithms/snowflake/id_arithmetic.h"
#include "algorithms/snowflake/snowflake_export.h"

namespace flakeid::algorithms {

/**
 * Read-only view of an id in the server layout:
 *
 *   bit 63      unused
 *   bits 32-62  seconds since kTimestampOffset
 *   bits 22-31  milliseconds
 *   bits 13-21  server id
 *   bit 12      cli flag
 *   bits 0-11   sequence id
 *
 * This is not the layout produced by SnowflakeGenerator; use SnowflakeGenerator::ParseId
 * for those ids. Fields are decoded on first access and memoized, so an instance must not
 * be shared between threads before one accessor has been called.
 */
class FLAKEID_SNOWFLAKE_API SnowflakeId {
public:
    // 2025-10-01T00:00:00Z, in seconds.
    static constexpr std::int64_t kTimestampOffset = 1759276800;

    static constexpr std::uint32_t kMaxSeconds = 0x7FFFFFFF;
    static constexpr std::uint32_t kMaxMilliseconds = 0x3FF;
    static constexpr std::uint32_t kMaxServerId = 0x1FF;
    static constexpr std::uint32_t kMaxSequenceId = 0xFFF;

    explicit SnowflakeId(SnowflakeValue id, ArithmeticMode mode = ArithmeticMode::kAuto);

    // Accepts only non-negative integral values no larger than 2^53, the range a double
    // holds exactly. Throws std::invalid_argument otherwise.
    static SnowflakeId FromDouble(double id, ArithmeticMode mode = ArithmeticMode::kAuto);

    // Throws std::invalid_argument when a field exceeds its width.
    static SnowflakeValue FromFields(std::uint32_t seconds,
                                     std::uint32_t milliseconds,
                                     std::uint32_t server_id,
                                     bool is_cli,
                                     std::uint32_t sequence_id);

    SnowflakeValue Numeric() const noexcept { return id_; }

    bool IsCli() const;
    std::uint32_t Seconds() const;
    std::uint32_t Milliseconds() const;
    // Unix timestamp with millisecond resolution.
    double CreatedAt() const;
    std::uint32_t ServerId() const;
    std::uint32_t SequenceId() const;

private:
    struct Fields {
        std::uint32_t seconds{0};
        std::uint32_t milliseconds{0};
        std::uint32_t server_id{0};
        bool is_cli{false};
        std::uint32_t sequence_id{0};
    };

    const Fields& Decode() const;

    SnowflakeValue id_;
    const IdArithmetic* arithmetic_;
    mutable std::optional<Fields> fields_;
};

}  // namespace flakeid::algorithms
