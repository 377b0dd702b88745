#include "algorithms/snowflake/snowflake_id.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace flakeid::algorithms {
namespace {

constexpr double kMaxExactDouble = 9007199254740992.0;  // 2^53

void RequireWidth(std::uint32_t value, std::uint32_t max, const char* field) {
    if (value > max) {
        throw std::invalid_argument(std::string(field) + " " + std::to_string(value) +
                                    " exceeds " + std::to_string(max));
    }
}

}  // namespace

SnowflakeId::SnowflakeId(SnowflakeValue id, ArithmeticMode mode)
    : id_(id), arithmetic_(&SelectArithmetic(mode)) {}

SnowflakeId SnowflakeId::FromDouble(double id, ArithmeticMode mode) {
    if (!std::isfinite(id) || id < 0.0 || id > kMaxExactDouble || std::trunc(id) != id) {
        throw std::invalid_argument("snowflake id " + std::to_string(id) +
                                    " is not an exactly representable non-negative integer");
    }
    return SnowflakeId(static_cast<SnowflakeValue>(id), mode);
}

SnowflakeValue SnowflakeId::FromFields(std::uint32_t seconds,
                                       std::uint32_t milliseconds,
                                       std::uint32_t server_id,
                                       bool is_cli,
                                       std::uint32_t sequence_id) {
    RequireWidth(seconds, kMaxSeconds, "seconds");
    RequireWidth(milliseconds, kMaxMilliseconds, "milliseconds");
    RequireWidth(server_id, kMaxServerId, "server id");
    RequireWidth(sequence_id, kMaxSequenceId, "sequence id");

    const std::uint32_t lower = (milliseconds << 22) | (server_id << 13) |
                                (static_cast<std::uint32_t>(is_cli ? 1 : 0) << 12) | sequence_id;
    return (static_cast<SnowflakeValue>(seconds) << 32) | lower;
}

bool SnowflakeId::IsCli() const {
    return Decode().is_cli;
}

std::uint32_t SnowflakeId::Seconds() const {
    return Decode().seconds;
}

std::uint32_t SnowflakeId::Milliseconds() const {
    return Decode().milliseconds;
}

double SnowflakeId::CreatedAt() const {
    const auto& fields = Decode();
    return static_cast<double>(fields.seconds + kTimestampOffset) +
           static_cast<double>(fields.milliseconds) / 1000.0;
}

std::uint32_t SnowflakeId::ServerId() const {
    return Decode().server_id;
}

std::uint32_t SnowflakeId::SequenceId() const {
    return Decode().sequence_id;
}

const SnowflakeId::Fields& SnowflakeId::Decode() const {
    if (fields_.has_value()) {
        return *fields_;
    }

    const auto halves = arithmetic_->Split(id_);

    Fields fields;
    // The top bit of the upper half is unused.
    fields.seconds = halves.upper & kMaxSeconds;
    fields.milliseconds = halves.lower >> 22;
    fields.server_id = (halves.lower >> 13) & kMaxServerId;
    fields.is_cli = ((halves.lower >> 12) & 0x1) != 0;
    fields.sequence_id = halves.lower & kMaxSequenceId;

    fields_ = fields;
    return *fields_;
}

}  // namespace flakeid::algorithms
