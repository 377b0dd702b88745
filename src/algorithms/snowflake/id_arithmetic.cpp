#include "algorithms/snowflake/id_arithmetic.h"

#include <stdexcept>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>

namespace flakeid::algorithms {
namespace {

using BigInt = boost::multiprecision::cpp_int;

constexpr std::size_t kWordBits = 64;
constexpr std::size_t kHalfHexDigits = 8;

void RequireRange(std::int64_t value, std::int64_t max, const char* field) {
    if (value < 0 || value > max) {
        throw std::out_of_range(std::string(field) + " " + std::to_string(value) +
                                " is outside [0, " + std::to_string(max) + "]");
    }
}

void ValidateParts(const SnowflakeParts& parts) {
    RequireRange(parts.timestamp, kMaxTimestampDelta, "timestamp");
    RequireRange(parts.datacenter, kMaxDatacenterId, "datacenter");
    RequireRange(parts.worker_id, kMaxWorkerId, "worker id");
    RequireRange(parts.sequence, kMaxSequence, "sequence");
}

std::string PadLeft(const std::string& digits, std::size_t width, const char* field) {
    if (digits.size() > width) {
        throw std::out_of_range(std::string(field) + " needs " + std::to_string(digits.size()) +
                                " bits, field is " + std::to_string(width));
    }
    return std::string(width - digits.size(), '0') + digits;
}

BigInt ParseDecimal(const std::string& decimal) {
    if (decimal.empty() || decimal.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("not a non-negative decimal integer: '" + decimal + "'");
    }
    return BigInt(decimal);
}

SnowflakeValue ToValue(const BigInt& value) {
    if (value > BigInt(std::numeric_limits<SnowflakeValue>::max())) {
        throw std::overflow_error("packed id exceeds 64 bits: " + value.str());
    }
    return value.convert_to<SnowflakeValue>();
}

std::int64_t BitsToInt(const std::string& bits) {
    return std::stoll(DecimalArithmetic::BinaryToDecimal(bits));
}

}  // namespace

SnowflakeValue NativeArithmetic::Pack(const SnowflakeParts& parts) const {
    ValidateParts(parts);
    return (static_cast<SnowflakeValue>(parts.timestamp) << kTimestampShift) |
           (static_cast<SnowflakeValue>(parts.datacenter) << kDatacenterShift) |
           (static_cast<SnowflakeValue>(parts.worker_id) << kWorkerShift) |
           (static_cast<SnowflakeValue>(parts.is_cli ? 1 : 0) << kCliShift) |
           static_cast<SnowflakeValue>(parts.sequence);
}

SnowflakeParts NativeArithmetic::Unpack(SnowflakeValue id) const {
    SnowflakeParts parts;
    parts.timestamp = static_cast<std::int64_t>(id >> kTimestampShift);
    parts.datacenter = static_cast<int>((id >> kDatacenterShift) & kMaxDatacenterId);
    parts.worker_id = static_cast<int>((id >> kWorkerShift) & kMaxWorkerId);
    parts.is_cli = ((id >> kCliShift) & 0x1) != 0;
    parts.sequence = static_cast<std::int64_t>(id & kMaxSequence);
    return parts;
}

SnowflakeHalves NativeArithmetic::Split(SnowflakeValue id) const {
    return SnowflakeHalves{static_cast<std::uint32_t>(id >> 32),
                           static_cast<std::uint32_t>(id & 0xFFFFFFFFu)};
}

std::string DecimalArithmetic::DecimalToBinary(const std::string& decimal) {
    auto value = ParseDecimal(decimal);
    std::string bits;
    while (value > 0) {
        bits.insert(bits.begin(), (value % 2 == 0) ? '0' : '1');
        value /= 2;
    }
    return bits.empty() ? std::string("0") : bits;
}

std::string DecimalArithmetic::BinaryToDecimal(const std::string& binary) {
    if (binary.empty()) {
        throw std::invalid_argument("empty binary string");
    }
    BigInt value = 0;
    for (const char digit : binary) {
        if (digit != '0' && digit != '1') {
            throw std::invalid_argument("not a binary string: '" + binary + "'");
        }
        value *= 2;
        if (digit == '1') {
            value += 1;
        }
    }
    return value.str();
}

SnowflakeValue DecimalArithmetic::Pack(const SnowflakeParts& parts) const {
    ValidateParts(parts);

    const auto bits =
        PadLeft(DecimalToBinary(std::to_string(parts.timestamp)), kTimestampBits, "timestamp") +
        PadLeft(DecimalToBinary(std::to_string(parts.datacenter)), kDatacenterBits,
                "datacenter") +
        PadLeft(DecimalToBinary(std::to_string(parts.worker_id)), kWorkerBits, "worker id") +
        (parts.is_cli ? "1" : "0") +
        PadLeft(DecimalToBinary(std::to_string(parts.sequence)), kSequenceBits, "sequence");

    return ToValue(ParseDecimal(BinaryToDecimal(bits)));
}

SnowflakeParts DecimalArithmetic::Unpack(SnowflakeValue id) const {
    const auto bits = PadLeft(DecimalToBinary(std::to_string(id)), kWordBits, "id");

    // Fields are sliced from the right; the timestamp takes whatever is left.
    const auto payload_bits = kDatacenterBits + kWorkerBits + kCliBits + kSequenceBits;
    const auto payload = bits.substr(kWordBits - payload_bits);

    SnowflakeParts parts;
    parts.timestamp = BitsToInt(bits.substr(0, kWordBits - payload_bits));
    parts.datacenter = static_cast<int>(BitsToInt(payload.substr(0, kDatacenterBits)));
    parts.worker_id = static_cast<int>(BitsToInt(payload.substr(kDatacenterBits, kWorkerBits)));
    parts.is_cli = payload[kDatacenterBits + kWorkerBits] == '1';
    parts.sequence = BitsToInt(payload.substr(payload_bits - kSequenceBits));
    return parts;
}

SnowflakeHalves DecimalArithmetic::Split(SnowflakeValue id) const {
    const auto value = ParseDecimal(std::to_string(id));
    const auto hex = PadLeft(value.str(0, std::ios_base::hex), 2 * kHalfHexDigits, "id");

    SnowflakeHalves halves;
    halves.upper = static_cast<std::uint32_t>(std::stoul(hex.substr(0, kHalfHexDigits), nullptr, 16));
    halves.lower = static_cast<std::uint32_t>(std::stoul(hex.substr(kHalfHexDigits), nullptr, 16));
    return halves;
}

ArithmeticMode ResolveArithmeticMode(ArithmeticMode mode) noexcept {
    if (mode != ArithmeticMode::kAuto) {
        return mode;
    }
    return kNativeWordHolds64Bits ? ArithmeticMode::kNative : ArithmeticMode::kEmulated;
}

const IdArithmetic& SelectArithmetic(ArithmeticMode mode) {
    static const NativeArithmetic native;
    static const DecimalArithmetic emulated;
    if (ResolveArithmeticMode(mode) == ArithmeticMode::kNative) {
        return native;
    }
    return emulated;
}

}  // namespace flakeid::algorithms
