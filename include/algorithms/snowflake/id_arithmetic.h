#pragma once

#include <cstdint>
#include <limits>
#include <string>

#include "algorithms/snowflake/snowflake_export.h"

namespace flakeid::algorithms {

using SnowflakeValue = std::uint64_t;

// Generator layout, most significant first:
//   elapsed ms (42) | datacenter (5) | worker (5) | cli (1) | sequence (10)
inline constexpr unsigned kTimestampBits = 42;
inline constexpr unsigned kDatacenterBits = 5;
inline constexpr unsigned kWorkerBits = 5;
inline constexpr unsigned kCliBits = 1;
inline constexpr unsigned kSequenceBits = 10;

inline constexpr std::int64_t kMaxTimestampDelta = (std::int64_t{1} << kTimestampBits) - 1;
inline constexpr int kMaxDatacenterId = (1 << kDatacenterBits) - 1;
inline constexpr int kMaxWorkerId = (1 << kWorkerBits) - 1;
inline constexpr std::int64_t kMaxSequence = (1 << kSequenceBits) - 1;

inline constexpr unsigned kCliShift = kSequenceBits;
inline constexpr unsigned kWorkerShift = kCliShift + kCliBits;
inline constexpr unsigned kDatacenterShift = kWorkerShift + kWorkerBits;
inline constexpr unsigned kTimestampShift = kDatacenterShift + kDatacenterBits;

// True when the platform word can hold a packed id without emulation.
inline constexpr bool kNativeWordHolds64Bits =
    std::numeric_limits<std::uintptr_t>::digits >= 64;

enum class ArithmeticMode {
    kAuto,
    kNative,
    kEmulated
};

struct SnowflakeParts {
    std::int64_t timestamp{0};
    int datacenter{0};
    int worker_id{0};
    bool is_cli{false};
    std::int64_t sequence{0};
};

struct SnowflakeHalves {
    std::uint32_t upper{0};
    std::uint32_t lower{0};
};

// Strategy for composing and splitting ids. Both implementations produce identical
// results; they differ only in the width of arithmetic they rely on.
class FLAKEID_SNOWFLAKE_API IdArithmetic {
public:
    virtual ~IdArithmetic() = default;

    // Throws std::out_of_range when a field does not fit its bit width.
    virtual SnowflakeValue Pack(const SnowflakeParts& parts) const = 0;
    virtual SnowflakeParts Unpack(SnowflakeValue id) const = 0;
    virtual SnowflakeHalves Split(SnowflakeValue id) const = 0;
    virtual const char* Name() const noexcept = 0;
};

// Shift-and-mask on a native 64-bit word.
class FLAKEID_SNOWFLAKE_API NativeArithmetic final : public IdArithmetic {
public:
    SnowflakeValue Pack(const SnowflakeParts& parts) const override;
    SnowflakeParts Unpack(SnowflakeValue id) const override;
    SnowflakeHalves Split(SnowflakeValue id) const override;
    const char* Name() const noexcept override { return "native"; }
};

// Digit-string composition over arbitrary-precision decimal values, for targets whose
// native word is 32 bits wide.
class FLAKEID_SNOWFLAKE_API DecimalArithmetic final : public IdArithmetic {
public:
    SnowflakeValue Pack(const SnowflakeParts& parts) const override;
    SnowflakeParts Unpack(SnowflakeValue id) const override;
    SnowflakeHalves Split(SnowflakeValue id) const override;
    const char* Name() const noexcept override { return "emulated"; }

    // Binary digits of a non-negative decimal integer, "0" for zero.
    static std::string DecimalToBinary(const std::string& decimal);
    // Decimal rendering of a string of '0'/'1' digits.
    static std::string BinaryToDecimal(const std::string& binary);
};

FLAKEID_SNOWFLAKE_API ArithmeticMode ResolveArithmeticMode(ArithmeticMode mode) noexcept;
FLAKEID_SNOWFLAKE_API const IdArithmetic& SelectArithmetic(ArithmeticMode mode);

}  // namespace flakeid::algorithms
