#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "algorithms/snowflake/id_arithmetic.h"

namespace {

using flakeid::algorithms::ArithmeticMode;
using flakeid::algorithms::DecimalArithmetic;
using flakeid::algorithms::kMaxDatacenterId;
using flakeid::algorithms::kMaxSequence;
using flakeid::algorithms::kMaxTimestampDelta;
using flakeid::algorithms::kMaxWorkerId;
using flakeid::algorithms::NativeArithmetic;
using flakeid::algorithms::SnowflakeParts;

SnowflakeParts Parts(std::int64_t timestamp, int datacenter, int worker, bool cli,
                     std::int64_t sequence) {
    SnowflakeParts parts;
    parts.timestamp = timestamp;
    parts.datacenter = datacenter;
    parts.worker_id = worker;
    parts.is_cli = cli;
    parts.sequence = sequence;
    return parts;
}

void ExpectSameParts(const SnowflakeParts& actual, const SnowflakeParts& expected) {
    EXPECT_EQ(actual.timestamp, expected.timestamp);
    EXPECT_EQ(actual.datacenter, expected.datacenter);
    EXPECT_EQ(actual.worker_id, expected.worker_id);
    EXPECT_EQ(actual.is_cli, expected.is_cli);
    EXPECT_EQ(actual.sequence, expected.sequence);
}

TEST(IdArithmeticTest, NativeAndEmulatedAgree) {
    const NativeArithmetic native;
    const DecimalArithmetic emulated;

    const std::vector<SnowflakeParts> samples{
        Parts(0, 0, 0, false, 0),
        Parts(42, 21, 22, true, 42),
        Parts(1234567, 3, 30, false, 1023),
        Parts(kMaxTimestampDelta, kMaxDatacenterId, kMaxWorkerId, true, kMaxSequence),
    };

    for (const auto& parts : samples) {
        const auto packed = native.Pack(parts);
        EXPECT_EQ(emulated.Pack(parts), packed);
        ExpectSameParts(native.Unpack(packed), parts);
        ExpectSameParts(emulated.Unpack(packed), parts);
    }
}

TEST(IdArithmeticTest, KnownPackedValue) {
    const auto parts = Parts(42, 21, 22, true, 42);
    EXPECT_EQ(NativeArithmetic().Pack(parts), 89502762u);
    EXPECT_EQ(DecimalArithmetic().Pack(parts), 89502762u);
}

TEST(IdArithmeticTest, AllOnesFillsTheWord) {
    const auto parts =
        Parts(kMaxTimestampDelta, kMaxDatacenterId, kMaxWorkerId, true, kMaxSequence);
    EXPECT_EQ(NativeArithmetic().Pack(parts), 0x7FFFFFFFFFFFFFFFull);
}

TEST(IdArithmeticTest, OversizedFieldsAreRejected) {
    const NativeArithmetic native;
    const DecimalArithmetic emulated;

    const std::vector<SnowflakeParts> invalid{
        Parts(kMaxTimestampDelta + 1, 0, 0, false, 0),
        Parts(-1, 0, 0, false, 0),
        Parts(0, kMaxDatacenterId + 1, 0, false, 0),
        Parts(0, 0, kMaxWorkerId + 1, false, 0),
        Parts(0, 0, 0, false, kMaxSequence + 1),
    };
    for (const auto& parts : invalid) {
        EXPECT_THROW(native.Pack(parts), std::out_of_range);
        EXPECT_THROW(emulated.Pack(parts), std::out_of_range);
    }
}

TEST(IdArithmeticTest, DecimalBinaryConversion) {
    EXPECT_EQ(DecimalArithmetic::DecimalToBinary("0"), "0");
    EXPECT_EQ(DecimalArithmetic::DecimalToBinary("10"), "1010");
    EXPECT_EQ(DecimalArithmetic::DecimalToBinary("18446744073709551615"), std::string(64, '1'));

    EXPECT_EQ(DecimalArithmetic::BinaryToDecimal("0000"), "0");
    EXPECT_EQ(DecimalArithmetic::BinaryToDecimal("1010"), "10");
    EXPECT_EQ(DecimalArithmetic::BinaryToDecimal(std::string(64, '1')), "18446744073709551615");

    EXPECT_THROW(DecimalArithmetic::DecimalToBinary("-5"), std::invalid_argument);
    EXPECT_THROW(DecimalArithmetic::DecimalToBinary(""), std::invalid_argument);
    EXPECT_THROW(DecimalArithmetic::BinaryToDecimal("102"), std::invalid_argument);
}

TEST(IdArithmeticTest, SplitReturnsHalves) {
    const NativeArithmetic native;
    const DecimalArithmetic emulated;

    for (const auto id : {0ull, 4095ull, 4688076898113587ull, 0x7FFFFFFF00000000ull,
                          0xFFFFFFFFFFFFFFFFull}) {
        const auto expected_upper = static_cast<std::uint32_t>(id >> 32);
        const auto expected_lower = static_cast<std::uint32_t>(id & 0xFFFFFFFFu);

        const auto fast = native.Split(id);
        const auto slow = emulated.Split(id);
        EXPECT_EQ(fast.upper, expected_upper);
        EXPECT_EQ(fast.lower, expected_lower);
        EXPECT_EQ(slow.upper, expected_upper);
        EXPECT_EQ(slow.lower, expected_lower);
    }
}

TEST(IdArithmeticTest, ModeSelection) {
    using flakeid::algorithms::ResolveArithmeticMode;
    using flakeid::algorithms::SelectArithmetic;

    EXPECT_EQ(ResolveArithmeticMode(ArithmeticMode::kEmulated), ArithmeticMode::kEmulated);
    EXPECT_EQ(ResolveArithmeticMode(ArithmeticMode::kNative), ArithmeticMode::kNative);
    EXPECT_NE(ResolveArithmeticMode(ArithmeticMode::kAuto), ArithmeticMode::kAuto);

    EXPECT_STREQ(SelectArithmetic(ArithmeticMode::kNative).Name(), "native");
    EXPECT_STREQ(SelectArithmetic(ArithmeticMode::kEmulated).Name(), "emulated");
}

}  // namespace
