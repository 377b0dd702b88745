#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "algorithms/snowflake/snowflake_config.h"
#include "json/json_reader.h"

namespace {

using flakeid::algorithms::ArithmeticMode;
using flakeid::algorithms::CreateSnowflakeGenerator;
using flakeid::algorithms::kDefaultStartTimeStamp;
using flakeid::algorithms::LoadSnowflakeConfigFromJson;
using flakeid::algorithms::ParseArithmeticMode;
using flakeid::algorithms::SequenceBackend;
using flakeid::algorithms::SnowflakeGenerator;

flakeid::json::JsonValue Parse(const std::string& text) {
    flakeid::json::JsonReader reader;
    auto value = reader.ParseString(text);
    if (!value.has_value()) {
        throw std::runtime_error("test fixture is not valid JSON");
    }
    return *value;
}

TEST(SnowflakeConfigTest, DefaultsWhenSectionIsEmpty) {
    const auto config = LoadSnowflakeConfigFromJson(Parse(R"({"snowflake": {}})"));
    EXPECT_EQ(config.datacenter_id, -1);
    EXPECT_EQ(config.worker_id, -1);
    EXPECT_FALSE(config.is_cli);
    EXPECT_FALSE(config.start_timestamp_ms.has_value());
    EXPECT_EQ(config.arithmetic, ArithmeticMode::kAuto);
    EXPECT_EQ(config.backoff, std::chrono::microseconds(1));
    EXPECT_EQ(config.max_backoff_attempts, 0u);
    EXPECT_EQ(config.sequence.backend, SequenceBackend::kLocal);
    EXPECT_EQ(config.sequence.key_prefix, "snowflakes");
    EXPECT_EQ(config.sequence.ttl, std::chrono::milliseconds(1000));
}

TEST(SnowflakeConfigTest, ReadsAllFields) {
    const auto config = LoadSnowflakeConfigFromJson(Parse(R"({
        // node identity
        "snowflake": {
            "datacenter_id": 4,
            "worker_id": 9,
            "is_cli": true,
            "start_timestamp_ms": 1735689600000,
            "arithmetic": "32bit",
            "backoff_us": 50,
            "max_backoff_attempts": 200,
            "sequence": {
                "backend": "Redis",
                "key_prefix": "ids",
                "ttl_ms": 250,
                "redis": {"host": "127.0.0.1", "port": 6379}
            }
        }
    })"));

    EXPECT_EQ(config.datacenter_id, 4);
    EXPECT_EQ(config.worker_id, 9);
    EXPECT_TRUE(config.is_cli);
    ASSERT_TRUE(config.start_timestamp_ms.has_value());
    EXPECT_EQ(*config.start_timestamp_ms, 1735689600000LL);
    EXPECT_EQ(config.arithmetic, ArithmeticMode::kEmulated);
    EXPECT_EQ(config.backoff, std::chrono::microseconds(50));
    EXPECT_EQ(config.max_backoff_attempts, 200u);
    EXPECT_EQ(config.sequence.backend, SequenceBackend::kRedis);
    EXPECT_EQ(config.sequence.key_prefix, "ids");
    EXPECT_EQ(config.sequence.ttl, std::chrono::milliseconds(250));
    ASSERT_TRUE(config.sequence.redis.has_value());
    EXPECT_EQ(config.sequence.redis->GetAs<int>("port"), 6379);
}

TEST(SnowflakeConfigTest, RootIsUsedWithoutSnowflakeSection) {
    const auto config = LoadSnowflakeConfigFromJson(Parse(R"({"datacenter_id": 2})"));
    EXPECT_EQ(config.datacenter_id, 2);
}

TEST(SnowflakeConfigTest, StartDateIsParsedInTimezone) {
    const auto utc = LoadSnowflakeConfigFromJson(
        Parse(R"({"start_date": "2025-01-01 00:00:00"})"));
    ASSERT_TRUE(utc.start_timestamp_ms.has_value());
    EXPECT_EQ(*utc.start_timestamp_ms, kDefaultStartTimeStamp);

    const auto tokyo = LoadSnowflakeConfigFromJson(
        Parse(R"({"start_date": "2025-01-01 09:00:00", "timezone": "Asia/Tokyo"})"));
    ASSERT_TRUE(tokyo.start_timestamp_ms.has_value());
    EXPECT_EQ(*tokyo.start_timestamp_ms, kDefaultStartTimeStamp);
}

TEST(SnowflakeConfigTest, RejectsMalformedValues) {
    const char* invalid[] = {
        R"({"datacenter_id": "four"})",
        R"({"datacenter_id": 3.9})",
        R"({"worker_id": 18446744073709551615})",
        R"({"start_timestamp_ms": 1735689600000.5})",
        R"({"is_cli": 1})",
        R"({"start_timestamp_ms": 1735689600000, "start_date": "2025-01-01 00:00:00"})",
        R"({"start_date": "first of january"})",
        R"({"arithmetic": "128bit"})",
        R"({"backoff_us": -1})",
        R"({"backoff_us": 1.5})",
        R"({"max_backoff_attempts": -3})",
        R"({"max_backoff_attempts": 2.5})",
        R"({"sequence": {"ttl_ms": 0}})",
        R"({"sequence": {"ttl_ms": 10.5}})",
        R"({"sequence": {"backend": "memcached"}})",
        R"({"sequence": {"backend": "redis"}})",
        R"({"sequence": []})",
        R"({"snowflake": 5})",
    };
    for (const auto* text : invalid) {
        SCOPED_TRACE(text);
        EXPECT_THROW(LoadSnowflakeConfigFromJson(Parse(text)), std::runtime_error);
    }
}

TEST(SnowflakeConfigTest, WideNodeIdsAreRepairedNotTruncated) {
    // 2^32 + 1 would become 1 if narrowed to 32 bits.
    const auto config = LoadSnowflakeConfigFromJson(
        Parse(R"({"datacenter_id": 4294967297, "worker_id": -4294967295})"));
    EXPECT_EQ(config.datacenter_id, 4294967297LL);
    EXPECT_EQ(config.worker_id, -4294967295LL);

    for (int i = 0; i < 20; ++i) {
        const auto generator = CreateSnowflakeGenerator(config, nullptr);
        EXPECT_GE(generator->DatacenterId(), 0);
        EXPECT_LE(generator->DatacenterId(), flakeid::algorithms::kMaxDatacenterId);
        EXPECT_GE(generator->WorkerId(), 0);
        EXPECT_LE(generator->WorkerId(), flakeid::algorithms::kMaxWorkerId);
    }
}

TEST(SnowflakeConfigTest, DefaultsApplyOnlyToAbsentFields) {
    flakeid::algorithms::SnowflakeConfig defaults;
    defaults.is_cli = true;
    defaults.worker_id = 9;
    defaults.start_timestamp_ms = kDefaultStartTimeStamp + 1;

    // Root-level settings count the same as a "snowflake" section.
    const auto root_level = LoadSnowflakeConfigFromJson(Parse(R"({"is_cli": false})"), defaults);
    EXPECT_FALSE(root_level.is_cli);
    EXPECT_EQ(root_level.worker_id, 9);
    EXPECT_EQ(root_level.start_timestamp_ms, kDefaultStartTimeStamp + 1);

    const auto sectioned =
        LoadSnowflakeConfigFromJson(Parse(R"({"snowflake": {"is_cli": false}})"), defaults);
    EXPECT_FALSE(sectioned.is_cli);

    const auto absent = LoadSnowflakeConfigFromJson(Parse(R"({"snowflake": {}})"), defaults);
    EXPECT_TRUE(absent.is_cli);
    EXPECT_EQ(absent.datacenter_id, -1);
}

TEST(SnowflakeConfigTest, ArithmeticModeNames) {
    EXPECT_EQ(ParseArithmeticMode("auto"), ArithmeticMode::kAuto);
    EXPECT_EQ(ParseArithmeticMode("NATIVE"), ArithmeticMode::kNative);
    EXPECT_EQ(ParseArithmeticMode("64bit"), ArithmeticMode::kNative);
    EXPECT_EQ(ParseArithmeticMode("emulated"), ArithmeticMode::kEmulated);
    EXPECT_THROW(ParseArithmeticMode("decimal"), std::runtime_error);
}

TEST(SnowflakeConfigTest, CreateSnowflakeGeneratorAppliesConfig) {
    const auto config = LoadSnowflakeConfigFromJson(Parse(R"({
        "datacenter_id": 6,
        "worker_id": 7,
        "is_cli": true,
        "start_date": "2025-06-01 00:00:00",
        "arithmetic": "emulated"
    })"));

    const std::int64_t start = 1748736000000LL;
    auto generator = CreateSnowflakeGenerator(config, nullptr, [start] { return start + 10; });

    EXPECT_EQ(generator->DatacenterId(), 6);
    EXPECT_EQ(generator->WorkerId(), 7);
    EXPECT_TRUE(generator->IsCli());
    EXPECT_EQ(generator->GetStartTimeStamp(), start);

    const auto parts = SnowflakeGenerator::ParseId(generator->NextId());
    EXPECT_EQ(parts.timestamp, 10);
    EXPECT_EQ(parts.datacenter, 6);
    EXPECT_EQ(parts.worker_id, 7);
}

TEST(SnowflakeConfigTest, CreateSnowflakeGeneratorRejectsFutureStart) {
    const auto config =
        LoadSnowflakeConfigFromJson(Parse(R"({"start_timestamp_ms": 1748736000000})"));
    EXPECT_THROW(CreateSnowflakeGenerator(config, nullptr, [] { return kDefaultStartTimeStamp; }),
                 std::invalid_argument);
}

}  // namespace
