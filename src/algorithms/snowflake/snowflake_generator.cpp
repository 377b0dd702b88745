#include "algorithms/snowflake/snowflake_generator.h"

#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <boost/crc.hpp>

#include "algorithms/snowflake/snowflake_logging.h"
#include "datetime/datetime.h"

namespace flakeid::algorithms {
namespace {

int RandomNodeId(int max_id) {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, max_id);
    return dist(rng);
}

int RepairNodeId(std::int64_t id, int max_id, const char* field) {
    if (id >= 0 && id <= max_id) {
        return static_cast<int>(id);
    }
    const auto replacement = RandomNodeId(max_id);
    FLAKEID_SNOWFLAKE_LOG_WARN("{} {} is outside [0, {}], using random {} instead", field, id,
                               max_id, replacement);
    return replacement;
}

SnowflakeGenerator::Clock SystemClock() {
    return [] { return datetime::DateTime().NowMilliseconds(); };
}

}  // namespace

SnowflakeGenerator::SnowflakeGenerator(std::int64_t datacenter_id,
                                       std::int64_t worker_id,
                                       std::shared_ptr<SequenceResolver> resolver,
                                       bool is_cli)
    : SnowflakeGenerator(datacenter_id, worker_id, std::move(resolver), is_cli, Options{}) {}

SnowflakeGenerator::SnowflakeGenerator(std::int64_t datacenter_id,
                                       std::int64_t worker_id,
                                       std::shared_ptr<SequenceResolver> resolver,
                                       bool is_cli,
                                       Options options)
    : datacenter_id_(RepairNodeId(datacenter_id, kMaxDatacenterId, "datacenter id")),
      worker_id_(RepairNodeId(worker_id, kMaxWorkerId, "worker id")),
      is_cli_(is_cli),
      resolver_(std::move(resolver)),
      options_(std::move(options)),
      arithmetic_(SelectArithmetic(options_.arithmetic)),
      rng_(std::random_device{}()) {
    FLAKEID_SNOWFLAKE_LOG_INFO("snowflake generator datacenter={} worker={} cli={} arithmetic={}",
                               datacenter_id_, worker_id_, is_cli_, arithmetic_.Name());
}

SnowflakeValue SnowflakeGenerator::NextId() {
    auto current_time = GetCurrentMillisecond();

    std::size_t attempts = 0;
    std::int64_t sequence = 0;
    while ((sequence = CallResolver(current_time)) > kMaxSequence) {
        ++attempts;
        if (options_.max_backoff_attempts > 0 && attempts > options_.max_backoff_attempts) {
            FLAKEID_SNOWFLAKE_LOG_ERROR("sequence still saturated after {} attempts at {}",
                                        options_.max_backoff_attempts, current_time);
            throw std::runtime_error("snowflake sequence exhausted after " +
                                     std::to_string(options_.max_backoff_attempts) +
                                     " attempts");
        }
        FLAKEID_SNOWFLAKE_LOG_TRACE("sequence {} saturated at {}, backing off", sequence,
                                    current_time);
        std::this_thread::sleep_for(options_.backoff);
        current_time = GetCurrentMillisecond();
    }

    SnowflakeParts parts;
    parts.timestamp = current_time - GetStartTimeStamp();
    parts.datacenter = datacenter_id_;
    parts.worker_id = worker_id_;
    parts.is_cli = is_cli_;
    parts.sequence = sequence;
    return arithmetic_.Pack(parts);
}

SnowflakeGenerator& SnowflakeGenerator::SetStartTimeStamp(std::int64_t millisecond) {
    const auto miss_time = GetCurrentMillisecond() - millisecond;

    if (miss_time < 0) {
        throw std::invalid_argument("The start time cannot be greater than the current time");
    }

    if (miss_time > kMaxTimestampDelta) {
        throw std::invalid_argument(
            "The current time - start time is not allowed to exceed 2^" +
            std::to_string(kTimestampBits) + " - 1 ms, reset the start time to fix this");
    }

    start_time_ = millisecond;
    return *this;
}

std::int64_t SnowflakeGenerator::GetStartTimeStamp() const noexcept {
    return start_time_.value_or(kDefaultStartTimeStamp);
}

std::int64_t SnowflakeGenerator::GetCurrentMillisecond() const {
    if (options_.clock) {
        return options_.clock();
    }
    static const Clock system_clock = SystemClock();
    return system_clock();
}

SnowflakeParts SnowflakeGenerator::ParseId(SnowflakeValue id) {
    return ParseId(id, ArithmeticMode::kAuto);
}

SnowflakeParts SnowflakeGenerator::ParseId(SnowflakeValue id, ArithmeticMode mode) {
    return SelectArithmetic(mode).Unpack(id);
}

std::int64_t SnowflakeGenerator::CallResolver(std::int64_t current_time) {
    if (resolver_ && resolver_->IsAvailable()) {
        try {
            return resolver_->Sequence(current_time);
        } catch (const std::runtime_error& ex) {
            FLAKEID_SNOWFLAKE_LOG_WARN("sequence resolver failed, using local sequence: {}",
                                       ex.what());
        }
    }
    return FallbackSequence(current_time);
}

std::int64_t SnowflakeGenerator::FallbackSequence(std::int64_t current_time) {
    std::lock_guard<std::mutex> lock(fallback_mutex_);

    if (last_timestamp_ == current_time) {
        return ++sequence_;
    }
    // A later millisecond was already served; restarting this one could repeat its ids.
    if (current_time < last_timestamp_) {
        return kMaxSequence + 1;
    }

    sequence_ = RandomSequence();
    last_timestamp_ = current_time;
    FLAKEID_SNOWFLAKE_LOG_DEBUG("local sequence for {} starts at {}", current_time, sequence_);
    return sequence_;
}

std::int64_t SnowflakeGenerator::RandomSequence() {
    const auto nanos = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto token = std::to_string(rng_()) + "." + std::to_string(nanos) + "." +
                       std::to_string(++token_counter_);

    boost::crc_32_type crc;
    crc.process_bytes(token.data(), token.size());
    return static_cast<std::int64_t>(crc.checksum() % static_cast<std::uint32_t>(kMaxSequence));
}

}  // namespace flakeid::algorithms
