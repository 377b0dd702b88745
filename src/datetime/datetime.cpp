#include "datetime/datetime.h"

#include <sstream>
#include <stdexcept>
#include <string>

#include <date/date.h>
#include <date/tz.h>

namespace flakeid::datetime {
namespace {

constexpr std::string_view kDefaultTimezone{"UTC"};
constexpr std::string_view kDefaultFormat{"%Y-%m-%d %H:%M:%S"};

std::string ResolveTimezone(std::string_view timezone) {
    if (!timezone.empty()) {
        return std::string(timezone);
    }
    try {
        if (const auto* current = date::current_zone()) {
            return current->name();
        }
    } catch (const std::runtime_error&) {
        // No zone database entry for the host; fall through to UTC.
    }
    return std::string(kDefaultTimezone);
}

const date::time_zone* LocateZone(std::string_view timezone) {
    const auto name = ResolveTimezone(timezone);
    try {
        return date::locate_zone(name);
    } catch (const std::runtime_error&) {
        throw std::invalid_argument("unknown time zone: " + name);
    }
}

std::string PrepareFormat(std::string_view format) {
    return format.empty() ? std::string(kDefaultFormat) : std::string(format);
}

}  // namespace

DateTime::DateTime(std::chrono::milliseconds offset) : offset_(offset) {}

DateTime::TimePoint DateTime::Now() const {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now()) + offset_;
}

std::int64_t DateTime::NowMilliseconds() const {
    return ToUnixMilliseconds(Now());
}

void DateTime::SetOffset(std::chrono::milliseconds offset) noexcept {
    offset_ = offset;
}

std::chrono::milliseconds DateTime::Offset() const noexcept {
    return offset_;
}

DateTime::TimePoint DateTime::Parse(std::string_view text,
                                    std::string_view format,
                                    std::string_view timezone) {
    if (text.empty()) {
        throw std::invalid_argument("datetime string is empty");
    }

    const auto* zone = LocateZone(timezone);
    const auto fmt = PrepareFormat(format);

    std::istringstream iss{std::string(text)};
    date::local_time<std::chrono::milliseconds> local_time;
    iss >> date::parse(fmt, local_time);
    if (iss.fail()) {
        throw std::invalid_argument("failed to parse datetime string: " + std::string(text));
    }

    return zone->to_sys(local_time);
}

std::string DateTime::Format(const TimePoint& time_point,
                             std::string_view format,
                             std::string_view timezone) {
    const auto* zone = LocateZone(timezone);
    date::zoned_time<std::chrono::milliseconds> zoned(zone, time_point);
    return date::format(PrepareFormat(format), zoned);
}

DateTime::TimePoint DateTime::FromUnixSeconds(std::int64_t seconds) {
    return TimePoint{std::chrono::seconds(seconds)};
}

DateTime::TimePoint DateTime::FromUnixMilliseconds(std::int64_t milliseconds) {
    return TimePoint{std::chrono::milliseconds(milliseconds)};
}

std::int64_t DateTime::ToUnixSeconds(const TimePoint& time_point) {
    return std::chrono::duration_cast<std::chrono::seconds>(time_point.time_since_epoch())
        .count();
}

std::int64_t DateTime::ToUnixMilliseconds(const TimePoint& time_point) {
    return time_point.time_since_epoch().count();
}

}  // namespace flakeid::datetime
