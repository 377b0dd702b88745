#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "datetime/datetime_export.h"

namespace flakeid::datetime {

// Wall clock with an adjustable offset. Parse and Format resolve time zones through the
// IANA database; an empty zone name means the system zone.
class FLAKEID_DATETIME_API DateTime {
public:
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, std::chrono::milliseconds>;

    DateTime() = default;
    explicit DateTime(std::chrono::milliseconds offset);

    TimePoint Now() const;
    std::int64_t NowMilliseconds() const;
    void SetOffset(std::chrono::milliseconds offset) noexcept;
    std::chrono::milliseconds Offset() const noexcept;

    static TimePoint Parse(std::string_view text,
                           std::string_view format,
                           std::string_view timezone);

    static std::string Format(const TimePoint& time_point,
                              std::string_view format,
                              std::string_view timezone);

    static TimePoint FromUnixSeconds(std::int64_t seconds);
    static TimePoint FromUnixMilliseconds(std::int64_t milliseconds);
    static std::int64_t ToUnixSeconds(const TimePoint& time_point);
    static std::int64_t ToUnixMilliseconds(const TimePoint& time_point);

private:
    std::chrono::milliseconds offset_{0};
};

}  // namespace flakeid::datetime
