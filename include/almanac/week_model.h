#pragma once

#include <string_view>

#include "almanac/epoch.h"
#include "almanac/status.h"

namespace almanac {
    struct WeekModel {
        Weekday firstDayOfWeek;
        int minimalDaysInFirstWeek;
        Weekday startOfWeekend;
        Weekday endOfWeekend;

        // Monday, four days, Saturday and Sunday.
        static WeekModel Iso() noexcept;

        // InvalidArgument unless minimalDays is in 1..7.
        static StatusCode Of(Weekday firstDay,
                             int minimalDays,
                             Weekday weekendStart,
                             Weekday weekendEnd,
                             WeekModel &outModel) noexcept;
    };

    bool operator==(const WeekModel &left, const WeekModel &right) noexcept;
    bool operator!=(const WeekModel &left, const WeekModel &right) noexcept;

    // Built-in regional week data keyed by ISO 3166 country code. An empty code
    // selects ISO, an unknown one Monday with one minimal day.
    WeekModel WeekModelForCountry(std::string_view country) noexcept;

    // 1..7 with the model's first day of week as 1.
    int LocalDayOfWeek(const WeekModel &model, Weekday day) noexcept;

    Weekday WeekdayAt(const WeekModel &model, int localDay) noexcept;

    // True when day lies in the weekend, which may wrap around the week end.
    bool IsWeekend(const WeekModel &model, Weekday day) noexcept;

    std::string_view WeekdayName(Weekday day) noexcept;
}
