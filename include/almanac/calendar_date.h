#pragma once

#include <cstdint>
#include <string>

namespace almanac {
    // Stable type tags, persisted by the codec.
    enum class CalendarFamily : std::uint8_t {
        Coptic = 1,
        Indian = 2,
        HijriTabular = 3,
        HijriAstronomical = 4,
        Chinese = 5,
        Japanese = 6,
        Historic = 7
    };

    struct MonthSpec {
        int number;
        bool leap;

        static constexpr MonthSpec Regular(int number) noexcept {
            return MonthSpec{number, false};
        }

        static constexpr MonthSpec Leap(int number) noexcept {
            return MonthSpec{number, true};
        }
    };

    bool operator==(const MonthSpec &left, const MonthSpec &right) noexcept;
    bool operator!=(const MonthSpec &left, const MonthSpec &right) noexcept;
    // Regular month N < leap month N < month N + 1.
    bool operator<(const MonthSpec &left, const MonthSpec &right) noexcept;

    struct CalendarDate {
        CalendarFamily family;
        std::string variant;
        int era;
        int year;
        MonthSpec month;
        int day;
    };

    bool operator==(const CalendarDate &left, const CalendarDate &right) noexcept;
    bool operator!=(const CalendarDate &left, const CalendarDate &right) noexcept;

    // Lexicographic (era, year, month, day) order of two dates of the same calendar.
    int CompareFields(const CalendarDate &left, const CalendarDate &right) noexcept;

    std::string FormatDate(const CalendarDate &date);
}
