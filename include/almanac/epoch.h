#pragma once

#include <cstdint>
#include <string_view>

namespace almanac {
    // Days since 1970-01-01.
    using EpochDay = std::int64_t;

    enum class Weekday {
        Monday = 1,
        Tuesday,
        Wednesday,
        Thursday,
        Friday,
        Saturday,
        Sunday
    };

    std::int64_t FloorDiv(std::int64_t value, std::int64_t divisor) noexcept;
    std::int64_t FloorMod(std::int64_t value, std::int64_t divisor) noexcept;

    bool IsGregorianLeap(int year) noexcept;
    bool IsJulianLeap(int year) noexcept;
    int GregorianMonthLength(int year, int month) noexcept;
    int JulianMonthLength(int year, int month) noexcept;

    // Years are proleptic (astronomical) years: 0 is 1 BC.
    EpochDay FromGregorian(int year, int month, int day) noexcept;
    void ToGregorian(EpochDay day, int &year, int &month, int &dayOfMonth) noexcept;
    EpochDay FromJulian(int year, int month, int day) noexcept;
    void ToJulian(EpochDay day, int &year, int &month, int &dayOfMonth) noexcept;

    Weekday DayOfWeek(EpochDay day) noexcept;

    // Strict "YYYY-MM-DD" Gregorian date.
    bool ParseIsoDate(std::string_view text, EpochDay &outDay) noexcept;
}
