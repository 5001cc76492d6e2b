#pragma once

#include <array>
#include <memory>
#include <string>
#include <string_view>

#include "almanac/calendars/calendar_system.h"

namespace almanac {
    // In-cycle years with 355 days, sorted ascending.
    struct LeapPattern {
        std::array<int, 11> years;

        bool Contains(int yearOfCycle) const noexcept;
    };

    // Arithmetical Islamic calendar with a 30-year cycle. The variant string is
    // "<base>" or "<base>:<adjustment>" with adjustment in [-3, +3] days.
    class HijriTabularCalendar final : public CalendarSystem {
    public:
        static constexpr int kEraAnnoHegirae = 0;
        static constexpr int kMinYear = 1;
        static constexpr int kMaxYear = 1600;
        static constexpr int kMaxAdjustment = 3;
        static constexpr int kCycleYears = 30;
        static constexpr int kCycleDays = 30 * 354 + 11;
        // Julian 622-07-15 and 622-07-16.
        static constexpr EpochDay kAstronomicalStart = -492149;
        static constexpr EpochDay kCivilStart = -492148;

        static StatusCode Create(std::string_view variant, std::unique_ptr<CalendarSystem> &outCalendar);

        // Splits a variant into its base and day adjustment without building a calendar.
        static StatusCode ParseVariant(std::string_view variant, std::string &outBase, int &outAdjustment);

        static std::string CanonicalVariant(std::string_view base, int adjustment);

        static bool IsKnownBase(std::string_view base) noexcept;

        CalendarFamily Family() const noexcept override;
        std::string_view Variant() const noexcept override;
        std::string_view Summary() const noexcept override;

        StatusCode ToEpochDay(const CalendarDate &date, EpochDay &outDay) const override;
        StatusCode FromEpochDay(EpochDay day, CalendarDate &outDate) const override;
        StatusCode LengthOfMonth(int era, int year, MonthSpec month, int &outLength) const override;
        StatusCode LengthOfYear(int era, int year, int &outLength) const override;
        EpochDay MinimumEpochDay() const noexcept override;
        EpochDay MaximumEpochDay() const noexcept override;
        StatusCode YearRange(int era, int &outMin, int &outMax) const override;

        bool IsLeapYear(int era, int year) const override;

        std::string_view Base() const noexcept;
        int Adjustment() const noexcept;
        EpochDay Epoch() const noexcept;

    private:
        HijriTabularCalendar(std::string base, const LeapPattern &pattern, EpochDay epoch, int adjustment);

        std::string m_Base;
        std::string m_Variant;
        LeapPattern m_Pattern;
        EpochDay m_Epoch;
        int m_Adjustment;

        bool IsLeap(int year) const noexcept;
        // Unadjusted epoch-day of 1 Muharram of year.
        EpochDay StartOf(int year) const noexcept;
    };
}
