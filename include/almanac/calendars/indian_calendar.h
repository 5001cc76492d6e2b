#pragma once

#include "almanac/calendars/calendar_system.h"

namespace almanac {
    // Indian national calendar (Saka era), aligned to the Gregorian leap rule.
    class IndianCalendar final : public CalendarSystem {
    public:
        static constexpr int kEraSaka = 0;
        static constexpr int kMinYear = 1;
        // Ends with Gregorian 999999999-12-31, inside month 10.
        static constexpr int kMaxYear = 999999921;
        static constexpr int kGregorianOffset = 78;

        IndianCalendar();

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
        int MonthsInYear(int era, int year) const override;

    private:
        static EpochDay StartOf(int year) noexcept;
        static int FullMonthLength(int year, int month) noexcept;
    };
}
