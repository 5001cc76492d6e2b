#pragma once

#include "almanac/calendars/calendar_system.h"

namespace almanac {
    // Coptic calendar counted from the Diocletian era (Anno Martyrum).
    class CopticCalendar final : public CalendarSystem {
    public:
        static constexpr int kEraAnnoMartyrum = 0;
        static constexpr int kMinYear = 1;
        static constexpr int kMaxYear = 9999;
        // Julian 284-08-29, 1 Thout 1 AM.
        static constexpr EpochDay kEpochDay = -615558;

        CopticCalendar();

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
    };
}
