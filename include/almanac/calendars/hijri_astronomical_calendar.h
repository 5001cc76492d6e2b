#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "almanac/calendars/calendar_system.h"
#include "almanac/month_table.h"

namespace almanac {
    // Islamic calendar whose month lengths come from an observation or
    // computation table, such as Umm al-Qura.
    class HijriAstronomicalCalendar final : public CalendarSystem {
    public:
        static constexpr int kEraAnnoHegirae = 0;

        // Loads "<directory>/<variant>.txt". A missing file is NotFound.
        static StatusCode Create(std::string_view variant,
                                 const std::string &directory,
                                 std::unique_ptr<CalendarSystem> &outCalendar);

        static StatusCode FromTable(MonthTable table, std::unique_ptr<CalendarSystem> &outCalendar);

        static bool IsTableVariant(std::string_view variant) noexcept;

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

        const MonthTable &Table() const noexcept;

    private:
        explicit HijriAstronomicalCalendar(MonthTable table);

        MonthTable m_Table;
    };
}
