#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

#include "almanac/calendars/calendar_system.h"
#include "almanac/month_table.h"

namespace almanac {
    // Reigns that overlap the supported years, plus the Yellow Emperor count.
    enum class ChineseEra {
        QingGuangxu,
        QingXuantong,
        YellowEmperor
    };

    std::string_view ChineseEraName(ChineseEra era) noexcept;

    // Chinese lunisolar calendar counted in sexagesimal cycles since 2637 BC.
    // Dates carry the elapsed cyclic year: year = (cycle - 1) * 60 + yearOfCycle.
    class ChineseCalendar final : public CalendarSystem {
    public:
        static constexpr int kEraCyclic = 0;
        static constexpr int kCycleYears = 60;
        // Cyclic year 1 is related Gregorian year -2636.
        static constexpr int kRelatedYearOffset = 2637;
        static constexpr int kFirstRelatedYear = 1900;
        static constexpr int kLastRelatedYear = 2099;
        // 1929-01-01 switched the day boundary from Beijing mean time to UTC+8.
        static constexpr EpochDay kStandardTimeSwitch = -14975;
        static constexpr int kBeijingMeanOffsetSeconds = 7 * 3600 + 45 * 60 + 40;
        static constexpr int kStandardOffsetSeconds = 8 * 3600;

        static StatusCode Create(std::unique_ptr<CalendarSystem> &outCalendar);

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
        StatusCode MonthAt(int era, int year, int ordinal, MonthSpec &outMonth) const override;
        int MonthOrdinal(int era, int year, MonthSpec month) const override;

        // Leap month number of the year, 0 when it has none or is unsupported.
        int GetLeapMonth(int cycle, int yearOfCycle) const noexcept;

        // Year within era, OutOfRange when the date lies outside a reign.
        StatusCode YearOfEra(const CalendarDate &date, ChineseEra era, int &outYear) const;

        const MonthTable &Table() const noexcept;

        static int CycleOf(int year) noexcept;
        static int YearOfCycle(int year) noexcept;
        static int ToCyclicYear(int cycle, int yearOfCycle) noexcept;
        static int RelatedGregorianYear(int year) noexcept;

        // Heavenly stem (1..10) and earthly branch (1..12) naming a year of the cycle.
        static void SexagesimalName(int yearOfCycle, int &outStem, int &outBranch) noexcept;

        // Date of a UTC instant on the Chinese civil day boundary: Beijing mean
        // time before kStandardTimeSwitch, UTC+8 from then on.
        StatusCode FromUtcSeconds(std::int64_t utcSeconds, CalendarDate &outDate) const;

    private:
        explicit ChineseCalendar(MonthTable table);

        MonthTable m_Table;
    };
}
