#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "almanac/calendars/calendar_system.h"
#include "almanac/calendars/chrono_history.h"

namespace almanac {
    // European calendar with Julian to Gregorian reforms. Dates carry BC/AD eras
    // and year numbers that always start on January 1.
    class HistoricCalendar final : public CalendarSystem {
    public:
        static constexpr int kEraBC = static_cast<int>(HistoricEra::BC);
        static constexpr int kEraAD = static_cast<int>(HistoricEra::AD);
        static constexpr std::string_view kVariantPrefix = "historic-";

        // Accepts any variant understood by ChronoHistory::Parse.
        static StatusCode Create(std::string_view variant, std::unique_ptr<CalendarSystem> &outCalendar);

        static bool IsHistoricVariant(std::string_view variant) noexcept;

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

        bool IsValid(const CalendarDate &date) const override;
        bool IsLeapYear(int era, int year) const override;
        StatusCode MaximumDayOfMonth(int era, int year, MonthSpec month, int &outDay) const override;
        std::vector<int> Eras() const override;
        StatusCode ResolveEra(const CalendarDate &date, Leniency leniency, CalendarDate &outDate) const override;
        int LinearYear(int era, int year) const override;
        void SplitLinearYear(int linearYear, int &outEra, int &outYear) const override;

        const ChronoHistory &History() const noexcept;

        // Year number under the configured new-year strategy, e.g. 1751 for
        // 1752-03-24 in England.
        StatusCode DisplayedYear(const CalendarDate &date, int &outYear) const;

        StatusCode PreferredEra(const CalendarDate &date, HistoricEra &outEra) const;

        // OutOfRange when date lies before year 1 of era.
        StatusCode YearOfEra(const CalendarDate &date, HistoricEra era, int &outYear) const;

    private:
        HistoricCalendar(std::string variant, ChronoHistory history);

        std::string m_Variant;
        ChronoHistory m_History;

        StatusCode ToHistoricDay(const CalendarDate &date, HistoricDay &outDay) const;
    };
}
