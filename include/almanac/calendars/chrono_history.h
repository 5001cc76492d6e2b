#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "almanac/calendars/new_year.h"
#include "almanac/epoch.h"
#include "almanac/status.h"

namespace almanac {
    enum class CalendarAlgorithm {
        Julian,
        Gregorian,
        // Julian shifted by one day, used in Sweden 1700-03-01 .. 1712-02-30.
        Swedish
    };

    enum class HistoricEra {
        BC = 0,
        AD = 1,
        Hispanic,
        Byzantine,
        AbUrbeCondita
    };

    std::string_view HistoricEraName(HistoricEra era) noexcept;

    // Year of era for a proleptic AD year (0 = 1 BC).
    int YearOfEra(HistoricEra era, int prolepticYear) noexcept;

    struct CutoverEvent {
        EpochDay start;
        CalendarAlgorithm from;
        CalendarAlgorithm to;
        HistoricDay dateAtCutover;
        HistoricDay dateBeforeCutover;
    };

    // Alternative era used for display within a range of days.
    class EraPreference {
    public:
        EraPreference();

        // Parses "<BYZANTINE|AUC|HISPANIC>[@YYYY-MM-DD/YYYY-MM-DD]" with Gregorian bounds.
        static StatusCode Parse(std::string_view text, EraPreference &outPreference);

        HistoricEra PreferredEra(const HistoricDay &date, EpochDay day) const noexcept;

        bool IsDefault() const noexcept;

    private:
        bool m_Active;
        HistoricEra m_Era;
        EpochDay m_Start;
        EpochDay m_End;
    };

    // Sequence of calendar reforms of a region. Dates between the last day of
    // the old calendar and the first day of the new one do not exist.
    class ChronoHistory {
    public:
        // 1582-10-15, the first day of the Gregorian calendar.
        static constexpr EpochDay kEarliestCutover = -141427;
        static constexpr int kMinProlepticYear = -44;
        static constexpr int kMaxProlepticYear = 9999;
        // First year counted by the regular Julian rule when ancient leap years apply.
        static constexpr int kFirstRegularJulianYear = 8;

        ChronoHistory();

        static ChronoHistory ProlepticJulian();
        static ChronoHistory ProlepticGregorian();
        static ChronoHistory FirstGregorianReform();
        static ChronoHistory Sweden();

        // Julian until the day before start, Gregorian from start on.
        static StatusCode OfGregorianReform(EpochDay start, ChronoHistory &outHistory);

        // Base history plus ":ancient-julian", ":new-year=..." and ":era=..." modifiers.
        // The "historic-" prefix is optional.
        static StatusCode Parse(std::string_view text, ChronoHistory &outHistory);

        const std::vector<CutoverEvent> &Events() const noexcept;

        // Start of the last reform; the proleptic histories report their minimum.
        EpochDay GregorianCutover() const noexcept;

        bool IsValid(const HistoricDay &date) const;
        StatusCode ToEpochDay(const HistoricDay &date, EpochDay &outDay) const;
        StatusCode FromEpochDay(EpochDay day, HistoricDay &outDate) const;

        // Largest day number the governing algorithm allows for the month of date.
        int MaximumDayOfMonth(const HistoricDay &date) const;

        EpochDay MinimumEpochDay() const noexcept;
        EpochDay MaximumEpochDay() const noexcept;

        bool HasAncientJulianLeapYears() const noexcept;
        const NewYearStrategy &NewYear() const noexcept;
        const EraPreference &Preference() const noexcept;

        int DisplayedYear(const HistoricDay &date) const noexcept;
        HistoricEra PreferredEra(const HistoricDay &date, EpochDay day) const noexcept;

    private:
        CalendarAlgorithm m_Initial;
        std::vector<CutoverEvent> m_Events;
        bool m_AncientJulian;
        NewYearStrategy m_NewYear;
        EraPreference m_Preference;

        void AddEvent(EpochDay start, CalendarAlgorithm from, CalendarAlgorithm to);

        // False inside a cutover gap.
        bool AlgorithmOf(const HistoricDay &date, CalendarAlgorithm &outAlgorithm) const;

        EpochDay ToEpochDay(CalendarAlgorithm algorithm, const HistoricDay &date) const noexcept;
        HistoricDay FromEpochDay(CalendarAlgorithm algorithm, EpochDay day) const noexcept;
        int MaximumDayOfMonth(CalendarAlgorithm algorithm, int year, int month) const noexcept;
    };
}
