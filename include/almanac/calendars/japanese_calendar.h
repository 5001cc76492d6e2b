#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "almanac/calendars/calendar_system.h"
#include "almanac/era_resolver.h"
#include "almanac/month_table.h"

namespace almanac {
    // Japanese calendar counted in nengo. Dates before 1873-01-01 follow the
    // lunisolar table, later dates the Gregorian calendar.
    class JapaneseCalendar final : public CalendarSystem {
    public:
        static constexpr int kAnsei = 0;
        static constexpr int kManEn = 1;
        static constexpr int kBunkyu = 2;
        static constexpr int kGenji = 3;
        static constexpr int kKeio = 4;
        static constexpr int kMeiji = 5;
        static constexpr int kTaisho = 6;
        static constexpr int kShowa = 7;
        static constexpr int kHeisei = 8;
        static constexpr int kReiwa = 9;

        static constexpr int kMaxGregorianYear = 9999;
        static constexpr int kMaxLunarMonthLength = 30;
        static constexpr EpochDay kGregorianStart = -35428;
        static constexpr std::string_view kLunisolarVariant = "japanese-lunisolar";

        // Loads "<directory>/japanese-lunisolar.txt".
        static StatusCode Create(const std::string &directory, std::unique_ptr<CalendarSystem> &outCalendar);

        static StatusCode FromTable(MonthTable lunisolar, std::unique_ptr<CalendarSystem> &outCalendar);

        static const std::vector<EraRecord> &NengoRecords();

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
        std::vector<int> Eras() const override;
        // Outside Strict, days 3 to 30 of Meiji 5 month 12 continue into Meiji 6.
        StatusCode ResolveEra(const CalendarDate &date, Leniency leniency, CalendarDate &outDate) const override;
        int LinearYear(int era, int year) const override;
        void SplitLinearYear(int linearYear, int &outEra, int &outYear) const override;

        const EraResolver &Resolver() const noexcept;

        // Gregorian year of the lunisolar or Gregorian year containing day.
        int RelatedYearOf(EpochDay day) const noexcept;

    private:
        JapaneseCalendar(MonthTable lunisolar, EraResolver resolver);

        MonthTable m_Lunisolar;
        EraResolver m_Resolver;
        std::vector<int> m_SupportedEras;

        bool IsLunisolarYear(int relatedYear) const noexcept;
        StatusCode RelatedYear(int era, int year, int &outRelated) const;
        // Epoch day of a day number the cut-short final lunisolar month lacks.
        bool RollsPastLunisolarEnd(const CalendarDate &date, EpochDay &outDay) const;
    };
}
