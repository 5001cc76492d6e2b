#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "almanac/calendar_date.h"
#include "almanac/epoch.h"
#include "almanac/status.h"

namespace almanac {
    // Month lengths and start days of a table-driven calendar, indexed by a
    // flattened (year, month ordinal) position.
    class MonthTable {
    public:
        struct YearRow {
            int year;
            int leapMonth;
            std::vector<int> lengths;
        };

        MonthTable();

        // Parses the key/value resource format. The declared type must equal variant.
        static StatusCode Parse(std::string_view text, std::string_view variant, MonthTable &outTable);
        static StatusCode Load(const std::string &path, std::string_view variant, MonthTable &outTable);
        static StatusCode Build(std::string_view variant,
                                std::string_view version,
                                EpochDay firstDay,
                                const std::vector<YearRow> &rows,
                                MonthTable &outTable);

        const std::string &Variant() const noexcept;
        const std::string &Version() const noexcept;
        int MinYear() const noexcept;
        int MaxYear() const noexcept;
        EpochDay FirstDay() const noexcept;
        EpochDay LastDay() const noexcept;
        bool Empty() const noexcept;

        // Largest index whose start is not after day.
        std::size_t Search(EpochDay day) const noexcept;

        StatusCode Locate(EpochDay day, int &outYear, MonthSpec &outMonth, int &outDay) const;
        StatusCode StartOf(int year, MonthSpec month, EpochDay &outDay) const;
        StatusCode LengthOf(int year, MonthSpec month, int &outLength) const;
        StatusCode LengthOfYear(int year, int &outLength) const;
        StatusCode MonthAt(int year, int ordinal, MonthSpec &outMonth) const;

        int LeapMonth(int year) const noexcept;
        int MonthsInYear(int year) const noexcept;
        // 1-based position of month within its year, 0 when the year has no such month.
        int MonthOrdinal(int year, MonthSpec month) const noexcept;

        // Moves the first day of a month by delta days, taking them from the previous month.
        StatusCode ShiftMonthStart(int year, MonthSpec month, int delta);

    private:
        std::string m_Variant;
        std::string m_Version;
        int m_MinYear;
        int m_MaxYear;
        std::vector<int> m_Lengths;
        std::vector<EpochDay> m_Starts;
        std::vector<std::size_t> m_YearOffsets;
        std::vector<int> m_LeapMonths;

        StatusCode IndexOf(int year, MonthSpec month, std::size_t &outIndex) const;
        bool HasYear(int year) const noexcept;
    };
}
