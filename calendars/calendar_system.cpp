#include "almanac/calendars/calendar_system.h"

#include <algorithm>
#include <limits>

namespace almanac {
    CalendarSystem::CalendarSystem() : m_Rules(), m_RuleStatus(StatusCode::Ok) {
        m_RuleStatus = InstallStandardRules(*this, m_Rules);
    }

    CalendarSystem::~CalendarSystem() = default;

    bool CalendarSystem::IsValid(const CalendarDate &date) const {
        return CheckFields(date) == StatusCode::Ok;
    }

    bool CalendarSystem::IsLeapYear(int era, int year) const {
        return MonthsInYear(era, year) > 12;
    }

    int CalendarSystem::MonthsInYear(int, int) const {
        return 12;
    }

    StatusCode CalendarSystem::MonthAt(int era, int year, int ordinal, MonthSpec &outMonth) const {
        if (ordinal < 1 || ordinal > MonthsInYear(era, year)) {
            return StatusCode::InvalidDate;
        }
        outMonth = MonthSpec::Regular(ordinal);
        return StatusCode::Ok;
    }

    int CalendarSystem::MonthOrdinal(int era, int year, MonthSpec month) const {
        if (month.leap || month.number < 1 || month.number > MonthsInYear(era, year)) {
            return 0;
        }
        return month.number;
    }

    StatusCode CalendarSystem::MaximumDayOfMonth(int era, int year, MonthSpec month, int &outDay) const {
        return LengthOfMonth(era, year, month, outDay);
    }

    std::vector<int> CalendarSystem::Eras() const {
        return {0};
    }

    StatusCode CalendarSystem::ResolveEra(const CalendarDate &date, Leniency, CalendarDate &outDate) const {
        if (!Matches(date)) {
            return StatusCode::InvalidArgument;
        }
        outDate = date;
        return StatusCode::Ok;
    }

    int CalendarSystem::LinearYear(int, int year) const {
        return year;
    }

    void CalendarSystem::SplitLinearYear(int linearYear, int &outEra, int &outYear) const {
        outEra = Eras().front();
        outYear = linearYear;
    }

    CalendarDate CalendarSystem::MakeDate(int era, int year, MonthSpec month, int day) const {
        return CalendarDate{Family(), std::string(Variant()), era, year, month, day};
    }

    StatusCode CalendarSystem::StartOfYear(int era, int year, EpochDay &outDay) const {
        int minYear = 0;
        int maxYear = 0;
        auto status = YearRange(era, minYear, maxYear);
        if (status != StatusCode::Ok) {
            return status;
        }
        if (year < minYear || year > maxYear) {
            return StatusCode::OutOfRange;
        }
        // A reform gap may swallow the first days of the year.
        for (int ordinal = 1, count = MonthsInYear(era, year); ordinal <= count; ++ordinal) {
            MonthSpec month{};
            status = MonthAt(era, year, ordinal, month);
            if (status != StatusCode::Ok) {
                return status;
            }
            int maximum = 0;
            status = MaximumDayOfMonth(era, year, month, maximum);
            if (status != StatusCode::Ok) {
                return status;
            }
            for (int day = 1; day <= maximum; ++day) {
                auto candidate = MakeDate(era, year, month, day);
                if (IsValid(candidate)) {
                    return ToEpochDay(candidate, outDay);
                }
            }
        }
        return StatusCode::InvalidDate;
    }

    StatusCode CalendarSystem::DayOfYear(const CalendarDate &date, int &outDay) const {
        EpochDay day = 0;
        auto status = ToEpochDay(date, day);
        if (status != StatusCode::Ok) {
            return status;
        }
        EpochDay start = 0;
        status = StartOfYear(date.era, date.year, start);
        if (status != StatusCode::Ok) {
            return status;
        }
        outDay = static_cast<int>(day - start + 1);
        return StatusCode::Ok;
    }

    StatusCode CalendarSystem::PlusDays(const CalendarDate &date, std::int64_t days, CalendarDate &outDate) const {
        EpochDay day = 0;
        auto status = ToEpochDay(date, day);
        if (status != StatusCode::Ok) {
            return status;
        }
        if ((days > 0 && days > MaximumEpochDay() - day) || (days < 0 && days < MinimumEpochDay() - day)) {
            return StatusCode::OutOfRange;
        }
        return FromEpochDay(day + days, outDate);
    }

    StatusCode CalendarSystem::PlusMonths(const CalendarDate &date, std::int64_t months, CalendarDate &outDate) const {
        auto status = CheckFields(date);
        if (status != StatusCode::Ok) {
            return status;
        }
        std::int64_t linear = LinearYear(date.era, date.year);
        std::int64_t ordinal = MonthOrdinal(date.era, date.year, date.month);
        std::int64_t remaining = months;
        int era = date.era;
        int year = date.year;
        // Each step moves across one whole year, so the loop is bounded by the
        // supported year span.
        while (remaining != 0) {
            std::int64_t count = MonthsInYear(era, year);
            if (remaining > 0) {
                if (ordinal + remaining <= count) {
                    ordinal += remaining;
                    break;
                }
                remaining -= count - ordinal + 1;
                ++linear;
                ordinal = 1;
            } else {
                if (ordinal + remaining >= 1) {
                    ordinal += remaining;
                    break;
                }
                remaining += ordinal;
                --linear;
                ordinal = 0;
            }
            if (linear < std::numeric_limits<int>::min() || linear > std::numeric_limits<int>::max()) {
                return StatusCode::OutOfRange;
            }
            SplitLinearYear(static_cast<int>(linear), era, year);
            int minYear = 0;
            int maxYear = 0;
            status = YearRange(era, minYear, maxYear);
            if (status != StatusCode::Ok) {
                return status;
            }
            if (year < minYear || year > maxYear) {
                return StatusCode::OutOfRange;
            }
            if (ordinal == 0) {
                ordinal = MonthsInYear(era, year);
            }
        }
        MonthSpec month{};
        status = MonthAt(era, year, static_cast<int>(ordinal), month);
        if (status != StatusCode::Ok) {
            return StatusCode::OutOfRange;
        }
        int maximum = 0;
        status = MaximumDayOfMonth(era, year, month, maximum);
        if (status != StatusCode::Ok) {
            return status;
        }
        return Canonicalize(MakeDate(era, year, month, std::min(date.day, maximum)), outDate);
    }

    StatusCode CalendarSystem::PlusYears(const CalendarDate &date, std::int64_t years, CalendarDate &outDate) const {
        auto status = CheckFields(date);
        if (status != StatusCode::Ok) {
            return status;
        }
        std::int64_t linear = static_cast<std::int64_t>(LinearYear(date.era, date.year)) + years;
        if (linear < std::numeric_limits<int>::min() || linear > std::numeric_limits<int>::max()) {
            return StatusCode::OutOfRange;
        }
        int era = 0;
        int year = 0;
        SplitLinearYear(static_cast<int>(linear), era, year);
        CalendarDate moved;
        status = WithYear(date, era, year, moved);
        if (status == StatusCode::InvalidDate) {
            return StatusCode::OutOfRange;
        }
        if (status != StatusCode::Ok) {
            return status;
        }
        return Canonicalize(moved, outDate);
    }

    StatusCode CalendarSystem::WithYear(const CalendarDate &date, int era, int year, CalendarDate &outDate) const {
        if (!Matches(date)) {
            return StatusCode::InvalidArgument;
        }
        int minYear = 0;
        int maxYear = 0;
        auto status = YearRange(era, minYear, maxYear);
        if (status != StatusCode::Ok) {
            return status;
        }
        if (year < minYear || year > maxYear) {
            return StatusCode::OutOfRange;
        }
        auto month = date.month;
        if (month.leap && MonthOrdinal(era, year, month) == 0) {
            month.leap = false;
        }
        if (MonthOrdinal(era, year, month) == 0) {
            return StatusCode::InvalidDate;
        }
        int maximum = 0;
        status = MaximumDayOfMonth(era, year, month, maximum);
        if (status != StatusCode::Ok) {
            return status;
        }
        auto candidate = MakeDate(era, year, month, std::min(date.day, maximum));
        EpochDay check = 0;
        status = ToEpochDay(candidate, check);
        if (status != StatusCode::Ok) {
            return status;
        }
        outDate = candidate;
        return StatusCode::Ok;
    }

    StatusCode CalendarSystem::WithMonth(const CalendarDate &date, MonthSpec month, CalendarDate &outDate) const {
        if (!Matches(date)) {
            return StatusCode::InvalidArgument;
        }
        if (MonthOrdinal(date.era, date.year, month) == 0) {
            return StatusCode::InvalidDate;
        }
        int maximum = 0;
        auto status = MaximumDayOfMonth(date.era, date.year, month, maximum);
        if (status != StatusCode::Ok) {
            return status;
        }
        auto candidate = MakeDate(date.era, date.year, month, std::min(date.day, maximum));
        EpochDay check = 0;
        status = ToEpochDay(candidate, check);
        if (status != StatusCode::Ok) {
            return status;
        }
        outDate = candidate;
        return StatusCode::Ok;
    }

    const FieldRuleSet &CalendarSystem::Rules() const noexcept {
        return m_Rules;
    }

    StatusCode CalendarSystem::RuleStatus() const noexcept {
        return m_RuleStatus;
    }

    void CalendarSystem::RegisterRule(std::unique_ptr<FieldRuleBase> rule) {
        if (m_RuleStatus != StatusCode::Ok) {
            return;
        }
        m_RuleStatus = m_Rules.Register(std::move(rule));
    }

    bool CalendarSystem::Matches(const CalendarDate &date) const noexcept {
        return date.family == Family() && date.variant == Variant();
    }

    StatusCode CalendarSystem::CheckFields(const CalendarDate &date) const {
        if (!Matches(date)) {
            return StatusCode::InvalidArgument;
        }
        auto eras = Eras();
        if (std::find(eras.begin(), eras.end(), date.era) == eras.end()) {
            return StatusCode::InvalidDate;
        }
        int minYear = 0;
        int maxYear = 0;
        auto status = YearRange(date.era, minYear, maxYear);
        if (status != StatusCode::Ok) {
            return status;
        }
        if (date.year < minYear || date.year > maxYear) {
            return StatusCode::OutOfRange;
        }
        if (MonthOrdinal(date.era, date.year, date.month) == 0) {
            return StatusCode::InvalidDate;
        }
        int maximum = 0;
        status = MaximumDayOfMonth(date.era, date.year, date.month, maximum);
        if (status != StatusCode::Ok) {
            return status;
        }
        if (date.day < 1 || date.day > maximum) {
            return StatusCode::InvalidDate;
        }
        return StatusCode::Ok;
    }

    StatusCode CalendarSystem::Canonicalize(const CalendarDate &date, CalendarDate &outDate) const {
        EpochDay day = 0;
        auto status = ToEpochDay(date, day);
        if (status != StatusCode::Ok) {
            return status;
        }
        return FromEpochDay(day, outDate);
    }
}
