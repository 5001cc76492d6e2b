#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "almanac/calendar_date.h"
#include "almanac/config.h"
#include "almanac/epoch.h"
#include "almanac/field_rule.h"
#include "almanac/status.h"

namespace almanac {
    // One implementation per calendar family. Instances are immutable once
    // constructed and shared between threads.
    class CalendarSystem {
    public:
        virtual ~CalendarSystem();

        CalendarSystem(const CalendarSystem &) = delete;
        CalendarSystem &operator=(const CalendarSystem &) = delete;

        virtual CalendarFamily Family() const noexcept = 0;

        virtual std::string_view Variant() const noexcept = 0;

        virtual std::string_view Summary() const noexcept {
            return {};
        }

        virtual StatusCode ToEpochDay(const CalendarDate &date, EpochDay &outDay) const = 0;

        virtual StatusCode FromEpochDay(EpochDay day, CalendarDate &outDate) const = 0;

        virtual StatusCode LengthOfMonth(int era, int year, MonthSpec month, int &outLength) const = 0;

        virtual StatusCode LengthOfYear(int era, int year, int &outLength) const = 0;

        virtual EpochDay MinimumEpochDay() const noexcept = 0;

        virtual EpochDay MaximumEpochDay() const noexcept = 0;

        virtual StatusCode YearRange(int era, int &outMin, int &outMax) const = 0;

        virtual bool IsValid(const CalendarDate &date) const;

        virtual bool IsLeapYear(int era, int year) const;

        virtual int MonthsInYear(int era, int year) const;

        virtual StatusCode MonthAt(int era, int year, int ordinal, MonthSpec &outMonth) const;

        // 1-based position of month in the year, 0 when the year has no such month.
        virtual int MonthOrdinal(int era, int year, MonthSpec month) const;

        // Largest day number a month can carry; differs from its length only
        // when days were dropped (calendar reform gaps).
        virtual StatusCode MaximumDayOfMonth(int era, int year, MonthSpec month, int &outDay) const;

        virtual std::vector<int> Eras() const;

        virtual StatusCode ResolveEra(const CalendarDate &date, Leniency leniency, CalendarDate &outDate) const;

        // Continuous year numbering across eras, used by year and month arithmetic.
        virtual int LinearYear(int era, int year) const;

        virtual void SplitLinearYear(int linearYear, int &outEra, int &outYear) const;

        CalendarDate MakeDate(int era, int year, MonthSpec month, int day) const;

        // First existing day of the year, which a reform gap may push past day 1.
        StatusCode StartOfYear(int era, int year, EpochDay &outDay) const;

        StatusCode DayOfYear(const CalendarDate &date, int &outDay) const;

        StatusCode PlusDays(const CalendarDate &date, std::int64_t days, CalendarDate &outDate) const;

        StatusCode PlusMonths(const CalendarDate &date, std::int64_t months, CalendarDate &outDate) const;

        StatusCode PlusYears(const CalendarDate &date, std::int64_t years, CalendarDate &outDate) const;

        // Moves date into (era, year) keeping the month number and clamping the day.
        StatusCode WithYear(const CalendarDate &date, int era, int year, CalendarDate &outDate) const;

        // Keeps era and year, clamping the day to the month's maximum.
        StatusCode WithMonth(const CalendarDate &date, MonthSpec month, CalendarDate &outDate) const;

        const FieldRuleSet &Rules() const noexcept;

        // First failure met while registering field rules; a system that is not
        // Ok must not be handed out.
        StatusCode RuleStatus() const noexcept;

    protected:
        CalendarSystem();

        // Failures are kept in RuleStatus(); later rules are skipped once one fails.
        void RegisterRule(std::unique_ptr<FieldRuleBase> rule);

        bool Matches(const CalendarDate &date) const noexcept;

        // InvalidArgument for a foreign date, OutOfRange for an unsupported year,
        // InvalidDate for a month or day the year does not have.
        StatusCode CheckFields(const CalendarDate &date) const;

    private:
        FieldRuleSet m_Rules;
        StatusCode m_RuleStatus;

        StatusCode Canonicalize(const CalendarDate &date, CalendarDate &outDate) const;
    };

    using CalendarSystemPtr = std::shared_ptr<const CalendarSystem>;
}
