#pragma once

#include <memory>

#include "almanac/calendars/calendar_system.h"
#include "almanac/field_rule.h"
#include "almanac/week_model.h"

namespace almanac {
    enum class WeekPeriod {
        Year,
        Month
    };

    // Week fields of any seven-day-week calendar under one week model. Calendar
    // weeks may span two periods; bounded weeks never do and may start at 0.
    class WeekFieldEngine {
    public:
        // InvalidArgument without a calendar system.
        static StatusCode Create(CalendarSystemPtr system, WeekModel model, std::unique_ptr<WeekFieldEngine> &outEngine);

        WeekFieldEngine(const WeekFieldEngine &) = delete;
        WeekFieldEngine &operator=(const WeekFieldEngine &) = delete;

        const CalendarSystem &System() const noexcept;
        const WeekModel &Model() const noexcept;

        // LocalDayOfWeek, WeekOfYear, WeekOfMonth, BoundedWeekOfYear and BoundedWeekOfMonth.
        const FieldRuleSet &Rules() const noexcept;

        StatusCode LocalDayOfWeek(const CalendarDate &date, int &outDay) const;
        StatusCode WithLocalDayOfWeek(const CalendarDate &date, int value, bool lenient, CalendarDate &outDate) const;
        StatusCode IsWeekend(const CalendarDate &date, bool &outWeekend) const;

        StatusCode Week(const CalendarDate &date, WeekPeriod period, int &outWeek) const;
        StatusCode MaximumWeek(const CalendarDate &date, WeekPeriod period, int &outWeek) const;
        StatusCode WithWeek(const CalendarDate &date,
                            WeekPeriod period,
                            int value,
                            bool lenient,
                            CalendarDate &outDate) const;

        StatusCode BoundedWeek(const CalendarDate &date, WeekPeriod period, int &outWeek) const;
        StatusCode BoundedWeekRange(const CalendarDate &date, WeekPeriod period, int &outMin, int &outMax) const;
        StatusCode WithBoundedWeek(const CalendarDate &date,
                                   WeekPeriod period,
                                   int value,
                                   bool lenient,
                                   CalendarDate &outDate) const;

    private:
        struct Period {
            EpochDay start;
            EpochDay length;
        };

        // Current period of date, and how far into it day lies.
        struct Position {
            Period current;
            int scaledDay;
            int firstWeekDay;
        };

        WeekFieldEngine(CalendarSystemPtr system, WeekModel model);

        CalendarSystemPtr m_System;
        WeekModel m_Model;
        FieldRuleSet m_Rules;

        StatusCode RegisterRules();

        StatusCode PeriodOf(const CalendarDate &date, WeekPeriod period, EpochDay day, Period &outPeriod) const;
        // OutOfRange when the neighbouring period lies outside the calendar.
        StatusCode PreviousPeriod(const Period &current, WeekPeriod period, Period &outPeriod) const;
        StatusCode NextPeriod(const Period &current, WeekPeriod period, Period &outPeriod) const;
        StatusCode Locate(const CalendarDate &date, WeekPeriod period, Position &outPosition) const;

        // Start of week one on the scale where the period's first day is 1; may be <= 0.
        int FirstWeekAsDay(EpochDay periodStart) const noexcept;
    };
}
