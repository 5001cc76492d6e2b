#include "almanac/week_fields.h"

#include <utility>

namespace almanac {
    namespace {
        class LocalDayOfWeekRule final : public BoundedIntRule {
        public:
            explicit LocalDayOfWeekRule(const WeekFieldEngine &engine) noexcept : m_Engine(engine) {
            }

            FieldId Id() const noexcept override {
                return FieldId::LocalDayOfWeek;
            }

            StatusCode GetValue(const CalendarDate &date, int &outValue) const override {
                return m_Engine.LocalDayOfWeek(date, outValue);
            }

            StatusCode GetMinimum(const CalendarDate &, int &outValue) const override {
                outValue = 1;
                return StatusCode::Ok;
            }

            StatusCode GetMaximum(const CalendarDate &, int &outValue) const override {
                outValue = 7;
                return StatusCode::Ok;
            }

            StatusCode WithValue(const CalendarDate &date, const int &value, bool lenient, CalendarDate &outDate) const override {
                return m_Engine.WithLocalDayOfWeek(date, value, lenient, outDate);
            }

        private:
            const WeekFieldEngine &m_Engine;
        };

        class CalendarWeekRule final : public BoundedIntRule {
        public:
            CalendarWeekRule(const WeekFieldEngine &engine, WeekPeriod period) noexcept
                : m_Engine(engine),
                  m_Period(period) {
            }

            FieldId Id() const noexcept override {
                return m_Period == WeekPeriod::Year ? FieldId::WeekOfYear : FieldId::WeekOfMonth;
            }

            StatusCode GetValue(const CalendarDate &date, int &outValue) const override {
                return m_Engine.Week(date, m_Period, outValue);
            }

            StatusCode GetMinimum(const CalendarDate &, int &outValue) const override {
                outValue = 1;
                return StatusCode::Ok;
            }

            StatusCode GetMaximum(const CalendarDate &date, int &outValue) const override {
                return m_Engine.MaximumWeek(date, m_Period, outValue);
            }

            StatusCode WithValue(const CalendarDate &date, const int &value, bool lenient, CalendarDate &outDate) const override {
                return m_Engine.WithWeek(date, m_Period, value, lenient, outDate);
            }

            FieldId ChildAtFloor(const CalendarDate &) const override {
                return FieldId::LocalDayOfWeek;
            }

        private:
            const WeekFieldEngine &m_Engine;
            WeekPeriod m_Period;
        };

        class BoundedWeekRule final : public BoundedIntRule {
        public:
            BoundedWeekRule(const WeekFieldEngine &engine, WeekPeriod period) noexcept
                : m_Engine(engine),
                  m_Period(period) {
            }

            FieldId Id() const noexcept override {
                return m_Period == WeekPeriod::Year ? FieldId::BoundedWeekOfYear : FieldId::BoundedWeekOfMonth;
            }

            StatusCode GetValue(const CalendarDate &date, int &outValue) const override {
                return m_Engine.BoundedWeek(date, m_Period, outValue);
            }

            StatusCode GetMinimum(const CalendarDate &date, int &outValue) const override {
                int maximum = 0;
                return m_Engine.BoundedWeekRange(date, m_Period, outValue, maximum);
            }

            StatusCode GetMaximum(const CalendarDate &date, int &outValue) const override {
                int minimum = 0;
                return m_Engine.BoundedWeekRange(date, m_Period, minimum, outValue);
            }

            StatusCode WithValue(const CalendarDate &date, const int &value, bool lenient, CalendarDate &outDate) const override {
                return m_Engine.WithBoundedWeek(date, m_Period, value, lenient, outDate);
            }

            FieldId ChildAtFloor(const CalendarDate &) const override {
                return FieldId::LocalDayOfWeek;
            }

        private:
            const WeekFieldEngine &m_Engine;
            WeekPeriod m_Period;
        };
    }

    WeekFieldEngine::WeekFieldEngine(CalendarSystemPtr system, WeekModel model)
        : m_System(std::move(system)),
          m_Model(model),
          m_Rules() {
    }

    StatusCode WeekFieldEngine::Create(CalendarSystemPtr system,
                                       WeekModel model,
                                       std::unique_ptr<WeekFieldEngine> &outEngine) {
        if (!system) {
            return StatusCode::InvalidArgument;
        }
        std::unique_ptr<WeekFieldEngine> engine(new WeekFieldEngine(std::move(system), model));
        auto status = engine->RegisterRules();
        if (status != StatusCode::Ok) {
            return status;
        }
        outEngine = std::move(engine);
        return StatusCode::Ok;
    }

    StatusCode WeekFieldEngine::RegisterRules() {
        std::unique_ptr<FieldRuleBase> rules[] = {
            std::make_unique<LocalDayOfWeekRule>(*this),
            std::make_unique<CalendarWeekRule>(*this, WeekPeriod::Year),
            std::make_unique<CalendarWeekRule>(*this, WeekPeriod::Month),
            std::make_unique<BoundedWeekRule>(*this, WeekPeriod::Year),
            std::make_unique<BoundedWeekRule>(*this, WeekPeriod::Month)
        };
        for (auto &rule: rules) {
            auto status = m_Rules.Register(std::move(rule));
            if (status != StatusCode::Ok) {
                return status;
            }
        }
        return StatusCode::Ok;
    }

    const CalendarSystem &WeekFieldEngine::System() const noexcept {
        return *m_System;
    }

    const WeekModel &WeekFieldEngine::Model() const noexcept {
        return m_Model;
    }

    const FieldRuleSet &WeekFieldEngine::Rules() const noexcept {
        return m_Rules;
    }

    int WeekFieldEngine::FirstWeekAsDay(EpochDay periodStart) const noexcept {
        int dow = almanac::LocalDayOfWeek(m_Model, DayOfWeek(periodStart));
        return dow <= 8 - m_Model.minimalDaysInFirstWeek ? 2 - dow : 9 - dow;
    }

    StatusCode WeekFieldEngine::PeriodOf(const CalendarDate &date,
                                         WeekPeriod period,
                                         EpochDay day,
                                         Period &outPeriod) const {
        if (period == WeekPeriod::Year) {
            int dayOfYear = 0;
            auto status = m_System->DayOfYear(date, dayOfYear);
            if (status != StatusCode::Ok) {
                return status;
            }
            int length = 0;
            status = m_System->LengthOfYear(date.era, date.year, length);
            if (status != StatusCode::Ok) {
                return status;
            }
            outPeriod = Period{day - dayOfYear + 1, length};
            return StatusCode::Ok;
        }
        int length = 0;
        auto status = m_System->LengthOfMonth(date.era, date.year, date.month, length);
        if (status != StatusCode::Ok) {
            return status;
        }
        // The first day number of a month is not always 1 after a calendar reform.
        for (int dayOfMonth = 1; dayOfMonth <= date.day; ++dayOfMonth) {
            EpochDay start = 0;
            status = m_System->ToEpochDay(m_System->MakeDate(date.era, date.year, date.month, dayOfMonth), start);
            if (status == StatusCode::Ok) {
                outPeriod = Period{start, length};
                return StatusCode::Ok;
            }
            if (status != StatusCode::InvalidDate) {
                return status;
            }
        }
        return StatusCode::InternalError;
    }

    StatusCode WeekFieldEngine::PreviousPeriod(const Period &current, WeekPeriod period, Period &outPeriod) const {
        EpochDay day = current.start - 1;
        if (day < m_System->MinimumEpochDay()) {
            return StatusCode::OutOfRange;
        }
        CalendarDate date;
        auto status = m_System->FromEpochDay(day, date);
        if (status != StatusCode::Ok) {
            return status;
        }
        return PeriodOf(date, period, day, outPeriod);
    }

    StatusCode WeekFieldEngine::NextPeriod(const Period &current, WeekPeriod period, Period &outPeriod) const {
        EpochDay day = current.start + current.length;
        if (day > m_System->MaximumEpochDay()) {
            return StatusCode::OutOfRange;
        }
        CalendarDate date;
        auto status = m_System->FromEpochDay(day, date);
        if (status != StatusCode::Ok) {
            return status;
        }
        return PeriodOf(date, period, day, outPeriod);
    }

    StatusCode WeekFieldEngine::Locate(const CalendarDate &date, WeekPeriod period, Position &outPosition) const {
        EpochDay day = 0;
        auto status = m_System->ToEpochDay(date, day);
        if (status != StatusCode::Ok) {
            return status;
        }
        Period current{};
        status = PeriodOf(date, period, day, current);
        if (status != StatusCode::Ok) {
            return status;
        }
        outPosition = Position{current, static_cast<int>(day - current.start + 1), FirstWeekAsDay(current.start)};
        return StatusCode::Ok;
    }

    StatusCode WeekFieldEngine::LocalDayOfWeek(const CalendarDate &date, int &outDay) const {
        EpochDay day = 0;
        auto status = m_System->ToEpochDay(date, day);
        if (status != StatusCode::Ok) {
            return status;
        }
        outDay = almanac::LocalDayOfWeek(m_Model, DayOfWeek(day));
        return StatusCode::Ok;
    }

    StatusCode WeekFieldEngine::WithLocalDayOfWeek(const CalendarDate &date,
                                                   int value,
                                                   bool lenient,
                                                   CalendarDate &outDate) const {
        if (!lenient && (value < 1 || value > 7)) {
            return StatusCode::InvalidDate;
        }
        int current = 0;
        auto status = LocalDayOfWeek(date, current);
        if (status != StatusCode::Ok) {
            return status;
        }
        return m_System->PlusDays(date, static_cast<std::int64_t>(value) - current, outDate);
    }

    StatusCode WeekFieldEngine::IsWeekend(const CalendarDate &date, bool &outWeekend) const {
        EpochDay day = 0;
        auto status = m_System->ToEpochDay(date, day);
        if (status != StatusCode::Ok) {
            return status;
        }
        outWeekend = almanac::IsWeekend(m_Model, DayOfWeek(day));
        return StatusCode::Ok;
    }

    StatusCode WeekFieldEngine::Week(const CalendarDate &date, WeekPeriod period, int &outWeek) const {
        Position position{};
        auto status = Locate(date, period, position);
        if (status != StatusCode::Ok) {
            return status;
        }
        if (position.firstWeekDay <= position.scaledDay) {
            int week = (position.scaledDay - position.firstWeekDay) / 7 + 1;
            Period next{};
            status = NextPeriod(position.current, period, next);
            if (status == StatusCode::Ok) {
                auto nextWeekDay = FirstWeekAsDay(next.start) + position.current.length;
                if (nextWeekDay <= position.scaledDay) {
                    week = 1;
                }
            } else if (status != StatusCode::OutOfRange) {
                return status;
            }
            outWeek = week;
            return StatusCode::Ok;
        }
        Period previous{};
        status = PreviousPeriod(position.current, period, previous);
        if (status == StatusCode::OutOfRange) {
            // Nothing precedes the calendar, so week one starts with the period.
            outWeek = 1;
            return StatusCode::Ok;
        }
        if (status != StatusCode::Ok) {
            return status;
        }
        auto dayInPrevious = position.scaledDay + previous.length;
        outWeek = static_cast<int>((dayInPrevious - FirstWeekAsDay(previous.start)) / 7 + 1);
        return StatusCode::Ok;
    }

    StatusCode WeekFieldEngine::MaximumWeek(const CalendarDate &date, WeekPeriod period, int &outWeek) const {
        Position position{};
        auto status = Locate(date, period, position);
        if (status != StatusCode::Ok) {
            return status;
        }
        if (position.firstWeekDay > position.scaledDay) {
            Period previous{};
            status = PreviousPeriod(position.current, period, previous);
            if (status == StatusCode::Ok) {
                auto currentWeekDay = position.firstWeekDay + previous.length;
                outWeek = static_cast<int>((currentWeekDay - FirstWeekAsDay(previous.start)) / 7);
                return StatusCode::Ok;
            }
            if (status != StatusCode::OutOfRange) {
                return status;
            }
        }
        Period next{};
        status = NextPeriod(position.current, period, next);
        if (status == StatusCode::Ok) {
            auto nextWeekDay = FirstWeekAsDay(next.start) + position.current.length;
            outWeek = static_cast<int>((nextWeekDay - position.firstWeekDay) / 7);
            return StatusCode::Ok;
        }
        if (status != StatusCode::OutOfRange) {
            return status;
        }
        outWeek = static_cast<int>((position.current.length - position.firstWeekDay) / 7 + 1);
        return StatusCode::Ok;
    }

    StatusCode WeekFieldEngine::WithWeek(const CalendarDate &date,
                                         WeekPeriod period,
                                         int value,
                                         bool lenient,
                                         CalendarDate &outDate) const {
        if (!lenient) {
            int maximum = 0;
            auto status = MaximumWeek(date, period, maximum);
            if (status != StatusCode::Ok) {
                return status;
            }
            if (value < 1 || value > maximum) {
                return StatusCode::InvalidDate;
            }
        }
        int current = 0;
        auto status = Week(date, period, current);
        if (status != StatusCode::Ok) {
            return status;
        }
        return m_System->PlusDays(date, 7 * (static_cast<std::int64_t>(value) - current), outDate);
    }

    StatusCode WeekFieldEngine::BoundedWeek(const CalendarDate &date, WeekPeriod period, int &outWeek) const {
        Position position{};
        auto status = Locate(date, period, position);
        if (status != StatusCode::Ok) {
            return status;
        }
        outWeek = static_cast<int>(FloorDiv(position.scaledDay - position.firstWeekDay, 7) + 1);
        return StatusCode::Ok;
    }

    StatusCode WeekFieldEngine::BoundedWeekRange(const CalendarDate &date,
                                                 WeekPeriod period,
                                                 int &outMin,
                                                 int &outMax) const {
        Position position{};
        auto status = Locate(date, period, position);
        if (status != StatusCode::Ok) {
            return status;
        }
        outMin = static_cast<int>(FloorDiv(1 - position.firstWeekDay, 7) + 1);
        outMax = static_cast<int>(FloorDiv(position.current.length - position.firstWeekDay, 7) + 1);
        return StatusCode::Ok;
    }

    StatusCode WeekFieldEngine::WithBoundedWeek(const CalendarDate &date,
                                                WeekPeriod period,
                                                int value,
                                                bool lenient,
                                                CalendarDate &outDate) const {
        if (!lenient) {
            int minimum = 0;
            int maximum = 0;
            auto status = BoundedWeekRange(date, period, minimum, maximum);
            if (status != StatusCode::Ok) {
                return status;
            }
            if (value < minimum || value > maximum) {
                return StatusCode::InvalidDate;
            }
        }
        int current = 0;
        auto status = BoundedWeek(date, period, current);
        if (status != StatusCode::Ok) {
            return status;
        }
        return m_System->PlusDays(date, 7 * (static_cast<std::int64_t>(value) - current), outDate);
    }
}
