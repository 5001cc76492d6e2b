#include "almanac/field_rule.h"

#include <algorithm>

#include "almanac/calendars/calendar_system.h"

namespace almanac {
    namespace {
        constexpr int kMaxChildDepth = 8;

        class EraRule final : public BoundedIntRule {
        public:
            explicit EraRule(const CalendarSystem &system) noexcept : m_System(system) {
            }

            FieldId Id() const noexcept override {
                return FieldId::Era;
            }

            StatusCode GetValue(const CalendarDate &date, int &outValue) const override {
                outValue = date.era;
                return StatusCode::Ok;
            }

            StatusCode GetMinimum(const CalendarDate &, int &outValue) const override {
                auto eras = m_System.Eras();
                outValue = eras.front();
                return StatusCode::Ok;
            }

            StatusCode GetMaximum(const CalendarDate &, int &outValue) const override {
                auto eras = m_System.Eras();
                outValue = eras.back();
                return StatusCode::Ok;
            }

            bool IsValid(const CalendarDate &, const int &value) const override {
                auto eras = m_System.Eras();
                return std::find(eras.begin(), eras.end(), value) != eras.end();
            }

            StatusCode WithValue(const CalendarDate &date, const int &value, bool, CalendarDate &outDate) const override {
                if (!IsValid(date, value)) {
                    return StatusCode::OutOfRange;
                }
                int minYear = 0;
                int maxYear = 0;
                auto status = m_System.YearRange(value, minYear, maxYear);
                if (status != StatusCode::Ok) {
                    return status;
                }
                int year = std::clamp(date.year, minYear, maxYear);
                return m_System.WithYear(date, value, year, outDate);
            }

            FieldId ChildAtFloor(const CalendarDate &) const override {
                return FieldId::YearOfEra;
            }

        private:
            const CalendarSystem &m_System;
        };

        class YearOfEraRule final : public BoundedIntRule {
        public:
            explicit YearOfEraRule(const CalendarSystem &system) noexcept : m_System(system) {
            }

            FieldId Id() const noexcept override {
                return FieldId::YearOfEra;
            }

            StatusCode GetValue(const CalendarDate &date, int &outValue) const override {
                outValue = date.year;
                return StatusCode::Ok;
            }

            StatusCode GetMinimum(const CalendarDate &date, int &outValue) const override {
                int maxYear = 0;
                return m_System.YearRange(date.era, outValue, maxYear);
            }

            StatusCode GetMaximum(const CalendarDate &date, int &outValue) const override {
                int minYear = 0;
                return m_System.YearRange(date.era, minYear, outValue);
            }

            StatusCode WithValue(const CalendarDate &date, const int &value, bool lenient, CalendarDate &outDate) const override {
                if (IsValid(date, value) || !lenient) {
                    return m_System.WithYear(date, date.era, value, outDate);
                }
                int era = 0;
                int year = 0;
                m_System.SplitLinearYear(m_System.LinearYear(date.era, value), era, year);
                return m_System.WithYear(date, era, year, outDate);
            }

            FieldId ChildAtFloor(const CalendarDate &) const override {
                return FieldId::Month;
            }

        private:
            const CalendarSystem &m_System;
        };

        class MonthRule final : public MonthFieldRule {
        public:
            explicit MonthRule(const CalendarSystem &system) noexcept : m_System(system) {
            }

            FieldId Id() const noexcept override {
                return FieldId::Month;
            }

            StatusCode GetValue(const CalendarDate &date, MonthSpec &outValue) const override {
                outValue = date.month;
                return StatusCode::Ok;
            }

            StatusCode GetMinimum(const CalendarDate &date, MonthSpec &outValue) const override {
                return m_System.MonthAt(date.era, date.year, 1, outValue);
            }

            StatusCode GetMaximum(const CalendarDate &date, MonthSpec &outValue) const override {
                return m_System.MonthAt(date.era, date.year, m_System.MonthsInYear(date.era, date.year), outValue);
            }

            bool IsValid(const CalendarDate &date, const MonthSpec &value) const override {
                return m_System.MonthOrdinal(date.era, date.year, value) != 0;
            }

            StatusCode WithValue(const CalendarDate &date,
                                 const MonthSpec &value,
                                 bool lenient,
                                 CalendarDate &outDate) const override {
                if (IsValid(date, value)) {
                    return m_System.WithMonth(date, value, outDate);
                }
                if (!lenient) {
                    return StatusCode::InvalidDate;
                }
                auto regular = MonthSpec::Regular(value.number);
                if (IsValid(date, regular)) {
                    return m_System.WithMonth(date, regular, outDate);
                }
                int current = m_System.MonthOrdinal(date.era, date.year, date.month);
                if (current == 0) {
                    return StatusCode::InvalidDate;
                }
                return m_System.PlusMonths(date, static_cast<std::int64_t>(value.number) - current, outDate);
            }

            FieldId ChildAtFloor(const CalendarDate &) const override {
                return FieldId::DayOfMonth;
            }

        private:
            const CalendarSystem &m_System;
        };

        class DayOfMonthRule final : public BoundedIntRule {
        public:
            explicit DayOfMonthRule(const CalendarSystem &system) noexcept : m_System(system) {
            }

            FieldId Id() const noexcept override {
                return FieldId::DayOfMonth;
            }

            StatusCode GetValue(const CalendarDate &date, int &outValue) const override {
                outValue = date.day;
                return StatusCode::Ok;
            }

            StatusCode GetMinimum(const CalendarDate &, int &outValue) const override {
                outValue = 1;
                return StatusCode::Ok;
            }

            StatusCode GetMaximum(const CalendarDate &date, int &outValue) const override {
                return m_System.MaximumDayOfMonth(date.era, date.year, date.month, outValue);
            }

            bool IsValid(const CalendarDate &date, const int &value) const override {
                auto candidate = date;
                candidate.day = value;
                return m_System.IsValid(candidate);
            }

            StatusCode WithValue(const CalendarDate &date, const int &value, bool lenient, CalendarDate &outDate) const override {
                if (IsValid(date, value)) {
                    outDate = date;
                    outDate.day = value;
                    return StatusCode::Ok;
                }
                if (!lenient) {
                    return StatusCode::InvalidDate;
                }
                auto first = date;
                first.day = 1;
                return m_System.PlusDays(first, static_cast<std::int64_t>(value) - 1, outDate);
            }

        private:
            const CalendarSystem &m_System;
        };

        class DayOfYearRule final : public BoundedIntRule {
        public:
            explicit DayOfYearRule(const CalendarSystem &system) noexcept : m_System(system) {
            }

            FieldId Id() const noexcept override {
                return FieldId::DayOfYear;
            }

            StatusCode GetValue(const CalendarDate &date, int &outValue) const override {
                return m_System.DayOfYear(date, outValue);
            }

            StatusCode GetMinimum(const CalendarDate &, int &outValue) const override {
                outValue = 1;
                return StatusCode::Ok;
            }

            StatusCode GetMaximum(const CalendarDate &date, int &outValue) const override {
                return m_System.LengthOfYear(date.era, date.year, outValue);
            }

            StatusCode WithValue(const CalendarDate &date, const int &value, bool lenient, CalendarDate &outDate) const override {
                if (!lenient && !IsValid(date, value)) {
                    return StatusCode::InvalidDate;
                }
                EpochDay start = 0;
                auto status = m_System.StartOfYear(date.era, date.year, start);
                if (status != StatusCode::Ok) {
                    return status;
                }
                EpochDay target = start + value - 1;
                if (target < m_System.MinimumEpochDay() || target > m_System.MaximumEpochDay()) {
                    return StatusCode::OutOfRange;
                }
                return m_System.FromEpochDay(target, outDate);
            }

        private:
            const CalendarSystem &m_System;
        };

        class DayOfWeekRule final : public BoundedIntRule {
        public:
            explicit DayOfWeekRule(const CalendarSystem &system) noexcept : m_System(system) {
            }

            FieldId Id() const noexcept override {
                return FieldId::DayOfWeek;
            }

            StatusCode GetValue(const CalendarDate &date, int &outValue) const override {
                EpochDay day = 0;
                auto status = m_System.ToEpochDay(date, day);
                if (status != StatusCode::Ok) {
                    return status;
                }
                outValue = static_cast<int>(DayOfWeek(day));
                return StatusCode::Ok;
            }

            StatusCode GetMinimum(const CalendarDate &, int &outValue) const override {
                outValue = static_cast<int>(Weekday::Monday);
                return StatusCode::Ok;
            }

            StatusCode GetMaximum(const CalendarDate &, int &outValue) const override {
                outValue = static_cast<int>(Weekday::Sunday);
                return StatusCode::Ok;
            }

            StatusCode WithValue(const CalendarDate &date, const int &value, bool lenient, CalendarDate &outDate) const override {
                if (!lenient && !IsValid(date, value)) {
                    return StatusCode::InvalidDate;
                }
                int current = 0;
                auto status = GetValue(date, current);
                if (status != StatusCode::Ok) {
                    return status;
                }
                return m_System.PlusDays(date, static_cast<std::int64_t>(value) - current, outDate);
            }

        private:
            const CalendarSystem &m_System;
        };

        StatusCode WalkChildren(const FieldRuleSet &rules,
                                const CalendarDate &date,
                                FieldId field,
                                bool ceiling,
                                CalendarDate &outDate) {
            const FieldRuleBase *rule = rules.Find(field);
            if (rule == nullptr) {
                return StatusCode::NotFound;
            }
            CalendarDate current = date;
            FieldId child = ceiling ? rule->ChildAtCeiling(current) : rule->ChildAtFloor(current);
            for (int depth = 0; child != FieldId::None; ++depth) {
                if (depth >= kMaxChildDepth) {
                    return StatusCode::InternalError;
                }
                const FieldRuleBase *childRule = rules.Find(child);
                if (childRule == nullptr) {
                    return StatusCode::NotFound;
                }
                FieldValue value;
                auto status = ceiling ? childRule->MaximumAny(current, value) : childRule->MinimumAny(current, value);
                if (status != StatusCode::Ok) {
                    return status;
                }
                CalendarDate next;
                status = childRule->WithAny(current, value, false, next);
                if (status != StatusCode::Ok) {
                    return status;
                }
                current = next;
                child = ceiling ? childRule->ChildAtCeiling(current) : childRule->ChildAtFloor(current);
            }
            outDate = current;
            return StatusCode::Ok;
        }
    }

    std::string_view FieldName(FieldId field) noexcept {
        switch (field) {
            case FieldId::None:
                return "None";
            case FieldId::Era:
                return "Era";
            case FieldId::YearOfEra:
                return "YearOfEra";
            case FieldId::Month:
                return "Month";
            case FieldId::DayOfMonth:
                return "DayOfMonth";
            case FieldId::DayOfYear:
                return "DayOfYear";
            case FieldId::DayOfWeek:
                return "DayOfWeek";
            case FieldId::YearOfCycle:
                return "YearOfCycle";
            case FieldId::RelatedGregorianYear:
                return "RelatedGregorianYear";
            case FieldId::LocalDayOfWeek:
                return "LocalDayOfWeek";
            case FieldId::WeekOfYear:
                return "WeekOfYear";
            case FieldId::WeekOfMonth:
                return "WeekOfMonth";
            case FieldId::BoundedWeekOfYear:
                return "BoundedWeekOfYear";
            case FieldId::BoundedWeekOfMonth:
                return "BoundedWeekOfMonth";
        }
        return "Unknown";
    }

    bool BoundedIntRule::IsValid(const CalendarDate &date, const int &value) const {
        int minimum = 0;
        int maximum = 0;
        if (GetMinimum(date, minimum) != StatusCode::Ok || GetMaximum(date, maximum) != StatusCode::Ok) {
            return false;
        }
        return value >= minimum && value <= maximum;
    }

    FieldRuleSet::FieldRuleSet() : m_Rules(), m_Index() {
    }

    FieldRuleSet::~FieldRuleSet() = default;

    StatusCode FieldRuleSet::Register(std::unique_ptr<FieldRuleBase> rule) {
        if (!rule) {
            return StatusCode::InvalidArgument;
        }
        auto id = rule->Id();
        if (id == FieldId::None) {
            return StatusCode::InvalidArgument;
        }
        if (m_Index.find(id) != m_Index.end()) {
            return StatusCode::AlreadyExists;
        }
        m_Index.emplace(id, rule.get());
        m_Rules.push_back(std::move(rule));
        return StatusCode::Ok;
    }

    const FieldRuleBase *FieldRuleSet::Find(FieldId field) const noexcept {
        auto it = m_Index.find(field);
        return it == m_Index.end() ? nullptr : it->second;
    }

    const IntFieldRule *FieldRuleSet::FindInt(FieldId field) const noexcept {
        return dynamic_cast<const IntFieldRule *>(Find(field));
    }

    const MonthFieldRule *FieldRuleSet::FindMonth() const noexcept {
        return dynamic_cast<const MonthFieldRule *>(Find(FieldId::Month));
    }

    std::vector<FieldId> FieldRuleSet::Fields() const {
        std::vector<FieldId> fields;
        fields.reserve(m_Rules.size());
        for (const auto &rule: m_Rules) {
            fields.push_back(rule->Id());
        }
        return fields;
    }

    StatusCode InstallStandardRules(const CalendarSystem &system, FieldRuleSet &rules) {
        std::unique_ptr<FieldRuleBase> standard[] = {
            std::make_unique<EraRule>(system),
            std::make_unique<YearOfEraRule>(system),
            std::make_unique<MonthRule>(system),
            std::make_unique<DayOfMonthRule>(system),
            std::make_unique<DayOfYearRule>(system),
            std::make_unique<DayOfWeekRule>(system)
        };
        for (auto &rule: standard) {
            auto status = rules.Register(std::move(rule));
            if (status != StatusCode::Ok) {
                return status;
            }
        }
        return StatusCode::Ok;
    }

    StatusCode AtFloor(const FieldRuleSet &rules, const CalendarDate &date, FieldId field, CalendarDate &outDate) {
        return WalkChildren(rules, date, field, false, outDate);
    }

    StatusCode AtCeiling(const FieldRuleSet &rules, const CalendarDate &date, FieldId field, CalendarDate &outDate) {
        return WalkChildren(rules, date, field, true, outDate);
    }
}
