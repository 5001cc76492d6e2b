#pragma once

#include <memory>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "almanac/calendar_date.h"
#include "almanac/status.h"

namespace almanac {
    class CalendarSystem;

    enum class FieldId {
        None = 0,
        Era,
        YearOfEra,
        Month,
        DayOfMonth,
        DayOfYear,
        DayOfWeek,
        YearOfCycle,
        RelatedGregorianYear,
        LocalDayOfWeek,
        WeekOfYear,
        WeekOfMonth,
        BoundedWeekOfYear,
        BoundedWeekOfMonth
    };

    std::string_view FieldName(FieldId field) noexcept;

    using FieldValue = std::variant<int, MonthSpec>;

    // Type-erased view used by format/parse layers that handle any field.
    class FieldRuleBase {
    public:
        virtual ~FieldRuleBase() = default;

        virtual FieldId Id() const noexcept = 0;

        virtual StatusCode GetAny(const CalendarDate &date, FieldValue &outValue) const = 0;
        virtual StatusCode MinimumAny(const CalendarDate &date, FieldValue &outValue) const = 0;
        virtual StatusCode MaximumAny(const CalendarDate &date, FieldValue &outValue) const = 0;
        virtual bool IsValidAny(const CalendarDate &date, const FieldValue &value) const = 0;
        virtual StatusCode WithAny(const CalendarDate &date,
                                   const FieldValue &value,
                                   bool lenient,
                                   CalendarDate &outDate) const = 0;

        // Finer field to default when only this field is known.
        virtual FieldId ChildAtFloor(const CalendarDate &date) const {
            (void) date;
            return FieldId::None;
        }

        virtual FieldId ChildAtCeiling(const CalendarDate &date) const {
            return ChildAtFloor(date);
        }
    };

    template<typename V>
    class FieldRule : public FieldRuleBase {
    public:
        virtual StatusCode GetValue(const CalendarDate &date, V &outValue) const = 0;
        virtual StatusCode GetMinimum(const CalendarDate &date, V &outValue) const = 0;
        virtual StatusCode GetMaximum(const CalendarDate &date, V &outValue) const = 0;
        virtual bool IsValid(const CalendarDate &date, const V &value) const = 0;
        virtual StatusCode WithValue(const CalendarDate &date,
                                     const V &value,
                                     bool lenient,
                                     CalendarDate &outDate) const = 0;

        StatusCode GetAny(const CalendarDate &date, FieldValue &outValue) const override {
            V value{};
            auto status = GetValue(date, value);
            if (status == StatusCode::Ok) {
                outValue = value;
            }
            return status;
        }

        StatusCode MinimumAny(const CalendarDate &date, FieldValue &outValue) const override {
            V value{};
            auto status = GetMinimum(date, value);
            if (status == StatusCode::Ok) {
                outValue = value;
            }
            return status;
        }

        StatusCode MaximumAny(const CalendarDate &date, FieldValue &outValue) const override {
            V value{};
            auto status = GetMaximum(date, value);
            if (status == StatusCode::Ok) {
                outValue = value;
            }
            return status;
        }

        bool IsValidAny(const CalendarDate &date, const FieldValue &value) const override {
            const V *typed = std::get_if<V>(&value);
            return typed != nullptr && IsValid(date, *typed);
        }

        StatusCode WithAny(const CalendarDate &date,
                           const FieldValue &value,
                           bool lenient,
                           CalendarDate &outDate) const override {
            const V *typed = std::get_if<V>(&value);
            if (typed == nullptr) {
                return StatusCode::InvalidArgument;
            }
            return WithValue(date, *typed, lenient, outDate);
        }
    };

    using IntFieldRule = FieldRule<int>;
    using MonthFieldRule = FieldRule<MonthSpec>;

    // Integer rule whose validity is the closed range [minimum, maximum].
    class BoundedIntRule : public IntFieldRule {
    public:
        bool IsValid(const CalendarDate &date, const int &value) const override;
    };

    class FieldRuleSet {
    public:
        FieldRuleSet();
        ~FieldRuleSet();

        FieldRuleSet(const FieldRuleSet &) = delete;
        FieldRuleSet &operator=(const FieldRuleSet &) = delete;

        StatusCode Register(std::unique_ptr<FieldRuleBase> rule);

        const FieldRuleBase *Find(FieldId field) const noexcept;
        const IntFieldRule *FindInt(FieldId field) const noexcept;
        const MonthFieldRule *FindMonth() const noexcept;

        std::vector<FieldId> Fields() const;

    private:
        std::vector<std::unique_ptr<FieldRuleBase>> m_Rules;
        std::unordered_map<FieldId, FieldRuleBase *> m_Index;
    };

    // Era, year-of-era, month, day-of-month, day-of-year and ISO day-of-week.
    // AlreadyExists when rules already holds one of them.
    StatusCode InstallStandardRules(const CalendarSystem &system, FieldRuleSet &rules);

    // Sets every child of field, down to the day, to its minimum (floor) or maximum (ceiling).
    StatusCode AtFloor(const FieldRuleSet &rules, const CalendarDate &date, FieldId field, CalendarDate &outDate);
    StatusCode AtCeiling(const FieldRuleSet &rules, const CalendarDate &date, FieldId field, CalendarDate &outDate);
}
