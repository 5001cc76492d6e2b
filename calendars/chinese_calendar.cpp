#include "almanac/calendars/chinese_calendar.h"

#include <iostream>
#include <iterator>
#include <vector>

namespace almanac {
    namespace {
        // One entry per lunar year 1900..2099: bits 15..4 flag 30-day months 1..12,
        // bits 3..0 name the leap month and bit 16 flags a 30-day leap month.
        constexpr std::uint32_t kLunarInfo[] = {
            0x04bd8, 0x04ae0, 0x0a570, 0x054d5, 0x0d260, 0x0d950, 0x16554, 0x056a0, 0x09ad0, 0x055d2,
            0x04ae0, 0x0a5b6, 0x0a4d0, 0x0d250, 0x1d255, 0x0b540, 0x0d6a0, 0x0ada2, 0x095b0, 0x14977,
            0x04970, 0x0a4b0, 0x0b4b5, 0x06a50, 0x06d40, 0x1ab54, 0x02b60, 0x09570, 0x052f2, 0x04970,
            0x06566, 0x0d4a0, 0x0ea50, 0x06e95, 0x05ad0, 0x02b60, 0x186e3, 0x092e0, 0x1c8d7, 0x0c950,
            0x0d4a0, 0x1d8a6, 0x0b550, 0x056a0, 0x1a5b4, 0x025d0, 0x092d0, 0x0d2b2, 0x0a950, 0x0b557,
            0x06ca0, 0x0b550, 0x15355, 0x04da0, 0x0a5b0, 0x14573, 0x052b0, 0x0a9a8, 0x0e950, 0x06aa0,
            0x0aea6, 0x0ab50, 0x04b60, 0x0aae4, 0x0a570, 0x05260, 0x0f263, 0x0d950, 0x05b57, 0x056a0,
            0x096d0, 0x04dd5, 0x04ad0, 0x0a4d0, 0x0d4d4, 0x0d250, 0x0d558, 0x0b540, 0x0b6a0, 0x195a6,
            0x095b0, 0x049b0, 0x0a974, 0x0a4b0, 0x0b27a, 0x06a50, 0x06d40, 0x0af46, 0x0ab60, 0x09570,
            0x04af5, 0x04970, 0x064b0, 0x074a3, 0x0ea50, 0x06b58, 0x055c0, 0x0ab60, 0x096d5, 0x092e0,
            0x0c960, 0x0d954, 0x0d4a0, 0x0da50, 0x07552, 0x056a0, 0x0abb7, 0x025d0, 0x092d0, 0x0cab5,
            0x0a950, 0x0b4a0, 0x0baa4, 0x0ad50, 0x055d9, 0x04ba0, 0x0a5b0, 0x15176, 0x052b0, 0x0a930,
            0x07954, 0x06aa0, 0x0ad50, 0x05b52, 0x04b60, 0x0a6e6, 0x0a4e0, 0x0d260, 0x0ea65, 0x0d530,
            0x05aa0, 0x076a3, 0x096d0, 0x04bd7, 0x04ad0, 0x0a4d0, 0x1d0b6, 0x0d250, 0x0d520, 0x0dd45,
            0x0b5a0, 0x056d0, 0x055b2, 0x049b0, 0x0a577, 0x0a4b0, 0x0aa50, 0x1b255, 0x06d20, 0x0ada0,
            0x14b63, 0x09370, 0x049f8, 0x04970, 0x064b0, 0x168a6, 0x0ea50, 0x06b20, 0x1a6c4, 0x0aae0,
            0x0a2e0, 0x0d2e3, 0x0c960, 0x0d557, 0x0d4a0, 0x0da50, 0x05d55, 0x056a0, 0x0a6d0, 0x055d4,
            0x052d0, 0x0a9b8, 0x0a950, 0x0b4a0, 0x0b6a6, 0x0ad50, 0x055a0, 0x0aba4, 0x0a5b0, 0x052b0,
            0x0b273, 0x06930, 0x07337, 0x06aa0, 0x0ad50, 0x14b55, 0x04b60, 0x0a570, 0x054e4, 0x0d160,
            0x0e968, 0x0d520, 0x0daa0, 0x16aa6, 0x056d0, 0x04ae0, 0x0a9d4, 0x0a2d0, 0x0d150, 0x0f252
        };

        struct ObservatoryMonthStart {
            int relatedYear;
            int month;
            int gregorianMonth;
            int gregorianDay;
        };

        // Hong Kong Observatory month starts where the new moon falls within
        // minutes of midnight.
        constexpr ObservatoryMonthStart kObservatoryMonthStarts[] = {
            {2057, 9, 9, 29},
            {2097, 7, 8, 8}
        };

        struct ReignPeriod {
            ChineseEra era;
            std::string_view name;
            int firstYear;
            int lastYear;
        };

        constexpr ReignPeriod kReignPeriods[] = {
            {ChineseEra::QingGuangxu, "Guangxu", 1875, 1908},
            {ChineseEra::QingXuantong, "Xuantong", 1909, 1911}
        };

        // Year 1 of the Yellow Emperor is 2698 BC, astronomical year -2697.
        constexpr int kYellowEmperorOffset = 2698;

        EpochDay EpochDayFromUtcSeconds(std::int64_t utcSeconds) noexcept {
            constexpr std::int64_t kSecondsPerDay = 86400;
            // Midnight of the switch day, local standard time.
            constexpr std::int64_t kSwitchInstant =
                ChineseCalendar::kStandardTimeSwitch * kSecondsPerDay - ChineseCalendar::kStandardOffsetSeconds;
            int offset = utcSeconds < kSwitchInstant ? ChineseCalendar::kBeijingMeanOffsetSeconds
                                                     : ChineseCalendar::kStandardOffsetSeconds;
            return FloorDiv(utcSeconds + offset, kSecondsPerDay);
        }

        std::vector<int> MonthLengths(std::uint32_t info) {
            std::vector<int> lengths;
            int leap = static_cast<int>(info & 0xf);
            for (int month = 1; month <= 12; ++month) {
                lengths.push_back((info & (0x10000u >> month)) != 0 ? 30 : 29);
                if (month == leap) {
                    lengths.push_back((info & 0x10000u) != 0 ? 30 : 29);
                }
            }
            return lengths;
        }

        class YearOfCycleRule final : public BoundedIntRule {
        public:
            explicit YearOfCycleRule(const CalendarSystem &system) noexcept : m_System(system) {
            }

            FieldId Id() const noexcept override {
                return FieldId::YearOfCycle;
            }

            StatusCode GetValue(const CalendarDate &date, int &outValue) const override {
                outValue = ChineseCalendar::YearOfCycle(date.year);
                return StatusCode::Ok;
            }

            StatusCode GetMinimum(const CalendarDate &, int &outValue) const override {
                outValue = 1;
                return StatusCode::Ok;
            }

            StatusCode GetMaximum(const CalendarDate &, int &outValue) const override {
                outValue = ChineseCalendar::kCycleYears;
                return StatusCode::Ok;
            }

            StatusCode WithValue(const CalendarDate &date, const int &value, bool lenient, CalendarDate &outDate) const override {
                if (!lenient && !IsValid(date, value)) {
                    return StatusCode::InvalidDate;
                }
                int year = date.year + (value - ChineseCalendar::YearOfCycle(date.year));
                return m_System.WithYear(date, date.era, year, outDate);
            }

            FieldId ChildAtFloor(const CalendarDate &) const override {
                return FieldId::Month;
            }

        private:
            const CalendarSystem &m_System;
        };

        class RelatedGregorianYearRule final : public BoundedIntRule {
        public:
            explicit RelatedGregorianYearRule(const CalendarSystem &system) noexcept : m_System(system) {
            }

            FieldId Id() const noexcept override {
                return FieldId::RelatedGregorianYear;
            }

            StatusCode GetValue(const CalendarDate &date, int &outValue) const override {
                outValue = ChineseCalendar::RelatedGregorianYear(date.year);
                return StatusCode::Ok;
            }

            StatusCode GetMinimum(const CalendarDate &, int &outValue) const override {
                outValue = ChineseCalendar::kFirstRelatedYear;
                return StatusCode::Ok;
            }

            StatusCode GetMaximum(const CalendarDate &, int &outValue) const override {
                outValue = ChineseCalendar::kLastRelatedYear;
                return StatusCode::Ok;
            }

            StatusCode WithValue(const CalendarDate &date, const int &value, bool, CalendarDate &outDate) const override {
                return m_System.WithYear(date, date.era, value + ChineseCalendar::kRelatedYearOffset, outDate);
            }

            FieldId ChildAtFloor(const CalendarDate &) const override {
                return FieldId::Month;
            }

        private:
            const CalendarSystem &m_System;
        };
    }

    std::string_view ChineseEraName(ChineseEra era) noexcept {
        if (era == ChineseEra::YellowEmperor) {
            return "YellowEmperor";
        }
        for (const auto &reign: kReignPeriods) {
            if (reign.era == era) {
                return reign.name;
            }
        }
        return "Unknown";
    }

    ChineseCalendar::ChineseCalendar(MonthTable table) : m_Table(std::move(table)) {
        RegisterRule(std::make_unique<YearOfCycleRule>(*this));
        RegisterRule(std::make_unique<RelatedGregorianYearRule>(*this));
    }

    StatusCode ChineseCalendar::Create(std::unique_ptr<CalendarSystem> &outCalendar) {
        std::vector<MonthTable::YearRow> rows;
        rows.reserve(std::size(kLunarInfo));
        int related = kFirstRelatedYear;
        for (auto info: kLunarInfo) {
            rows.push_back(MonthTable::YearRow{related + kRelatedYearOffset, static_cast<int>(info & 0xf), MonthLengths(info)});
            ++related;
        }
        MonthTable table;
        auto status = MonthTable::Build("chinese", "1.0", FromGregorian(kFirstRelatedYear, 1, 31), rows, table);
        if (status != StatusCode::Ok) {
            return status;
        }
        for (const auto &start: kObservatoryMonthStarts) {
            EpochDay expected = FromGregorian(start.relatedYear, start.gregorianMonth, start.gregorianDay);
            EpochDay actual = 0;
            auto year = start.relatedYear + kRelatedYearOffset;
            auto month = MonthSpec::Regular(start.month);
            status = table.StartOf(year, month, actual);
            if (status != StatusCode::Ok) {
                return status;
            }
            if (actual != expected) {
                status = table.ShiftMonthStart(year, month, static_cast<int>(expected - actual));
                if (status != StatusCode::Ok) {
                    std::cout << "[Chinese] Unable to apply observatory month start for " << start.relatedYear
                              << std::endl;
                    return StatusCode::InternalError;
                }
            }
        }
        std::unique_ptr<ChineseCalendar> calendar(new ChineseCalendar(std::move(table)));
        status = calendar->RuleStatus();
        if (status != StatusCode::Ok) {
            return status;
        }
        outCalendar = std::move(calendar);
        return StatusCode::Ok;
    }

    CalendarFamily ChineseCalendar::Family() const noexcept {
        return CalendarFamily::Chinese;
    }

    std::string_view ChineseCalendar::Variant() const noexcept {
        return "chinese";
    }

    std::string_view ChineseCalendar::Summary() const noexcept {
        return "Chinese lunisolar calendar, sexagesimal cycles";
    }

    StatusCode ChineseCalendar::ToEpochDay(const CalendarDate &date, EpochDay &outDay) const {
        auto status = CheckFields(date);
        if (status != StatusCode::Ok) {
            return status;
        }
        EpochDay start = 0;
        status = m_Table.StartOf(date.year, date.month, start);
        if (status != StatusCode::Ok) {
            return status;
        }
        outDay = start + date.day - 1;
        return StatusCode::Ok;
    }

    StatusCode ChineseCalendar::FromEpochDay(EpochDay day, CalendarDate &outDate) const {
        int year = 0;
        MonthSpec month{};
        int dayOfMonth = 0;
        auto status = m_Table.Locate(day, year, month, dayOfMonth);
        if (status != StatusCode::Ok) {
            return status;
        }
        outDate = MakeDate(kEraCyclic, year, month, dayOfMonth);
        return StatusCode::Ok;
    }

    StatusCode ChineseCalendar::LengthOfMonth(int era, int year, MonthSpec month, int &outLength) const {
        if (era != kEraCyclic) {
            return StatusCode::InvalidDate;
        }
        return m_Table.LengthOf(year, month, outLength);
    }

    StatusCode ChineseCalendar::LengthOfYear(int era, int year, int &outLength) const {
        if (era != kEraCyclic) {
            return StatusCode::InvalidDate;
        }
        return m_Table.LengthOfYear(year, outLength);
    }

    EpochDay ChineseCalendar::MinimumEpochDay() const noexcept {
        return m_Table.FirstDay();
    }

    EpochDay ChineseCalendar::MaximumEpochDay() const noexcept {
        return m_Table.LastDay();
    }

    StatusCode ChineseCalendar::YearRange(int era, int &outMin, int &outMax) const {
        if (era != kEraCyclic) {
            return StatusCode::InvalidDate;
        }
        outMin = m_Table.MinYear();
        outMax = m_Table.MaxYear();
        return StatusCode::Ok;
    }

    bool ChineseCalendar::IsLeapYear(int, int year) const {
        return m_Table.LeapMonth(year) != 0;
    }

    int ChineseCalendar::MonthsInYear(int, int year) const {
        return m_Table.MonthsInYear(year);
    }

    StatusCode ChineseCalendar::MonthAt(int, int year, int ordinal, MonthSpec &outMonth) const {
        return m_Table.MonthAt(year, ordinal, outMonth);
    }

    int ChineseCalendar::MonthOrdinal(int, int year, MonthSpec month) const {
        return m_Table.MonthOrdinal(year, month);
    }

    int ChineseCalendar::GetLeapMonth(int cycle, int yearOfCycle) const noexcept {
        if (yearOfCycle < 1 || yearOfCycle > kCycleYears) {
            return 0;
        }
        return m_Table.LeapMonth(ToCyclicYear(cycle, yearOfCycle));
    }

    StatusCode ChineseCalendar::YearOfEra(const CalendarDate &date, ChineseEra era, int &outYear) const {
        if (!Matches(date)) {
            return StatusCode::InvalidArgument;
        }
        int related = RelatedGregorianYear(date.year);
        if (era == ChineseEra::YellowEmperor) {
            outYear = related + kYellowEmperorOffset;
            return StatusCode::Ok;
        }
        for (const auto &reign: kReignPeriods) {
            if (reign.era != era) {
                continue;
            }
            if (related < reign.firstYear || related > reign.lastYear) {
                return StatusCode::OutOfRange;
            }
            outYear = related - reign.firstYear + 1;
            return StatusCode::Ok;
        }
        return StatusCode::InvalidArgument;
    }

    const MonthTable &ChineseCalendar::Table() const noexcept {
        return m_Table;
    }

    int ChineseCalendar::CycleOf(int year) noexcept {
        return static_cast<int>(FloorDiv(year - 1, kCycleYears)) + 1;
    }

    int ChineseCalendar::YearOfCycle(int year) noexcept {
        return static_cast<int>(FloorMod(year - 1, kCycleYears)) + 1;
    }

    int ChineseCalendar::ToCyclicYear(int cycle, int yearOfCycle) noexcept {
        return (cycle - 1) * kCycleYears + yearOfCycle;
    }

    int ChineseCalendar::RelatedGregorianYear(int year) noexcept {
        return year - kRelatedYearOffset;
    }

    void ChineseCalendar::SexagesimalName(int yearOfCycle, int &outStem, int &outBranch) noexcept {
        outStem = static_cast<int>(FloorMod(yearOfCycle - 1, 10)) + 1;
        outBranch = static_cast<int>(FloorMod(yearOfCycle - 1, 12)) + 1;
    }

    StatusCode ChineseCalendar::FromUtcSeconds(std::int64_t utcSeconds, CalendarDate &outDate) const {
        return FromEpochDay(EpochDayFromUtcSeconds(utcSeconds), outDate);
    }
}
