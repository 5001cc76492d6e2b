#include <algorithm>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

#include "almanac/calendar_date.h"
#include "almanac/calendars/chinese_calendar.h"
#include "almanac/calendars/chrono_history.h"
#include "almanac/calendars/coptic_calendar.h"
#include "almanac/calendars/hijri_tabular_calendar.h"
#include "almanac/calendars/historic_calendar.h"
#include "almanac/calendars/japanese_calendar.h"
#include "almanac/calendars/new_year.h"
#include "almanac/codec.h"
#include "almanac/config.h"
#include "almanac/engine.h"
#include "almanac/epoch.h"
#include "almanac/era_resolver.h"
#include "almanac/field_rule.h"
#include "almanac/month_table.h"
#include "almanac/status.h"
#include "almanac/variant_registry.h"
#include "almanac/week_fields.h"
#include "almanac/week_model.h"

namespace {
    using almanac::AlmanacEngine;
    using almanac::CalendarDate;
    using almanac::CalendarSystem;
    using almanac::CalendarSystemPtr;
    using almanac::EngineConfig;
    using almanac::EpochDay;
    using almanac::FieldId;
    using almanac::Leniency;
    using almanac::MonthSpec;
    using almanac::StatusCode;

    bool ExpectTrue(bool condition, const std::string &message) {
        if (!condition) {
            std::cout << "    assertion failed: " << message << std::endl;
        }
        return condition;
    }

    bool ExpectStatus(StatusCode status, StatusCode expected, const std::string &message) {
        if (status != expected) {
            std::cout << "    status mismatch: " << message << std::endl;
            std::cout << "    expected " << almanac::StatusName(expected)
                    << " got " << almanac::StatusName(status) << std::endl;
            return false;
        }
        return true;
    }

    EngineConfig MakeConfig() {
        auto config = almanac::MakeDefaultConfig();
        config.logging.enabled = false;
        return config;
    }

    std::unique_ptr<AlmanacEngine> MakeEngine() {
        std::unique_ptr<AlmanacEngine> engine;
        if (AlmanacEngine::Create(MakeConfig(), engine) != StatusCode::Ok) {
            std::cout << "    engine creation failed" << std::endl;
            return nullptr;
        }
        return engine;
    }

    CalendarSystemPtr Lookup(AlmanacEngine &engine, const std::string &variant) {
        CalendarSystemPtr system;
        if (engine.Calendar(variant, system) != StatusCode::Ok) {
            std::cout << "    missing calendar " << variant << std::endl;
        }
        return system;
    }

    const std::vector<std::string> &SampleVariants() {
        static const std::vector<std::string> kVariants = {
            "coptic",
            "indian",
            "islamic-civil",
            "islamic-eastc",
            "islamic-habashalhasiba:-2",
            "islamic-umalqura",
            "chinese",
            "japanese",
            "historic-first-reform",
            "historic-sweden",
            "historic-julian:ancient-julian"
        };
        return kVariants;
    }

    std::tuple<int, int, int> Position(const CalendarSystem &system, const CalendarDate &date) {
        return {system.LinearYear(date.era, date.year), system.MonthOrdinal(date.era, date.year, date.month), date.day};
    }

    bool CopticEpochMapsToFirstDay() {
        auto engine = MakeEngine();
        if (!engine) {
            return false;
        }
        auto coptic = Lookup(*engine, "coptic");
        CalendarDate date;
        bool ok = ExpectStatus(coptic->FromEpochDay(-615558, date), StatusCode::Ok, "coptic epoch");
        ok &= ExpectTrue(date.year == 1 && date.month == MonthSpec::Regular(1) && date.day == 1, "1 Thout 1 AM");
        ok &= ExpectStatus(coptic->FromEpochDay(-615559, date), StatusCode::OutOfRange, "before coptic epoch");
        ok &= ExpectStatus(coptic->FromEpochDay(18516, date), StatusCode::Ok, "coptic new year 1737");
        ok &= ExpectTrue(date.year == 1737 && date.month.number == 1 && date.day == 1, "2020-09-11 is 1/1/1737");
        int length = 0;
        ok &= ExpectStatus(coptic->LengthOfMonth(0, 1739, MonthSpec::Regular(13), length), StatusCode::Ok, "epagomenal");
        ok &= ExpectTrue(length == 6, "leap epagomenal month has 6 days");
        ok &= ExpectStatus(coptic->LengthOfMonth(0, 1740, MonthSpec::Regular(13), length), StatusCode::Ok, "epagomenal");
        ok &= ExpectTrue(length == 5, "common epagomenal month has 5 days");
        ok &= ExpectTrue(!coptic->IsValid(coptic->MakeDate(0, 1740, MonthSpec::Regular(13), 6)), "day 6 of common year");
        ok &= ExpectTrue(!coptic->IsValid(coptic->MakeDate(0, 1740, MonthSpec::Leap(1), 1)), "no leap months");
        return ok;
    }

    bool IndianYearsFollowGregorianLeapYears() {
        auto engine = MakeEngine();
        if (!engine) {
            return false;
        }
        auto indian = Lookup(*engine, "indian");
        EpochDay day = 0;
        bool ok = ExpectStatus(indian->ToEpochDay(indian->MakeDate(0, 1942, MonthSpec::Regular(1), 1), day),
                               StatusCode::Ok, "saka 1942");
        ok &= ExpectTrue(day == almanac::FromGregorian(2020, 3, 21), "leap year starts on March 21");
        ok &= ExpectStatus(indian->ToEpochDay(indian->MakeDate(0, 1943, MonthSpec::Regular(1), 1), day),
                           StatusCode::Ok, "saka 1943");
        ok &= ExpectTrue(day == almanac::FromGregorian(2021, 3, 22), "common year starts on March 22");
        int length = 0;
        ok &= ExpectStatus(indian->LengthOfMonth(0, 1942, MonthSpec::Regular(1), length), StatusCode::Ok, "chaitra");
        ok &= ExpectTrue(length == 31, "chaitra has 31 days in a leap year");
        CalendarDate last;
        ok &= ExpectStatus(indian->FromEpochDay(indian->MaximumEpochDay(), last), StatusCode::Ok, "last day");
        ok &= ExpectTrue(last.year == 999999921 && last.month.number == 10 && last.day == 10, "truncated final year");
        ok &= ExpectStatus(indian->LengthOfYear(0, 999999921, length), StatusCode::Ok, "final year length");
        ok &= ExpectTrue(length == 285, "final year has 285 days");
        return ok;
    }

    bool TabularHijriStartsAtCivilEpoch() {
        auto engine = MakeEngine();
        if (!engine) {
            return false;
        }
        auto eastc = Lookup(*engine, "islamic-eastc");
        EpochDay day = 0;
        bool ok = ExpectStatus(eastc->ToEpochDay(eastc->MakeDate(0, 1, MonthSpec::Regular(1), 1), day),
                               StatusCode::Ok, "1/1/1 AH");
        ok &= ExpectTrue(day == almanac::HijriTabularCalendar::kCivilStart, "START_622_07_16");
        auto tbla = Lookup(*engine, "islamic-tbla");
        ok &= ExpectStatus(tbla->ToEpochDay(tbla->MakeDate(0, 1, MonthSpec::Regular(1), 1), day), StatusCode::Ok, "tbla");
        ok &= ExpectTrue(day == almanac::HijriTabularCalendar::kAstronomicalStart, "START_622_07_15");
        auto civil = Lookup(*engine, "islamic-civil");
        ok &= ExpectStatus(civil->ToEpochDay(civil->MakeDate(0, 1444, MonthSpec::Regular(9), 1), day), StatusCode::Ok,
                           "ramadan 1444");
        ok &= ExpectTrue(day == almanac::FromGregorian(2023, 3, 23), "1 Ramadan 1444 civil");
        ok &= ExpectTrue(civil->MaximumEpochDay() == 74838, "civil calendar ends with year 1600");
        ok &= ExpectTrue(tbla->MaximumEpochDay() == 74837, "astronomical calendar ends one day earlier");
        int length = 0;
        ok &= ExpectStatus(civil->LengthOfYear(0, 2, length), StatusCode::Ok, "year 2");
        ok &= ExpectTrue(length == 355 && civil->IsLeapYear(0, 2), "year 2 is leap");
        ok &= ExpectStatus(civil->LengthOfMonth(0, 2, MonthSpec::Regular(12), length), StatusCode::Ok, "dhu al-hijja");
        ok &= ExpectTrue(length == 30, "last month of a leap year has 30 days");
        return ok;
    }

    bool TabularHijriAdjustmentShiftsMapping() {
        auto engine = MakeEngine();
        if (!engine) {
            return false;
        }
        auto plain = Lookup(*engine, "islamic-civil");
        auto shifted = Lookup(*engine, "islamic-civil:+1");
        auto zero = Lookup(*engine, "islamic-civil:+0");
        bool ok = ExpectTrue(shifted->Variant() == "islamic-civil:+1", "canonical adjusted spelling");
        ok &= ExpectTrue(zero.get() == plain.get(), "zero adjustment shares the plain calendar");
        EpochDay plainDay = 0;
        EpochDay shiftedDay = 0;
        auto date = plain->MakeDate(0, 1444, MonthSpec::Regular(9), 1);
        ok &= ExpectStatus(plain->ToEpochDay(date, plainDay), StatusCode::Ok, "plain");
        date.variant = "islamic-civil:+1";
        ok &= ExpectStatus(shifted->ToEpochDay(date, shiftedDay), StatusCode::Ok, "shifted");
        ok &= ExpectTrue(shiftedDay == plainDay - 1, "adjusted calendar reaches the date one day earlier");
        CalendarDate back;
        ok &= ExpectStatus(shifted->FromEpochDay(shiftedDay, back), StatusCode::Ok, "inverse");
        ok &= ExpectTrue(back == date, "adjusted mapping round-trips");
        CalendarSystemPtr rejected;
        ok &= ExpectStatus(engine->Calendar("islamic-civil:+4", rejected), StatusCode::OutOfRange, "adjustment limit");
        ok &= ExpectStatus(engine->Calendar("islamic-lunar", rejected), StatusCode::UnsupportedVariant, "unknown base");
        return ok;
    }

    bool ChineseNewYear2020() {
        auto engine = MakeEngine();
        if (!engine) {
            return false;
        }
        auto system = Lookup(*engine, "chinese");
        const auto &chinese = static_cast<const almanac::ChineseCalendar &>(*system);
        CalendarDate date;
        bool ok = ExpectStatus(chinese.FromEpochDay(18286, date), StatusCode::Ok, "2020-01-25");
        ok &= ExpectTrue(almanac::ChineseCalendar::CycleOf(date.year) == 78, "cycle 78");
        ok &= ExpectTrue(almanac::ChineseCalendar::YearOfCycle(date.year) == 37, "year 37");
        ok &= ExpectTrue(date.month == MonthSpec::Regular(1) && date.day == 1, "first day of first month");
        ok &= ExpectTrue(chinese.GetLeapMonth(78, 37) == 4, "2020 has a leap fourth month");
        ok &= ExpectTrue(chinese.GetLeapMonth(78, 38) == 0, "2021 has no leap month");
        EpochDay day = 0;
        ok &= ExpectStatus(chinese.ToEpochDay(chinese.MakeDate(0, date.year, MonthSpec::Leap(4), 1), day), StatusCode::Ok,
                           "leap month");
        ok &= ExpectTrue(day == almanac::FromGregorian(2020, 5, 23), "leap fourth month starts 2020-05-23");
        ok &= ExpectTrue(!chinese.IsValid(chinese.MakeDate(0, date.year, MonthSpec::Leap(5), 1)), "no leap fifth month");
        int stem = 0;
        int branch = 0;
        almanac::ChineseCalendar::SexagesimalName(37, stem, branch);
        ok &= ExpectTrue(stem == 7 && branch == 1, "geng-zi year");
        int yearOfEra = 0;
        ok &= ExpectStatus(chinese.YearOfEra(date, almanac::ChineseEra::YellowEmperor, yearOfEra), StatusCode::Ok,
                           "yellow emperor");
        ok &= ExpectTrue(yearOfEra == 4718, "year 4718 of the yellow emperor");
        ok &= ExpectStatus(chinese.YearOfEra(date, almanac::ChineseEra::QingGuangxu, yearOfEra), StatusCode::OutOfRange,
                           "after the Qing dynasty");
        CalendarDate first;
        ok &= ExpectStatus(chinese.FromEpochDay(chinese.MinimumEpochDay(), first), StatusCode::Ok, "first day");
        ok &= ExpectStatus(chinese.YearOfEra(first, almanac::ChineseEra::QingGuangxu, yearOfEra), StatusCode::Ok, "guangxu");
        ok &= ExpectTrue(yearOfEra == 26, "1900 is Guangxu 26");
        CalendarDate xuantong;
        ok &= ExpectStatus(chinese.FromEpochDay(almanac::FromGregorian(1911, 6, 1), xuantong), StatusCode::Ok, "1911");
        ok &= ExpectStatus(chinese.YearOfEra(xuantong, almanac::ChineseEra::QingXuantong, yearOfEra), StatusCode::Ok,
                           "xuantong");
        ok &= ExpectTrue(yearOfEra == 3, "1911 is Xuantong 3");
        ok &= ExpectStatus(chinese.YearOfEra(xuantong, almanac::ChineseEra::QingGuangxu, yearOfEra), StatusCode::OutOfRange,
                           "Guangxu ended in 1908");
        ok &= ExpectTrue(almanac::ChineseEraName(almanac::ChineseEra::QingXuantong) == "Xuantong", "reign name");
        return ok;
    }

    bool ChineseTableMatchesObservatoryDates() {
        auto engine = MakeEngine();
        if (!engine) {
            return false;
        }
        auto chinese = Lookup(*engine, "chinese");
        bool ok = ExpectTrue(chinese->MinimumEpochDay() == almanac::FromGregorian(1900, 1, 31), "range start");
        ok &= ExpectTrue(chinese->MaximumEpochDay() == almanac::FromGregorian(2100, 2, 8), "range end");
        CalendarDate date;
        ok &= ExpectStatus(chinese->FromEpochDay(almanac::FromGregorian(2057, 9, 29), date), StatusCode::Ok, "2057");
        ok &= ExpectTrue(date.day == 1, "month starts on 2057-09-29");
        ok &= ExpectStatus(chinese->FromEpochDay(almanac::FromGregorian(2097, 8, 8), date), StatusCode::Ok, "2097");
        ok &= ExpectTrue(date.day == 1, "month starts on 2097-08-08");

        const auto &calendar = static_cast<const almanac::ChineseCalendar &>(*chinese);
        CalendarDate expected;
        ok &= ExpectStatus(calendar.FromUtcSeconds(18286LL * 86400 - 8 * 3600, date), StatusCode::Ok, "local midnight");
        ok &= ExpectTrue(date.month == MonthSpec::Regular(1) && date.day == 1, "new year starts at midnight UTC+8");
        ok &= ExpectStatus(calendar.FromUtcSeconds(18286LL * 86400 - 8 * 3600 - 1, date), StatusCode::Ok,
                           "one second earlier");
        ok &= ExpectStatus(chinese->FromEpochDay(18285, expected), StatusCode::Ok, "new year's eve");
        ok &= ExpectTrue(date == expected, "still the previous day");
        // Under Beijing mean time 1928-12-31 begins at 16:14:20 UTC on the 30th.
        const std::int64_t lastMeanDay = almanac::ChineseCalendar::kStandardTimeSwitch - 1;
        ok &= ExpectStatus(calendar.FromUtcSeconds(lastMeanDay * 86400 - 27940, date), StatusCode::Ok, "mean midnight");
        ok &= ExpectStatus(chinese->FromEpochDay(lastMeanDay, expected), StatusCode::Ok, "1928-12-31");
        ok &= ExpectTrue(date == expected, "Beijing mean time starts the day 7:45:40 ahead of UTC");
        ok &= ExpectStatus(calendar.FromUtcSeconds(lastMeanDay * 86400 - 28000, date), StatusCode::Ok,
                           "before mean midnight");
        ok &= ExpectStatus(chinese->FromEpochDay(lastMeanDay - 1, expected), StatusCode::Ok, "1928-12-30");
        ok &= ExpectTrue(date == expected, "UTC+8 does not apply before 1929");
        ok &= ExpectStatus(calendar.FromUtcSeconds(almanac::FromGregorian(2200, 1, 1) * 86400LL, date),
                           StatusCode::OutOfRange, "instant beyond the table");
        return ok;
    }

    bool UmalquraRejectsYearsOutsideTable() {
        auto engine = MakeEngine();
        if (!engine) {
            return false;
        }
        auto umalqura = Lookup(*engine, "islamic-umalqura");
        EpochDay day = 0;
        bool ok = ExpectStatus(umalqura->ToEpochDay(umalqura->MakeDate(0, 1317, MonthSpec::Regular(1), 1), day),
                               StatusCode::OutOfRange, "before 1318");
        ok &= ExpectStatus(umalqura->ToEpochDay(umalqura->MakeDate(0, 1481, MonthSpec::Regular(1), 1), day),
                           StatusCode::OutOfRange, "after 1480");
        ok &= ExpectStatus(umalqura->ToEpochDay(umalqura->MakeDate(0, 1444, MonthSpec::Regular(9), 1), day),
                           StatusCode::Ok, "ramadan 1444");
        ok &= ExpectTrue(day == 19439, "1 Ramadan 1444 is 2023-03-23");
        CalendarDate date;
        ok &= ExpectStatus(umalqura->FromEpochDay(umalqura->MinimumEpochDay() - 1, date), StatusCode::OutOfRange,
                           "before table");
        ok &= ExpectStatus(umalqura->FromEpochDay(umalqura->MinimumEpochDay(), date), StatusCode::Ok, "table start");
        ok &= ExpectTrue(date.year == 1318 && date.month.number == 1 && date.day == 1, "1 Muharram 1318");
        return ok;
    }

    bool FirstReformSkipsTenDays() {
        auto engine = MakeEngine();
        if (!engine) {
            return false;
        }
        auto historic = Lookup(*engine, "historic-first-reform");
        const int ad = almanac::HistoricCalendar::kEraAD;
        EpochDay day = 0;
        bool ok = ExpectStatus(historic->ToEpochDay(historic->MakeDate(ad, 1582, MonthSpec::Regular(10), 4), day),
                               StatusCode::Ok, "1582-10-04");
        ok &= ExpectTrue(day == -141428, "last Julian day");
        CalendarDate next;
        ok &= ExpectStatus(historic->FromEpochDay(day + 1, next), StatusCode::Ok, "next day");
        ok &= ExpectTrue(next.year == 1582 && next.month.number == 10 && next.day == 15, "followed by 1582-10-15");
        for (int gap = 5; gap <= 14; ++gap) {
            auto date = historic->MakeDate(ad, 1582, MonthSpec::Regular(10), gap);
            ok &= ExpectTrue(!historic->IsValid(date), "gap day is invalid");
            ok &= ExpectStatus(historic->ToEpochDay(date, day), StatusCode::InvalidDate, "gap day conversion");
        }
        int length = 0;
        ok &= ExpectStatus(historic->LengthOfMonth(ad, 1582, MonthSpec::Regular(10), length), StatusCode::Ok, "october");
        ok &= ExpectTrue(length == 21, "October 1582 has 21 days");
        ok &= ExpectStatus(historic->LengthOfYear(ad, 1582, length), StatusCode::Ok, "1582");
        ok &= ExpectTrue(length == 355, "1582 has 355 days");
        ok &= ExpectTrue(historic->IsValid(historic->MakeDate(ad, 1500, MonthSpec::Regular(2), 29)), "Julian 1500 is leap");
        ok &= ExpectTrue(!historic->IsValid(historic->MakeDate(ad, 1700, MonthSpec::Regular(2), 29)),
                         "Gregorian 1700 is not leap");
        return ok;
    }

    bool HistoricVariantsFollowRegionalReforms() {
        auto engine = MakeEngine();
        if (!engine) {
            return false;
        }
        const int ad = almanac::HistoricCalendar::kEraAD;
        auto britain = Lookup(*engine, "historic-GB");
        EpochDay day = 0;
        bool ok = ExpectStatus(britain->ToEpochDay(britain->MakeDate(ad, 1752, MonthSpec::Regular(9), 2), day),
                               StatusCode::Ok, "1752-09-02");
        CalendarDate next;
        ok &= ExpectStatus(britain->FromEpochDay(day + 1, next), StatusCode::Ok, "next day");
        ok &= ExpectTrue(next.month.number == 9 && next.day == 14, "Britain skips to 1752-09-14");
        ok &= ExpectTrue(!britain->IsValid(britain->MakeDate(ad, 1752, MonthSpec::Regular(9), 10)), "British gap");

        auto sweden = Lookup(*engine, "historic-sweden");
        ok &= ExpectTrue(!sweden->IsValid(sweden->MakeDate(ad, 1700, MonthSpec::Regular(2), 29)), "no 1700-02-29");
        ok &= ExpectTrue(sweden->IsValid(sweden->MakeDate(ad, 1712, MonthSpec::Regular(2), 30)), "1712-02-30 exists");
        int length = 0;
        ok &= ExpectStatus(sweden->LengthOfMonth(ad, 1712, MonthSpec::Regular(2), length), StatusCode::Ok, "feb 1712");
        ok &= ExpectTrue(length == 30, "February 1712 has 30 days");
        ok &= ExpectStatus(sweden->ToEpochDay(sweden->MakeDate(ad, 1712, MonthSpec::Regular(2), 30), day), StatusCode::Ok,
                           "1712-02-30");
        ok &= ExpectStatus(sweden->FromEpochDay(day + 1, next), StatusCode::Ok, "after 1712-02-30");
        ok &= ExpectTrue(next.month.number == 3 && next.day == 1, "followed by 1712-03-01");
        ok &= ExpectStatus(sweden->ToEpochDay(sweden->MakeDate(ad, 1753, MonthSpec::Regular(3), 1), day), StatusCode::Ok,
                           "1753-03-01");
        ok &= ExpectTrue(day == -79198, "Gregorian from 1753-03-01");

        auto russia = Lookup(*engine, "historic-RU");
        ok &= ExpectTrue(!russia->IsValid(russia->MakeDate(ad, 1918, MonthSpec::Regular(2), 1)), "Russian gap");
        ok &= ExpectStatus(russia->LengthOfMonth(ad, 1918, MonthSpec::Regular(2), length), StatusCode::Ok, "feb 1918");
        ok &= ExpectTrue(length == 15, "February 1918 has 15 days");

        CalendarSystemPtr rejected;
        ok &= ExpectStatus(engine->Calendar("historic-cutover=1500-01-01", rejected), StatusCode::OutOfRange,
                           "cutover before 1582");
        ok &= ExpectStatus(engine->Calendar("historic-XX", rejected), StatusCode::UnsupportedVariant, "unknown country");
        ok &= ExpectStatus(engine->Calendar("historic-julian:bogus", rejected), StatusCode::UnsupportedVariant,
                           "unknown modifier");
        ok &= ExpectStatus(engine->Calendar("historic-julian:new-year=EPIPHANY@500", rejected), StatusCode::OutOfRange,
                           "new year rule ending too early");
        return ok;
    }

    bool YearStartsAfterReformGapInJanuary() {
        auto engine = MakeEngine();
        if (!engine) {
            return false;
        }
        const int ad = almanac::HistoricCalendar::kEraAD;
        auto historic = Lookup(*engine, "historic-cutover=1700-01-11");
        bool ok = ExpectTrue(historic != nullptr, "january cutover");
        if (!ok) {
            return false;
        }
        ok &= ExpectTrue(!historic->IsValid(historic->MakeDate(ad, 1700, MonthSpec::Regular(1), 1)), "1700-01-01 skipped");
        EpochDay start = 0;
        ok &= ExpectStatus(historic->StartOfYear(ad, 1700, start), StatusCode::Ok, "start of 1700");
        ok &= ExpectTrue(start == -98605, "1700 starts on 1700-01-11");
        auto march = historic->MakeDate(ad, 1700, MonthSpec::Regular(3), 1);
        int dayOfYear = 0;
        ok &= ExpectStatus(historic->DayOfYear(march, dayOfYear), StatusCode::Ok, "day of year");
        ok &= ExpectTrue(dayOfYear == 50, "1700-03-01 is day 50");
        int length = 0;
        ok &= ExpectStatus(historic->LengthOfYear(ad, 1700, length), StatusCode::Ok, "1700");
        ok &= ExpectTrue(length == 355, "1700 has 355 days");
        ok &= ExpectStatus(historic->LengthOfYear(ad, 1699, length), StatusCode::Ok, "1699");
        ok &= ExpectTrue(length == 365, "1699 is a full Julian year");
        ok &= ExpectStatus(historic->LengthOfMonth(ad, 1700, MonthSpec::Regular(1), length), StatusCode::Ok, "january");
        ok &= ExpectTrue(length == 21, "January 1700 has 21 days");

        CalendarDate first;
        ok &= ExpectStatus(historic->Rules().FindInt(FieldId::DayOfYear)->WithValue(march, 1, false, first),
                           StatusCode::Ok, "set day of year");
        ok &= ExpectTrue(first == historic->MakeDate(ad, 1700, MonthSpec::Regular(1), 11), "day 1 is 1700-01-11");
        CalendarDate last;
        ok &= ExpectStatus(historic->Rules().FindInt(FieldId::DayOfYear)->WithValue(march, 355, false, last),
                           StatusCode::Ok, "last day of year");
        ok &= ExpectTrue(last == historic->MakeDate(ad, 1700, MonthSpec::Regular(12), 31), "day 355 is 1700-12-31");

        std::unique_ptr<almanac::WeekFieldEngine> weeks;
        ok &= ExpectStatus(almanac::WeekFieldEngine::Create(historic, almanac::WeekModel::Iso(), weeks), StatusCode::Ok,
                           "weeks");
        if (weeks) {
            int week = 0;
            ok &= ExpectStatus(weeks->Week(march, almanac::WeekPeriod::Year, week), StatusCode::Ok, "week of 1700-03-01");
            ok &= ExpectTrue(week == 8, "weeks count from the Monday 1700-01-11");
        }
        return ok;
    }

    bool AncientJulianLeapYearsApplyBeforeAD8() {
        almanac::ChronoHistory plain = almanac::ChronoHistory::ProlepticJulian();
        almanac::ChronoHistory ancient;
        bool ok = ExpectStatus(almanac::ChronoHistory::Parse("historic-julian:ancient-julian", ancient), StatusCode::Ok,
                               "ancient julian");
        ok &= ExpectTrue(ancient.HasAncientJulianLeapYears(), "flag set");
        ok &= ExpectTrue(ancient.IsValid(almanac::HistoricDay{-8, 2, 29}), "9 BC is leap");
        ok &= ExpectTrue(!ancient.IsValid(almanac::HistoricDay{-4, 2, 29}), "5 BC is not leap");
        ok &= ExpectTrue(plain.IsValid(almanac::HistoricDay{-4, 2, 29}), "proleptic 5 BC is leap");
        EpochDay day = 0;
        ok &= ExpectStatus(ancient.ToEpochDay(almanac::HistoricDay{8, 1, 1}, day), StatusCode::Ok, "AD 8");
        ok &= ExpectTrue(day == almanac::FromJulian(8, 1, 1), "regular from AD 8");
        ok &= ExpectTrue(ancient.MinimumEpochDay() == plain.MinimumEpochDay() + 1, "one leap day fewer before AD 8");
        for (EpochDay probe = ancient.MinimumEpochDay(); probe < day; probe += 97) {
            almanac::HistoricDay date{};
            EpochDay back = 0;
            ok &= ExpectStatus(ancient.FromEpochDay(probe, date), StatusCode::Ok, "ancient from epoch day");
            ok &= ExpectStatus(ancient.ToEpochDay(date, back), StatusCode::Ok, "ancient to epoch day");
            ok &= ExpectTrue(back == probe, "ancient round trip");
        }
        ok &= ExpectStatus(ancient.ToEpochDay(almanac::HistoricDay{-45, 12, 31}, day), StatusCode::OutOfRange,
                           "before 45 BC");
        return ok;
    }

    bool NewYearStrategyChangesDisplayedYear() {
        auto engine = MakeEngine();
        if (!engine) {
            return false;
        }
        auto system = Lookup(*engine, "historic-GB:new-year=MARIA_ANUNCIATA@1752");
        const auto &britain = static_cast<const almanac::HistoricCalendar &>(*system);
        const int ad = almanac::HistoricCalendar::kEraAD;
        int year = 0;
        bool ok = ExpectStatus(britain.DisplayedYear(britain.MakeDate(ad, 1751, MonthSpec::Regular(3), 24), year),
                               StatusCode::Ok, "before Lady Day");
        ok &= ExpectTrue(year == 1750, "still 1750 on March 24");
        ok &= ExpectStatus(britain.DisplayedYear(britain.MakeDate(ad, 1751, MonthSpec::Regular(3), 25), year),
                           StatusCode::Ok, "Lady Day");
        ok &= ExpectTrue(year == 1751, "1751 from March 25");
        ok &= ExpectStatus(britain.DisplayedYear(britain.MakeDate(ad, 1753, MonthSpec::Regular(2), 1), year),
                           StatusCode::Ok, "after the reform");
        ok &= ExpectTrue(year == 1753, "January style from 1752");

        almanac::NewYearStrategy strategy;
        ok &= ExpectStatus(strategy.Add(almanac::NewYearRule::ChristmasStyle, 1300), StatusCode::Ok, "christmas");
        ok &= ExpectTrue(strategy.DisplayedYear(almanac::HistoricDay{1200, 12, 25}) == 1201, "Christmas starts 1201");
        ok &= ExpectTrue(strategy.DisplayedYear(almanac::HistoricDay{1200, 12, 24}) == 1200, "Christmas eve");
        ok &= ExpectTrue(strategy.RuleFor(400) == almanac::NewYearRule::BeginOfJanuary, "January before 567");
        ok &= ExpectStatus(strategy.Add(almanac::NewYearRule::Epiphany, 1300), StatusCode::InvalidArgument,
                           "conflicting rule");
        ok &= ExpectTrue(almanac::EasterMarchDay(2024) == 53, "Julian Easter 2024 on April 22");
        ok &= ExpectTrue(strategy.ToString() == "BEGIN_OF_JANUARY@567,CHRISTMAS_STYLE@1300", "strategy text");
        return ok;
    }

    bool HistoricErasAndPreferences() {
        auto engine = MakeEngine();
        if (!engine) {
            return false;
        }
        auto system = Lookup(*engine, "historic-julian:era=BYZANTINE@0900-01-01/1453-05-29");
        const auto &historic = static_cast<const almanac::HistoricCalendar &>(*system);
        const int ad = almanac::HistoricCalendar::kEraAD;
        const int bc = almanac::HistoricCalendar::kEraBC;
        auto date = historic.MakeDate(ad, 1000, MonthSpec::Regular(6), 1);
        almanac::HistoricEra era = almanac::HistoricEra::AD;
        bool ok = ExpectStatus(historic.PreferredEra(date, era), StatusCode::Ok, "preferred era");
        ok &= ExpectTrue(era == almanac::HistoricEra::Byzantine, "Byzantine inside the range");
        int year = 0;
        ok &= ExpectStatus(historic.YearOfEra(date, almanac::HistoricEra::Byzantine, year), StatusCode::Ok, "byzantine");
        ok &= ExpectTrue(year == 6508, "AD 1000 is Byzantine 6508");
        ok &= ExpectStatus(historic.YearOfEra(date, almanac::HistoricEra::AbUrbeCondita, year), StatusCode::Ok, "auc");
        ok &= ExpectTrue(year == 1753, "AD 1000 is AUC 1753");
        ok &= ExpectStatus(historic.PreferredEra(historic.MakeDate(ad, 1500, MonthSpec::Regular(1), 1), era),
                           StatusCode::Ok, "outside range");
        ok &= ExpectTrue(era == almanac::HistoricEra::AD, "AD outside the range");

        auto bcDate = historic.MakeDate(bc, 1, MonthSpec::Regular(12), 31);
        EpochDay day = 0;
        ok &= ExpectStatus(historic.ToEpochDay(bcDate, day), StatusCode::Ok, "1 BC");
        CalendarDate next;
        ok &= ExpectStatus(historic.FromEpochDay(day + 1, next), StatusCode::Ok, "AD 1");
        ok &= ExpectTrue(next.era == ad && next.year == 1 && next.month.number == 1 && next.day == 1, "no year zero");
        ok &= ExpectTrue(historic.IsLeapYear(bc, 1), "1 BC is a Julian leap year");
        ok &= ExpectStatus(historic.ToEpochDay(historic.MakeDate(bc, 46, MonthSpec::Regular(1), 1), day),
                           StatusCode::OutOfRange, "46 BC");
        ok &= ExpectTrue(almanac::YearOfEra(almanac::HistoricEra::Hispanic, 1) == 39, "Spanish era");
        return ok;
    }

    bool JapaneseEraResolutionLeniency() {
        auto engine = MakeEngine();
        if (!engine) {
            return false;
        }
        auto japanese = Lookup(*engine, "japanese");
        using almanac::JapaneseCalendar;
        auto keio = japanese->MakeDate(JapaneseCalendar::kKeio, 4, MonthSpec::Regular(9), 8);
        EpochDay day = 0;
        bool ok = ExpectStatus(japanese->ToEpochDay(keio, day), StatusCode::Ok, "Keio 4/9/8");
        ok &= ExpectTrue(day == almanac::FromGregorian(1868, 10, 23), "first day of Meiji");
        CalendarDate resolved;
        ok &= ExpectStatus(japanese->ResolveEra(keio, Leniency::Smart, resolved), StatusCode::Ok, "smart");
        ok &= ExpectTrue(resolved == japanese->MakeDate(JapaneseCalendar::kMeiji, 1, MonthSpec::Regular(9), 8),
                         "Meiji 1/9/8");
        ok &= ExpectStatus(japanese->ResolveEra(keio, Leniency::Strict, resolved), StatusCode::EraMismatch, "strict");
        ok &= ExpectStatus(japanese->ResolveEra(keio, Leniency::Lax, resolved), StatusCode::Ok, "lax");
        ok &= ExpectTrue(resolved == keio, "lax keeps Keio");

        auto heisei = japanese->MakeDate(JapaneseCalendar::kHeisei, 1, MonthSpec::Regular(1), 7);
        ok &= ExpectStatus(japanese->ResolveEra(heisei, Leniency::Smart, resolved), StatusCode::Ok, "smart heisei");
        ok &= ExpectTrue(resolved == japanese->MakeDate(JapaneseCalendar::kShowa, 64, MonthSpec::Regular(1), 7),
                         "Showa 64/1/7");
        ok &= ExpectStatus(japanese->ResolveEra(heisei, Leniency::Strict, resolved), StatusCode::EraMismatch,
                           "strict heisei");
        ok &= ExpectStatus(japanese->ResolveEra(heisei, Leniency::Lax, resolved), StatusCode::Ok, "lax heisei");
        ok &= ExpectTrue(resolved == heisei, "lax keeps Heisei");
        return ok;
    }

    bool JapaneseLunisolarHandsOverToGregorian() {
        auto engine = MakeEngine();
        if (!engine) {
            return false;
        }
        auto japanese = Lookup(*engine, "japanese");
        using almanac::JapaneseCalendar;
        int length = 0;
        bool ok = ExpectStatus(japanese->LengthOfMonth(JapaneseCalendar::kMeiji, 5, MonthSpec::Regular(12), length),
                               StatusCode::Ok, "Meiji 5 month 12");
        ok &= ExpectTrue(length == 2, "last lunisolar month has two days");
        CalendarDate date;
        ok &= ExpectStatus(japanese->FromEpochDay(JapaneseCalendar::kGregorianStart, date), StatusCode::Ok, "1873");
        ok &= ExpectTrue(date == japanese->MakeDate(JapaneseCalendar::kMeiji, 6, MonthSpec::Regular(1), 1), "Meiji 6/1/1");
        ok &= ExpectTrue(japanese->IsValid(japanese->MakeDate(JapaneseCalendar::kMeiji, 1, MonthSpec::Leap(4), 1)),
                         "leap month in the lunisolar table");
        ok &= ExpectTrue(!japanese->IsValid(japanese->MakeDate(JapaneseCalendar::kMeiji, 6, MonthSpec::Leap(4), 1)),
                         "no leap months after 1872");
        ok &= ExpectTrue(!japanese->IsValid(japanese->MakeDate(JapaneseCalendar::kAnsei, 1, MonthSpec::Regular(1), 1)),
                         "Ansei lies before the supported range");
        auto reiwa = japanese->MakeDate(JapaneseCalendar::kReiwa, 2, MonthSpec::Regular(2), 29);
        ok &= ExpectTrue(japanese->IsValid(reiwa), "Reiwa 2 is a Gregorian leap year");

        const std::tuple<int, int, int> newYears[] = {{2, 2, 11}, {3, 2, 1}, {4, 2, 19}, {5, 2, 9}};
        for (const auto &entry: newYears) {
            EpochDay day = 0;
            auto newYear = japanese->MakeDate(JapaneseCalendar::kMeiji, std::get<0>(entry), MonthSpec::Regular(1), 1);
            ok &= ExpectStatus(japanese->ToEpochDay(newYear, day), StatusCode::Ok, "Meiji new year");
            ok &= ExpectTrue(day == almanac::FromGregorian(1867 + std::get<0>(entry), std::get<1>(entry),
                                                           std::get<2>(entry)),
                             "Meiji " + std::to_string(std::get<0>(entry)) + " new year");
        }
        ok &= ExpectTrue(japanese->IsValid(japanese->MakeDate(JapaneseCalendar::kMeiji, 3, MonthSpec::Leap(10), 29)),
                         "Meiji 3 has a leap tenth month");
        EpochDay monthStart = 0;
        ok &= ExpectStatus(japanese->ToEpochDay(japanese->MakeDate(JapaneseCalendar::kMeiji, 5, MonthSpec::Regular(12), 1),
                                                monthStart), StatusCode::Ok, "Meiji 5/12/1");
        ok &= ExpectTrue(monthStart == almanac::FromGregorian(1872, 12, 30), "last lunisolar month starts 1872-12-30");

        auto third = japanese->MakeDate(JapaneseCalendar::kMeiji, 5, MonthSpec::Regular(12), 3);
        ok &= ExpectTrue(!japanese->IsValid(third), "Meiji 5/12/3 does not exist");
        CalendarDate resolved;
        for (auto leniency: {Leniency::Smart, Leniency::Lax}) {
            ok &= ExpectStatus(japanese->ResolveEra(third, leniency, resolved), StatusCode::Ok, "lenient rollover");
            ok &= ExpectTrue(resolved == japanese->MakeDate(JapaneseCalendar::kMeiji, 6, MonthSpec::Regular(1), 1),
                             "Meiji 5/12/3 continues as Meiji 6/1/1");
        }
        ok &= ExpectStatus(engine->Resolve(japanese->MakeDate(JapaneseCalendar::kMeiji, 5, MonthSpec::Regular(12), 5),
                                           Leniency::Smart, resolved), StatusCode::Ok, "Meiji 5/12/5");
        ok &= ExpectTrue(resolved == japanese->MakeDate(JapaneseCalendar::kMeiji, 6, MonthSpec::Regular(1), 3),
                         "Meiji 5/12/5 continues as Meiji 6/1/3");
        ok &= ExpectStatus(japanese->ResolveEra(third, Leniency::Strict, resolved), StatusCode::InvalidDate,
                           "strict rejects the missing day");
        ok &= ExpectStatus(japanese->ResolveEra(japanese->MakeDate(JapaneseCalendar::kMeiji, 5, MonthSpec::Regular(12), 31),
                                                Leniency::Lax, resolved), StatusCode::InvalidDate,
                           "no lunar month has 31 days");
        ok &= ExpectStatus(japanese->ResolveEra(japanese->MakeDate(JapaneseCalendar::kMeiji, 5, MonthSpec::Regular(11), 31),
                                                Leniency::Lax, resolved), StatusCode::InvalidDate,
                           "only the final month rolls over");
        return ok;
    }

    bool EveryCalendarRoundTripsAndIsMonotonic() {
        auto engine = MakeEngine();
        if (!engine) {
            return false;
        }
        bool ok = true;
        for (const auto &variant: SampleVariants()) {
            auto system = Lookup(*engine, variant);
            if (!system) {
                return false;
            }
            EpochDay first = std::max<EpochDay>(system->MinimumEpochDay(), -800000);
            EpochDay last = std::min<EpochDay>(system->MaximumEpochDay(), 800000);
            bool hasPrevious = false;
            std::tuple<int, int, int> previous;
            for (EpochDay day = first; day <= last; day += 89) {
                CalendarDate date;
                auto status = system->FromEpochDay(day, date);
                if (!ExpectStatus(status, StatusCode::Ok, variant + " from epoch day " + std::to_string(day))) {
                    return false;
                }
                EpochDay back = 0;
                status = system->ToEpochDay(date, back);
                if (!ExpectStatus(status, StatusCode::Ok, variant + " to epoch day") ||
                    !ExpectTrue(back == day, variant + " round trip at " + std::to_string(day))) {
                    return false;
                }
                ok &= ExpectTrue(system->IsValid(date), variant + " produced date is valid");
                auto position = Position(*system, date);
                if (hasPrevious) {
                    ok &= ExpectTrue(previous < position, variant + " dates increase with the day");
                }
                previous = position;
                hasPrevious = true;
            }
            CalendarDate edge;
            ok &= ExpectStatus(system->FromEpochDay(system->MinimumEpochDay() - 1, edge), StatusCode::OutOfRange,
                               variant + " below minimum");
            ok &= ExpectStatus(system->FromEpochDay(system->MaximumEpochDay() + 1, edge), StatusCode::OutOfRange,
                               variant + " above maximum");
            EpochDay back = 0;
            ok &= ExpectStatus(system->FromEpochDay(system->MaximumEpochDay(), edge), StatusCode::Ok, variant + " maximum");
            ok &= ExpectStatus(system->ToEpochDay(edge, back), StatusCode::Ok, variant + " maximum back");
            ok &= ExpectTrue(back == system->MaximumEpochDay(), variant + " maximum round trip");
        }
        return ok;
    }

    bool MonthLengthsAddUpToYearLength() {
        auto engine = MakeEngine();
        if (!engine) {
            return false;
        }
        bool ok = true;
        for (const auto &variant: SampleVariants()) {
            auto system = Lookup(*engine, variant);
            if (!system) {
                return false;
            }
            for (EpochDay day: {system->MinimumEpochDay() + 400, EpochDay{18286}, EpochDay{-141000}}) {
                if (day < system->MinimumEpochDay() || day > system->MaximumEpochDay() - 400) {
                    continue;
                }
                CalendarDate date;
                ok &= ExpectStatus(system->FromEpochDay(day, date), StatusCode::Ok, variant + " sample");
                int months = system->MonthsInYear(date.era, date.year);
                int total = 0;
                for (int ordinal = 1; ordinal <= months; ++ordinal) {
                    MonthSpec month{};
                    int length = 0;
                    ok &= ExpectStatus(system->MonthAt(date.era, date.year, ordinal, month), StatusCode::Ok,
                                       variant + " month at");
                    ok &= ExpectStatus(system->LengthOfMonth(date.era, date.year, month, length), StatusCode::Ok,
                                       variant + " month length");
                    total += length;
                }
                int yearLength = 0;
                ok &= ExpectStatus(system->LengthOfYear(date.era, date.year, yearLength), StatusCode::Ok,
                                   variant + " year length");
                ok &= ExpectTrue(total == yearLength, variant + " months add up to the year");
                // The Coptic epagomenal thirteenth month occurs in every year.
                const bool lunisolar = system->Family() == almanac::CalendarFamily::Chinese ||
                                       system->Family() == almanac::CalendarFamily::Japanese;
                if (lunisolar && months > 12) {
                    ok &= ExpectTrue(system->IsLeapYear(date.era, date.year), variant + " thirteen months means leap");
                }
            }
        }
        return ok;
    }

    bool FieldRulesReadAndWriteFields() {
        auto engine = MakeEngine();
        if (!engine) {
            return false;
        }
        auto coptic = Lookup(*engine, "coptic");
        const auto &rules = coptic->Rules();
        auto date = coptic->MakeDate(0, 1737, MonthSpec::Regular(1), 1);
        const auto *dayOfMonth = rules.FindInt(FieldId::DayOfMonth);
        bool ok = ExpectTrue(dayOfMonth != nullptr, "day of month rule");
        if (!ok) {
            return false;
        }
        CalendarDate moved;
        ok &= ExpectStatus(dayOfMonth->WithValue(date, 31, false, moved), StatusCode::InvalidDate, "strict day 31");
        ok &= ExpectStatus(dayOfMonth->WithValue(date, 31, true, moved), StatusCode::Ok, "lenient day 31");
        ok &= ExpectTrue(moved == coptic->MakeDate(0, 1737, MonthSpec::Regular(2), 1), "rolls into the next month");

        almanac::FieldValue value;
        ok &= ExpectStatus(rules.Find(FieldId::Month)->MaximumAny(date, value), StatusCode::Ok, "month maximum");
        ok &= ExpectTrue(std::get<MonthSpec>(value) == MonthSpec::Regular(13), "thirteen months");
        ok &= ExpectStatus(rules.Find(FieldId::DayOfWeek)->GetAny(date, value), StatusCode::Ok, "day of week");
        ok &= ExpectTrue(std::get<int>(value) == static_cast<int>(almanac::Weekday::Friday), "2020-09-11 was a Friday");
        ok &= ExpectStatus(rules.Find(FieldId::Month)->WithAny(date, almanac::FieldValue{3}, false, moved),
                           StatusCode::InvalidArgument, "month needs a MonthSpec");
        ok &= ExpectStatus(rules.FindInt(FieldId::YearOfEra)->WithValue(date, 10000, false, moved), StatusCode::OutOfRange,
                           "year beyond range");

        CalendarDate ceiling;
        ok &= ExpectStatus(almanac::AtCeiling(rules, coptic->MakeDate(0, 1739, MonthSpec::Regular(5), 5),
                                              FieldId::YearOfEra, ceiling), StatusCode::Ok, "ceiling");
        ok &= ExpectTrue(ceiling == coptic->MakeDate(0, 1739, MonthSpec::Regular(13), 6), "last day of a leap year");
        CalendarDate floor;
        ok &= ExpectStatus(almanac::AtFloor(rules, ceiling, FieldId::YearOfEra, floor), StatusCode::Ok, "floor");
        ok &= ExpectTrue(floor == coptic->MakeDate(0, 1739, MonthSpec::Regular(1), 1), "first day of the year");

        auto chinese = Lookup(*engine, "chinese");
        CalendarDate newYear;
        ok &= ExpectStatus(chinese->FromEpochDay(18286, newYear), StatusCode::Ok, "chinese new year");
        int yearOfCycle = 0;
        ok &= ExpectStatus(chinese->Rules().FindInt(FieldId::YearOfCycle)->GetValue(newYear, yearOfCycle), StatusCode::Ok,
                           "year of cycle");
        ok &= ExpectTrue(yearOfCycle == 37, "year 37 of the cycle");
        int related = 0;
        ok &= ExpectStatus(chinese->Rules().FindInt(FieldId::RelatedGregorianYear)->GetValue(newYear, related),
                           StatusCode::Ok, "related year");
        ok &= ExpectTrue(related == 2020, "related Gregorian year 2020");
        ok &= ExpectTrue(coptic->Rules().Find(FieldId::YearOfCycle) == nullptr, "coptic has no cycle");
        return ok;
    }

    bool FieldRuleRegistrationReportsFailures() {
        auto engine = MakeEngine();
        if (!engine) {
            return false;
        }
        bool ok = true;
        for (const auto &variant: SampleVariants()) {
            auto system = Lookup(*engine, variant);
            if (!ExpectTrue(system != nullptr, variant + " available")) {
                return false;
            }
            ok &= ExpectStatus(system->RuleStatus(), StatusCode::Ok, variant + " rules registered");
            for (auto field: {FieldId::Era, FieldId::YearOfEra, FieldId::Month, FieldId::DayOfMonth, FieldId::DayOfYear,
                              FieldId::DayOfWeek}) {
                ok &= ExpectTrue(system->Rules().Find(field) != nullptr,
                                 variant + " has " + std::string(almanac::FieldName(field)));
            }
        }
        auto japanese = Lookup(*engine, "japanese");
        ok &= ExpectTrue(japanese->Rules().Find(FieldId::RelatedGregorianYear) != nullptr, "japanese related year");

        auto coptic = Lookup(*engine, "coptic");
        almanac::FieldRuleSet rules;
        ok &= ExpectStatus(almanac::InstallStandardRules(*coptic, rules), StatusCode::Ok, "fresh rule set");
        ok &= ExpectTrue(rules.Fields().size() == 6, "six standard fields");
        ok &= ExpectStatus(almanac::InstallStandardRules(*coptic, rules), StatusCode::AlreadyExists, "installed twice");
        ok &= ExpectTrue(rules.Fields().size() == 6, "duplicates are not added");
        ok &= ExpectStatus(rules.Register(nullptr), StatusCode::InvalidArgument, "null rule");

        std::unique_ptr<almanac::WeekFieldEngine> weeks;
        ok &= ExpectStatus(almanac::WeekFieldEngine::Create(nullptr, almanac::WeekModel::Iso(), weeks),
                           StatusCode::InvalidArgument, "week fields without a calendar");
        ok &= ExpectTrue(weeks == nullptr, "no week engine built");
        ok &= ExpectStatus(almanac::WeekFieldEngine::Create(coptic, almanac::WeekModel::Iso(), weeks), StatusCode::Ok,
                           "week fields");
        ok &= ExpectTrue(weeks != nullptr && weeks->Rules().Fields().size() == 5, "five week fields");
        return ok;
    }

    bool LeapMonthArithmetic() {
        auto engine = MakeEngine();
        if (!engine) {
            return false;
        }
        auto chinese = Lookup(*engine, "chinese");
        const int year2020 = 2020 + almanac::ChineseCalendar::kRelatedYearOffset;
        auto fourth = chinese->MakeDate(0, year2020, MonthSpec::Regular(4), 1);
        CalendarDate moved;
        bool ok = ExpectStatus(chinese->PlusMonths(fourth, 1, moved), StatusCode::Ok, "plus one month");
        ok &= ExpectTrue(moved.month == MonthSpec::Leap(4), "leap month counts as a month");
        ok &= ExpectStatus(chinese->PlusMonths(fourth, 2, moved), StatusCode::Ok, "plus two months");
        ok &= ExpectTrue(moved.month == MonthSpec::Regular(5), "then the fifth month");
        ok &= ExpectStatus(chinese->PlusMonths(fourth, -4, moved), StatusCode::Ok, "minus four months");
        ok &= ExpectTrue(moved.year == year2020 - 1 && moved.month == MonthSpec::Regular(12), "back into 2019");

        auto leap = chinese->MakeDate(0, year2020, MonthSpec::Leap(4), 1);
        ok &= ExpectStatus(chinese->PlusYears(leap, 1, moved), StatusCode::Ok, "plus one year");
        ok &= ExpectTrue(moved == chinese->MakeDate(0, year2020 + 1, MonthSpec::Regular(4), 1), "leap flag dropped");
        const auto *month = chinese->Rules().FindMonth();
        CalendarDate fallback;
        ok &= ExpectStatus(month->WithValue(moved, MonthSpec::Leap(4), false, fallback), StatusCode::InvalidDate,
                           "strict missing leap month");
        ok &= ExpectStatus(month->WithValue(moved, MonthSpec::Leap(4), true, fallback), StatusCode::Ok,
                           "lenient missing leap month");
        ok &= ExpectTrue(fallback.month == MonthSpec::Regular(4), "falls back to the regular month");

        auto coptic = Lookup(*engine, "coptic");
        auto epagomenal = coptic->MakeDate(0, 1739, MonthSpec::Regular(13), 6);
        ok &= ExpectStatus(coptic->PlusYears(epagomenal, 1, moved), StatusCode::Ok, "coptic plus year");
        ok &= ExpectTrue(moved.day == 5, "day clamped to the shorter month");
        ok &= ExpectStatus(coptic->PlusDays(epagomenal, coptic->MaximumEpochDay(), moved), StatusCode::OutOfRange,
                           "day overflow");
        return ok;
    }

    bool IsoWeeksAcrossYearBoundaries() {
        auto engine = MakeEngine();
        if (!engine) {
            return false;
        }
        auto gregorian = Lookup(*engine, "historic-gregorian");
        std::unique_ptr<almanac::WeekFieldEngine> iso;
        if (!ExpectStatus(almanac::WeekFieldEngine::Create(gregorian, almanac::WeekModel::Iso(), iso), StatusCode::Ok,
                          "iso weeks")) {
            return false;
        }
        const int ad = almanac::HistoricCalendar::kEraAD;
        auto newYear2021 = gregorian->MakeDate(ad, 2021, MonthSpec::Regular(1), 1);
        int week = 0;
        bool ok = ExpectStatus(iso->Week(newYear2021, almanac::WeekPeriod::Year, week), StatusCode::Ok, "2021-01-01");
        ok &= ExpectTrue(week == 53, "2021-01-01 belongs to week 53");
        ok &= ExpectStatus(iso->Week(gregorian->MakeDate(ad, 2019, MonthSpec::Regular(12), 30), almanac::WeekPeriod::Year,
                                    week), StatusCode::Ok, "2019-12-30");
        ok &= ExpectTrue(week == 1, "2019-12-30 belongs to week 1");
        int maximum = 0;
        ok &= ExpectStatus(iso->MaximumWeek(gregorian->MakeDate(ad, 2020, MonthSpec::Regular(6), 1),
                                           almanac::WeekPeriod::Year, maximum), StatusCode::Ok, "2020 weeks");
        ok &= ExpectTrue(maximum == 53, "2020 has 53 weeks");
        int bounded = 0;
        int minimum = 0;
        ok &= ExpectStatus(iso->BoundedWeek(newYear2021, almanac::WeekPeriod::Month, bounded), StatusCode::Ok, "bounded");
        ok &= ExpectTrue(bounded == 0, "bounded week 0");
        ok &= ExpectStatus(iso->BoundedWeekRange(newYear2021, almanac::WeekPeriod::Month, minimum, maximum), StatusCode::Ok,
                           "bounded range");
        ok &= ExpectTrue(minimum == 0 && maximum == 4, "January 2021 bounded weeks 0..4");

        std::unique_ptr<almanac::WeekFieldEngine> us;
        if (!ExpectStatus(almanac::WeekFieldEngine::Create(gregorian, almanac::WeekModelForCountry("US"), us),
                          StatusCode::Ok, "US weeks")) {
            return false;
        }
        ok &= ExpectStatus(us->Week(gregorian->MakeDate(ad, 2020, MonthSpec::Regular(12), 31), almanac::WeekPeriod::Year,
                                   week), StatusCode::Ok, "US 2020-12-31");
        ok &= ExpectTrue(week == 1, "US week containing January 1 is week 1");
        int local = 0;
        ok &= ExpectStatus(us->LocalDayOfWeek(newYear2021, local), StatusCode::Ok, "US local day");
        ok &= ExpectTrue(local == 6, "Friday is day 6 when weeks start on Sunday");
        bool weekend = true;
        ok &= ExpectStatus(us->IsWeekend(newYear2021, weekend), StatusCode::Ok, "weekend");
        ok &= ExpectTrue(!weekend, "Friday is a working day in the US");
        ok &= ExpectTrue(almanac::IsWeekend(almanac::WeekModelForCountry("SA"), almanac::Weekday::Friday),
                         "Friday is weekend in Saudi Arabia");
        return ok;
    }

    bool WeekFieldsAreConsistentOverYears() {
        auto engine = MakeEngine();
        if (!engine) {
            return false;
        }
        bool ok = true;
        for (const auto &variant: {std::string("historic-gregorian"), std::string("islamic-civil"),
                                   std::string("chinese")}) {
            auto system = Lookup(*engine, variant);
            std::unique_ptr<almanac::WeekFieldEngine> weeks;
            if (!ExpectStatus(almanac::WeekFieldEngine::Create(system, almanac::WeekModelForCountry("DE"), weeks),
                              StatusCode::Ok, variant + " weeks")) {
                return false;
            }
            int previousLocal = 0;
            for (EpochDay day = 16000; day < 17200; ++day) {
                CalendarDate date;
                ok &= ExpectStatus(system->FromEpochDay(day, date), StatusCode::Ok, variant + " date");
                int week = 0;
                int maximum = 0;
                int local = 0;
                ok &= ExpectStatus(weeks->Week(date, almanac::WeekPeriod::Year, week), StatusCode::Ok, variant + " week");
                ok &= ExpectStatus(weeks->MaximumWeek(date, almanac::WeekPeriod::Year, maximum), StatusCode::Ok,
                                   variant + " maximum week");
                ok &= ExpectTrue(week >= 1 && week <= maximum, variant + " week within bounds");
                ok &= ExpectStatus(weeks->LocalDayOfWeek(date, local), StatusCode::Ok, variant + " local day");
                if (previousLocal != 0) {
                    ok &= ExpectTrue(local == previousLocal % 7 + 1, variant + " local days advance");
                }
                previousLocal = local;
                CalendarDate same;
                ok &= ExpectStatus(weeks->WithWeek(date, almanac::WeekPeriod::Year, week, false, same), StatusCode::Ok,
                                   variant + " set same week");
                ok &= ExpectTrue(same == date, variant + " setting the current week is identity");
                if (!ok) {
                    return false;
                }
            }
        }
        return ok;
    }

    bool FirstWeekWidensAtCalendarStart() {
        auto engine = MakeEngine();
        if (!engine) {
            return false;
        }
        auto coptic = Lookup(*engine, "coptic");
        std::unique_ptr<almanac::WeekFieldEngine> weeks;
        if (!ExpectStatus(almanac::WeekFieldEngine::Create(coptic, almanac::WeekModel::Iso(), weeks), StatusCode::Ok,
                          "coptic weeks")) {
            return false;
        }
        int week = 0;
        bool ok = ExpectStatus(weeks->Week(coptic->MakeDate(0, 1, MonthSpec::Regular(1), 1), almanac::WeekPeriod::Year, week),
                               StatusCode::Ok, "first calendar day");
        ok &= ExpectTrue(week == 1, "days before the first week fall into week 1");
        ok &= ExpectStatus(weeks->Week(coptic->MakeDate(0, 1, MonthSpec::Regular(1), 11), almanac::WeekPeriod::Year, week),
                           StatusCode::Ok, "eleventh day");
        ok &= ExpectTrue(week == 2, "later weeks count normally");
        const auto *rule = weeks->Rules().FindInt(FieldId::WeekOfYear);
        ok &= ExpectTrue(rule != nullptr && rule->IsValid(coptic->MakeDate(0, 1, MonthSpec::Regular(1), 1), 1),
                         "week rule registered");
        return ok;
    }

    bool RegistryConvergesUnderConcurrency() {
        almanac::VariantRegistry registry(MakeConfig().resources, almanac::LoggingConfig{false, false});
        bool ok = ExpectStatus(registry.Initialize(), StatusCode::Ok, "initialize");
        ok &= ExpectTrue(registry.Contains("coptic") && registry.Contains("chinese"), "fixed calendars are eager");
        ok &= ExpectTrue(!registry.Contains("japanese"), "resource calendars are lazy");
        constexpr int kThreads = 8;
        std::vector<CalendarSystemPtr> results(kThreads);
        std::vector<StatusCode> statuses(kThreads, StatusCode::InternalError);
        std::vector<std::thread> threads;
        threads.reserve(kThreads);
        for (int i = 0; i < kThreads; ++i) {
            threads.emplace_back([&registry, &results, &statuses, i]() {
                statuses[i] = registry.Get("historic-sweden", results[i]);
            });
        }
        for (auto &thread: threads) {
            thread.join();
        }
        for (int i = 0; i < kThreads; ++i) {
            ok &= ExpectStatus(statuses[i], StatusCode::Ok, "concurrent get");
            ok &= ExpectTrue(results[i] && results[i].get() == results[0].get(), "one shared instance");
        }
        auto metrics = registry.GetMetrics();
        ok &= ExpectTrue(metrics.lookups >= kThreads, "lookups counted");
        CalendarSystemPtr missing;
        ok &= ExpectStatus(registry.Get("islamic-missing", missing), StatusCode::UnsupportedVariant, "missing resource");
        ok &= ExpectStatus(registry.Get("mayan", missing), StatusCode::UnsupportedVariant, "unknown variant");
        ok &= ExpectTrue(!registry.Contains("islamic-missing"), "failures are not cached");
        ok &= ExpectTrue(registry.GetMetrics().failedConstructions == metrics.failedConstructions + 2, "failures counted");
        return ok;
    }

    bool MonthTableRejectsMalformedResources() {
        almanac::MonthTable table;
        const std::string valid =
            "type=islamic-test\n"
            "iso-start=2000-01-01\n"
            "min=1\n"
            "max=2\n"
            "\"1\"=30 29 30 29 30 29 30 29 30 29 30 29\n"
            "\"2\"=30 29 30 29 30 29 30 29 30 29 30 29 30\n"
            "\"2.leap\"=6\n";
        bool ok = ExpectStatus(almanac::MonthTable::Parse(valid, "islamic-test", table), StatusCode::Ok, "valid table");
        ok &= ExpectTrue(table.MonthsInYear(2) == 13 && table.LeapMonth(2) == 6, "leap month row");
        ok &= ExpectTrue(table.LastDay() - table.FirstDay() + 1 == 354 + 384, "table covers both years");
        ok &= ExpectStatus(almanac::MonthTable::Parse(valid, "islamic-other", table), StatusCode::ResourceFormatError,
                           "type mismatch");
        const std::string missingYear =
            "type=islamic-test\niso-start=2000-01-01\nmin=1\nmax=2\n\"1\"=30 29 30 29 30 29 30 29 30 29 30 29\n";
        ok &= ExpectStatus(almanac::MonthTable::Parse(missingYear, "islamic-test", table), StatusCode::ResourceFormatError,
                           "missing year");
        const std::string badToken =
            "type=islamic-test\niso-start=2000-01-01\nmin=1\nmax=1\n\"1\"=30 29 30 x 30 29 30 29 30 29 30 29\n";
        ok &= ExpectStatus(almanac::MonthTable::Parse(badToken, "islamic-test", table), StatusCode::ResourceFormatError,
                           "bad token");
        const std::string shortRow =
            "type=islamic-test\niso-start=2000-01-01\nmin=1\nmax=1\n\"1\"=30 29 30 29 30 29 30 29 30 29 30\n";
        ok &= ExpectStatus(almanac::MonthTable::Parse(shortRow, "islamic-test", table), StatusCode::ResourceFormatError,
                           "eleven months");
        const std::string hugeSpan =
            "type=islamic-test\niso-start=2000-01-01\nmin=0\nmax=2000000000\n\"0\"=30 29 30 29 30 29 30 29 30 29 30 29\n";
        ok &= ExpectStatus(almanac::MonthTable::Parse(hugeSpan, "islamic-test", table), StatusCode::ResourceFormatError,
                           "span larger than the rows");
        const std::string fullIntRange =
            "type=islamic-test\niso-start=2000-01-01\nmin=-2147483648\nmax=2147483647\n"
            "\"0\"=30 29 30 29 30 29 30 29 30 29 30 29\n";
        ok &= ExpectStatus(almanac::MonthTable::Parse(fullIntRange, "islamic-test", table), StatusCode::ResourceFormatError,
                           "span across the whole int range");
        const std::string lastYears =
            "type=islamic-test\niso-start=2000-01-01\nmin=2147483646\nmax=2147483647\n"
            "\"2147483646\"=30 29 30 29 30 29 30 29 30 29 30 29\n";
        ok &= ExpectStatus(almanac::MonthTable::Parse(lastYears, "islamic-test", table), StatusCode::ResourceFormatError,
                           "missing row at the top of the int range");
        ok &= ExpectStatus(almanac::MonthTable::Load("/nonexistent/islamic-test.txt", "islamic-test", table),
                           StatusCode::NotFound, "missing file");
        return ok;
    }

    bool EraResolverValidatesTables() {
        almanac::EraResolver resolver;
        std::vector<almanac::EraRecord> unordered = {
            {0, "Later", 100, 2000},
            {1, "Earlier", 50, 1990}
        };
        bool ok = ExpectStatus(almanac::EraResolver::Build(unordered, resolver), StatusCode::InvalidArgument, "order");
        std::vector<almanac::EraRecord> duplicate = {
            {0, "First", 50, 1990},
            {0, "Second", 100, 2000}
        };
        ok &= ExpectStatus(almanac::EraResolver::Build(duplicate, resolver), StatusCode::InvalidArgument, "duplicate id");
        ok &= ExpectStatus(almanac::EraResolver::Build(almanac::JapaneseCalendar::NengoRecords(), resolver),
                           StatusCode::Ok, "nengo table");
        const auto *meiji = resolver.ById(almanac::JapaneseCalendar::kMeiji);
        ok &= ExpectTrue(meiji != nullptr && resolver.Next(*meiji)->id == almanac::JapaneseCalendar::kTaisho, "next era");
        ok &= ExpectTrue(resolver.Previous(*meiji)->id == almanac::JapaneseCalendar::kKeio, "previous era");
        ok &= ExpectTrue(resolver.Previous(resolver.Records().front()) == nullptr, "nothing before Ansei");
        ok &= ExpectTrue(resolver.Next(resolver.Records().back()) == nullptr, "nothing after Reiwa");
        const almanac::EraRecord detached = *meiji;
        ok &= ExpectTrue(resolver.Next(detached) == nullptr && resolver.Previous(detached) == nullptr,
                         "a copied record has no neighbours");
        int era = 0;
        ok &= ExpectStatus(resolver.Resolve(42, 0, 1970, Leniency::Smart, era), StatusCode::InvalidArgument,
                           "unknown era");
        ok &= ExpectStatus(resolver.Resolve(almanac::JapaneseCalendar::kHeisei, 0, 1970, Leniency::Smart, era),
                           StatusCode::Ok, "smart resolve");
        ok &= ExpectTrue(era == almanac::JapaneseCalendar::kShowa, "1970 is Showa");
        return ok;
    }

    bool CodecRoundTripsAndRejectsDamage() {
        auto engine = MakeEngine();
        if (!engine) {
            return false;
        }
        auto coptic = Lookup(*engine, "coptic");
        auto date = coptic->MakeDate(0, 1739, MonthSpec::Regular(13), 6);
        std::vector<std::uint8_t> bytes;
        bool ok = ExpectStatus(engine->Encode(date, bytes), StatusCode::Ok, "encode");
        ok &= ExpectTrue(bytes.size() == 4 + 4 + 1 + 4 + 6 + 4 + 4 + 4 + 1 + 4, "record size");
        ok &= ExpectTrue(bytes[0] == 'A' && bytes[1] == 'L' && bytes[2] == 'M' && bytes[3] == 'D', "magic");
        ok &= ExpectTrue(bytes[4] == 1 && bytes[5] == 0 && bytes[8] == 1, "version and family tag");
        CalendarDate decoded;
        ok &= ExpectStatus(engine->Decode(bytes, decoded), StatusCode::Ok, "decode");
        ok &= ExpectTrue(decoded == date, "decoded date");

        auto damaged = bytes;
        damaged[0] = 'X';
        ok &= ExpectStatus(almanac::DateCodec::Decode(damaged, decoded), StatusCode::InvalidArgument, "bad magic");
        damaged = bytes;
        damaged[4] = 2;
        ok &= ExpectStatus(almanac::DateCodec::Decode(damaged, decoded), StatusCode::InvalidArgument, "bad version");
        damaged = bytes;
        damaged[8] = 0;
        ok &= ExpectStatus(almanac::DateCodec::Decode(damaged, decoded), StatusCode::InvalidArgument, "bad tag");
        damaged = bytes;
        damaged.pop_back();
        ok &= ExpectStatus(almanac::DateCodec::Decode(damaged, decoded), StatusCode::InvalidArgument, "truncated");
        damaged = bytes;
        damaged.push_back(0);
        ok &= ExpectStatus(almanac::DateCodec::Decode(damaged, decoded), StatusCode::InvalidArgument, "trailing byte");

        auto invalid = coptic->MakeDate(0, 1740, MonthSpec::Regular(13), 6);
        ok &= ExpectStatus(engine->Encode(invalid, bytes), StatusCode::InvalidDate, "engine refuses invalid dates");
        ok &= ExpectStatus(almanac::DateCodec::Encode(invalid, bytes), StatusCode::Ok, "codec alone does not validate");
        ok &= ExpectStatus(engine->Decode(bytes, decoded), StatusCode::InvalidDate, "engine validates decoded dates");
        return ok;
    }

    bool EngineConvertsBetweenCalendars() {
        auto engine = MakeEngine();
        if (!engine) {
            return false;
        }
        auto coptic = Lookup(*engine, "coptic");
        CalendarDate julian;
        bool ok = ExpectStatus(engine->Convert(coptic->MakeDate(0, 1, MonthSpec::Regular(1), 1), "historic-julian", julian),
                               StatusCode::Ok, "coptic to julian");
        ok &= ExpectTrue(julian.year == 284 && julian.month.number == 8 && julian.day == 29, "Julian 284-08-29");
        CalendarDate hijri;
        ok &= ExpectStatus(engine->Convert(julian, "islamic-umalqura", hijri), StatusCode::OutOfRange,
                           "outside the Umm al-Qura table");
        CalendarDate chinese;
        ok &= ExpectStatus(engine->FromEpochDay("chinese", 18286, chinese), StatusCode::Ok, "chinese");
        CalendarDate japanese;
        ok &= ExpectStatus(engine->Convert(chinese, "japanese", japanese), StatusCode::Ok, "chinese to japanese");
        ok &= ExpectTrue(japanese == Lookup(*engine, "japanese")->MakeDate(almanac::JapaneseCalendar::kReiwa, 2,
                                                                            MonthSpec::Regular(1), 25), "Reiwa 2/1/25");
        auto foreign = chinese;
        foreign.family = almanac::CalendarFamily::Coptic;
        EpochDay day = 0;
        ok &= ExpectStatus(engine->ToEpochDay(foreign, day), StatusCode::InvalidArgument, "family mismatch");
        CalendarSystemPtr history;
        ok &= ExpectStatus(engine->DefaultHistory(history), StatusCode::Ok, "default history");
        ok &= ExpectTrue(history->Variant() == "historic-first-reform", "first reform by default");
        return ok;
    }

    bool EngineConfigurationDrivesBehaviour() {
        auto config = almanac::MakeDefaultConfig();
        bool ok = ExpectTrue(config.defaultLeniency == Leniency::Smart, "smart by default");
        ok &= ExpectTrue(config.defaultHistory == "historic-first-reform", "default history");
        ok &= ExpectTrue(config.weekCountry.empty(), "ISO weeks by default");
        auto engine = MakeEngine();
        if (!engine) {
            return false;
        }
        ok &= ExpectTrue(engine->DefaultWeekModel() == almanac::WeekModel::Iso(), "ISO week model");
        auto japanese = Lookup(*engine, "japanese");
        auto keio = japanese->MakeDate(almanac::JapaneseCalendar::kKeio, 4, MonthSpec::Regular(9), 8);
        CalendarDate resolved;
        ok &= ExpectStatus(engine->Resolve(keio, resolved), StatusCode::Ok, "smart by default");
        ok &= ExpectTrue(resolved.era == almanac::JapaneseCalendar::kMeiji, "resolved to Meiji");

        auto strict = MakeConfig();
        strict.defaultLeniency = Leniency::Strict;
        strict.weekCountry = "US";
        strict.featureFlags.push_back(std::string(almanac::kFlagEagerHistory));
        ok &= ExpectStatus(engine->Reconfigure(strict), StatusCode::Ok, "reconfigure");
        ok &= ExpectTrue(engine->Registry().Contains("historic-first-reform"), "eager history flag");
        ok &= ExpectStatus(engine->Resolve(keio, resolved), StatusCode::EraMismatch, "strict after reconfigure");
        ok &= ExpectTrue(engine->DefaultWeekModel().firstDayOfWeek == almanac::Weekday::Sunday, "US weeks");

        auto broken = MakeConfig();
        broken.resources.preload.push_back("islamic-nowhere");
        ok &= ExpectStatus(engine->Reconfigure(broken), StatusCode::UnsupportedVariant, "bad preload");
        ok &= ExpectTrue(engine->Config().defaultLeniency == Leniency::Strict, "failed reconfigure keeps config");
        std::unique_ptr<AlmanacEngine> failed;
        ok &= ExpectStatus(AlmanacEngine::Create(broken, failed), StatusCode::UnsupportedVariant, "bad create");
        ok &= ExpectTrue(!failed, "no engine on failure");

        auto missingData = MakeConfig();
        missingData.resources.directory = "/nonexistent";
        std::unique_ptr<AlmanacEngine> lean;
        ok &= ExpectStatus(AlmanacEngine::Create(missingData, lean), StatusCode::Ok, "fixed calendars need no data");
        CalendarSystemPtr japaneseMissing;
        ok &= ExpectStatus(lean->Calendar("japanese", japaneseMissing), StatusCode::UnsupportedVariant,
                           "japanese needs its resource");
        return ok;
    }

    struct TestCase {
        const char *name;
        bool (*fn)();
    };
}

int main() {
    std::vector<TestCase> tests{
        {"CopticEpochMapsToFirstDay", CopticEpochMapsToFirstDay},
        {"IndianYearsFollowGregorianLeapYears", IndianYearsFollowGregorianLeapYears},
        {"TabularHijriStartsAtCivilEpoch", TabularHijriStartsAtCivilEpoch},
        {"TabularHijriAdjustmentShiftsMapping", TabularHijriAdjustmentShiftsMapping},
        {"ChineseNewYear2020", ChineseNewYear2020},
        {"ChineseTableMatchesObservatoryDates", ChineseTableMatchesObservatoryDates},
        {"UmalquraRejectsYearsOutsideTable", UmalquraRejectsYearsOutsideTable},
        {"FirstReformSkipsTenDays", FirstReformSkipsTenDays},
        {"HistoricVariantsFollowRegionalReforms", HistoricVariantsFollowRegionalReforms},
        {"YearStartsAfterReformGapInJanuary", YearStartsAfterReformGapInJanuary},
        {"AncientJulianLeapYearsApplyBeforeAD8", AncientJulianLeapYearsApplyBeforeAD8},
        {"NewYearStrategyChangesDisplayedYear", NewYearStrategyChangesDisplayedYear},
        {"HistoricErasAndPreferences", HistoricErasAndPreferences},
        {"JapaneseEraResolutionLeniency", JapaneseEraResolutionLeniency},
        {"JapaneseLunisolarHandsOverToGregorian", JapaneseLunisolarHandsOverToGregorian},
        {"EveryCalendarRoundTripsAndIsMonotonic", EveryCalendarRoundTripsAndIsMonotonic},
        {"MonthLengthsAddUpToYearLength", MonthLengthsAddUpToYearLength},
        {"FieldRulesReadAndWriteFields", FieldRulesReadAndWriteFields},
        {"FieldRuleRegistrationReportsFailures", FieldRuleRegistrationReportsFailures},
        {"LeapMonthArithmetic", LeapMonthArithmetic},
        {"IsoWeeksAcrossYearBoundaries", IsoWeeksAcrossYearBoundaries},
        {"WeekFieldsAreConsistentOverYears", WeekFieldsAreConsistentOverYears},
        {"FirstWeekWidensAtCalendarStart", FirstWeekWidensAtCalendarStart},
        {"RegistryConvergesUnderConcurrency", RegistryConvergesUnderConcurrency},
        {"MonthTableRejectsMalformedResources", MonthTableRejectsMalformedResources},
        {"EraResolverValidatesTables", EraResolverValidatesTables},
        {"CodecRoundTripsAndRejectsDamage", CodecRoundTripsAndRejectsDamage},
        {"EngineConvertsBetweenCalendars", EngineConvertsBetweenCalendars},
        {"EngineConfigurationDrivesBehaviour", EngineConfigurationDrivesBehaviour}
    };

    std::size_t passed = 0;
    for (const auto &test: tests) {
        std::cout << "Running " << test.name << std::endl;
        if (test.fn()) {
            ++passed;
            std::cout << "  [PASS]" << std::endl;
        } else {
            std::cout << "  [FAIL]" << std::endl;
            std::cout << "Executed " << passed << " / " << tests.size() << " tests" << std::endl;
            return 1;
        }
    }

    std::cout << "Executed " << passed << " / " << tests.size() << " tests" << std::endl;
    return 0;
}
