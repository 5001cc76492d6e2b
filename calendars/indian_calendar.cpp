#include "almanac/calendars/indian_calendar.h"

namespace almanac {
    namespace {
        constexpr int kLastYearMonths = 10;
        constexpr int kLastYearFinalMonthDays = 10;
        constexpr int kLastYearDays = 285;
    }

    IndianCalendar::IndianCalendar() = default;

    CalendarFamily IndianCalendar::Family() const noexcept {
        return CalendarFamily::Indian;
    }

    std::string_view IndianCalendar::Variant() const noexcept {
        return "indian";
    }

    std::string_view IndianCalendar::Summary() const noexcept {
        return "Indian national calendar (Saka era)";
    }

    EpochDay IndianCalendar::StartOf(int year) noexcept {
        int gregorianYear = year + kGregorianOffset;
        return FromGregorian(gregorianYear, 3, IsGregorianLeap(gregorianYear) ? 21 : 22);
    }

    int IndianCalendar::FullMonthLength(int year, int month) noexcept {
        if (month == 1) {
            return IsGregorianLeap(year + kGregorianOffset) ? 31 : 30;
        }
        return month <= 6 ? 31 : 30;
    }

    StatusCode IndianCalendar::ToEpochDay(const CalendarDate &date, EpochDay &outDay) const {
        auto status = CheckFields(date);
        if (status != StatusCode::Ok) {
            return status;
        }
        EpochDay day = StartOf(date.year);
        for (int month = 1; month < date.month.number; ++month) {
            day += FullMonthLength(date.year, month);
        }
        outDay = day + date.day - 1;
        return StatusCode::Ok;
    }

    StatusCode IndianCalendar::FromEpochDay(EpochDay day, CalendarDate &outDate) const {
        if (day < MinimumEpochDay() || day > MaximumEpochDay()) {
            return StatusCode::OutOfRange;
        }
        int gregorianYear = 0;
        int gregorianMonth = 0;
        int gregorianDay = 0;
        ToGregorian(day, gregorianYear, gregorianMonth, gregorianDay);
        int year = gregorianYear - kGregorianOffset;
        if (day < StartOf(year)) {
            --year;
        }
        auto remaining = static_cast<int>(day - StartOf(year));
        int month = 1;
        while (remaining >= FullMonthLength(year, month)) {
            remaining -= FullMonthLength(year, month);
            ++month;
        }
        outDate = MakeDate(kEraSaka, year, MonthSpec::Regular(month), remaining + 1);
        return StatusCode::Ok;
    }

    StatusCode IndianCalendar::LengthOfMonth(int era, int year, MonthSpec month, int &outLength) const {
        if (era != kEraSaka) {
            return StatusCode::InvalidDate;
        }
        if (year < kMinYear || year > kMaxYear) {
            return StatusCode::OutOfRange;
        }
        if (month.leap || month.number < 1 || month.number > MonthsInYear(era, year)) {
            return StatusCode::InvalidDate;
        }
        if (year == kMaxYear && month.number == kLastYearMonths) {
            outLength = kLastYearFinalMonthDays;
        } else {
            outLength = FullMonthLength(year, month.number);
        }
        return StatusCode::Ok;
    }

    StatusCode IndianCalendar::LengthOfYear(int era, int year, int &outLength) const {
        if (era != kEraSaka) {
            return StatusCode::InvalidDate;
        }
        if (year < kMinYear || year > kMaxYear) {
            return StatusCode::OutOfRange;
        }
        if (year == kMaxYear) {
            outLength = kLastYearDays;
        } else {
            outLength = IsLeapYear(era, year) ? 366 : 365;
        }
        return StatusCode::Ok;
    }

    EpochDay IndianCalendar::MinimumEpochDay() const noexcept {
        return StartOf(kMinYear);
    }

    EpochDay IndianCalendar::MaximumEpochDay() const noexcept {
        return StartOf(kMaxYear) + kLastYearDays - 1;
    }

    StatusCode IndianCalendar::YearRange(int era, int &outMin, int &outMax) const {
        if (era != kEraSaka) {
            return StatusCode::InvalidDate;
        }
        outMin = kMinYear;
        outMax = kMaxYear;
        return StatusCode::Ok;
    }

    bool IndianCalendar::IsLeapYear(int, int year) const {
        return IsGregorianLeap(year + kGregorianOffset);
    }

    int IndianCalendar::MonthsInYear(int, int year) const {
        return year == kMaxYear ? kLastYearMonths : 12;
    }
}
