#include "almanac/calendars/coptic_calendar.h"

namespace almanac {
    namespace {
        constexpr int kMonthsPerYear = 13;
        constexpr int kDaysPerMonth = 30;
    }

    CopticCalendar::CopticCalendar() = default;

    CalendarFamily CopticCalendar::Family() const noexcept {
        return CalendarFamily::Coptic;
    }

    std::string_view CopticCalendar::Variant() const noexcept {
        return "coptic";
    }

    std::string_view CopticCalendar::Summary() const noexcept {
        return "Coptic (Anno Martyrum), twelve months of 30 days and an epagomenal month";
    }

    EpochDay CopticCalendar::StartOf(int year) noexcept {
        return kEpochDay + 365 * static_cast<EpochDay>(year - 1) + FloorDiv(year, 4);
    }

    StatusCode CopticCalendar::ToEpochDay(const CalendarDate &date, EpochDay &outDay) const {
        auto status = CheckFields(date);
        if (status != StatusCode::Ok) {
            return status;
        }
        outDay = StartOf(date.year) + kDaysPerMonth * (date.month.number - 1) + date.day - 1;
        return StatusCode::Ok;
    }

    StatusCode CopticCalendar::FromEpochDay(EpochDay day, CalendarDate &outDate) const {
        if (day < MinimumEpochDay() || day > MaximumEpochDay()) {
            return StatusCode::OutOfRange;
        }
        auto year = static_cast<int>(FloorDiv(4 * (day - kEpochDay) + 1463, 1461));
        auto offset = static_cast<int>(day - StartOf(year));
        int month = offset / kDaysPerMonth + 1;
        int dayOfMonth = offset % kDaysPerMonth + 1;
        outDate = MakeDate(kEraAnnoMartyrum, year, MonthSpec::Regular(month), dayOfMonth);
        return StatusCode::Ok;
    }

    StatusCode CopticCalendar::LengthOfMonth(int era, int year, MonthSpec month, int &outLength) const {
        if (era != kEraAnnoMartyrum) {
            return StatusCode::InvalidDate;
        }
        if (year < kMinYear || year > kMaxYear) {
            return StatusCode::OutOfRange;
        }
        if (month.leap || month.number < 1 || month.number > kMonthsPerYear) {
            return StatusCode::InvalidDate;
        }
        if (month.number < kMonthsPerYear) {
            outLength = kDaysPerMonth;
        } else {
            outLength = IsLeapYear(era, year) ? 6 : 5;
        }
        return StatusCode::Ok;
    }

    StatusCode CopticCalendar::LengthOfYear(int era, int year, int &outLength) const {
        if (era != kEraAnnoMartyrum) {
            return StatusCode::InvalidDate;
        }
        if (year < kMinYear || year > kMaxYear) {
            return StatusCode::OutOfRange;
        }
        outLength = IsLeapYear(era, year) ? 366 : 365;
        return StatusCode::Ok;
    }

    EpochDay CopticCalendar::MinimumEpochDay() const noexcept {
        return kEpochDay;
    }

    EpochDay CopticCalendar::MaximumEpochDay() const noexcept {
        return StartOf(kMaxYear + 1) - 1;
    }

    StatusCode CopticCalendar::YearRange(int era, int &outMin, int &outMax) const {
        if (era != kEraAnnoMartyrum) {
            return StatusCode::InvalidDate;
        }
        outMin = kMinYear;
        outMax = kMaxYear;
        return StatusCode::Ok;
    }

    bool CopticCalendar::IsLeapYear(int, int year) const {
        return FloorMod(year, 4) == 3;
    }

    int CopticCalendar::MonthsInYear(int, int) const {
        return kMonthsPerYear;
    }
}
