#include "almanac/calendars/hijri_tabular_calendar.h"

#include <algorithm>
#include <charconv>

namespace almanac {
    namespace {
        struct BaseVariant {
            std::string_view name;
            LeapPattern pattern;
            bool civil;
        };

        constexpr LeapPattern kPatternA{{2, 5, 7, 10, 13, 15, 18, 21, 24, 26, 29}};
        constexpr LeapPattern kPatternB{{2, 5, 7, 10, 13, 16, 18, 21, 24, 26, 29}};
        constexpr LeapPattern kPatternFatimid{{2, 5, 8, 10, 13, 16, 19, 21, 24, 27, 29}};
        constexpr LeapPattern kPatternHabashAlHasib{{2, 5, 8, 11, 13, 16, 19, 21, 24, 27, 30}};

        constexpr BaseVariant kBaseVariants[] = {
            {"islamic-eastc", kPatternA, true},
            {"islamic-easta", kPatternA, false},
            {"islamic-civil", kPatternB, true},
            {"islamic-tbla", kPatternB, false},
            {"islamic-fatimidc", kPatternFatimid, true},
            {"islamic-fatimida", kPatternFatimid, false},
            {"islamic-habashalhasibc", kPatternHabashAlHasib, true},
            {"islamic-habashalhasiba", kPatternHabashAlHasib, false}
        };

        const BaseVariant *FindBase(std::string_view name) noexcept {
            for (const auto &base: kBaseVariants) {
                if (base.name == name) {
                    return &base;
                }
            }
            return nullptr;
        }

        // Months alternate 30 and 29 days starting with 30.
        int DaysBeforeMonth(int month) noexcept {
            return 29 * (month - 1) + month / 2;
        }
    }

    bool LeapPattern::Contains(int yearOfCycle) const noexcept {
        return std::binary_search(years.begin(), years.end(), yearOfCycle);
    }

    HijriTabularCalendar::HijriTabularCalendar(std::string base, const LeapPattern &pattern, EpochDay epoch, int adjustment)
        : m_Base(std::move(base)),
          m_Variant(CanonicalVariant(m_Base, adjustment)),
          m_Pattern(pattern),
          m_Epoch(epoch),
          m_Adjustment(adjustment) {
    }

    StatusCode HijriTabularCalendar::ParseVariant(std::string_view variant, std::string &outBase, int &outAdjustment) {
        auto colon = variant.find(':');
        auto base = variant.substr(0, colon);
        if (!IsKnownBase(base)) {
            return StatusCode::UnsupportedVariant;
        }
        int adjustment = 0;
        if (colon != std::string_view::npos) {
            auto text = variant.substr(colon + 1);
            if (!text.empty() && text.front() == '+') {
                text.remove_prefix(1);
            }
            if (text.empty()) {
                return StatusCode::UnsupportedVariant;
            }
            auto result = std::from_chars(text.data(), text.data() + text.size(), adjustment);
            if (result.ec == std::errc::result_out_of_range) {
                return StatusCode::OutOfRange;
            }
            if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
                return StatusCode::UnsupportedVariant;
            }
            if (adjustment < -kMaxAdjustment || adjustment > kMaxAdjustment) {
                return StatusCode::OutOfRange;
            }
        }
        outBase = std::string(base);
        outAdjustment = adjustment;
        return StatusCode::Ok;
    }

    std::string HijriTabularCalendar::CanonicalVariant(std::string_view base, int adjustment) {
        std::string name(base);
        if (adjustment > 0) {
            name += ":+" + std::to_string(adjustment);
        } else if (adjustment < 0) {
            name += ":" + std::to_string(adjustment);
        }
        return name;
    }

    bool HijriTabularCalendar::IsKnownBase(std::string_view base) noexcept {
        return FindBase(base) != nullptr;
    }

    StatusCode HijriTabularCalendar::Create(std::string_view variant, std::unique_ptr<CalendarSystem> &outCalendar) {
        std::string base;
        int adjustment = 0;
        auto status = ParseVariant(variant, base, adjustment);
        if (status != StatusCode::Ok) {
            return status;
        }
        const BaseVariant *entry = FindBase(base);
        EpochDay epoch = entry->civil ? kCivilStart : kAstronomicalStart;
        outCalendar.reset(new HijriTabularCalendar(std::move(base), entry->pattern, epoch, adjustment));
        return StatusCode::Ok;
    }

    CalendarFamily HijriTabularCalendar::Family() const noexcept {
        return CalendarFamily::HijriTabular;
    }

    std::string_view HijriTabularCalendar::Variant() const noexcept {
        return m_Variant;
    }

    std::string_view HijriTabularCalendar::Summary() const noexcept {
        return "Tabular Islamic calendar with a 30-year leap cycle";
    }

    std::string_view HijriTabularCalendar::Base() const noexcept {
        return m_Base;
    }

    int HijriTabularCalendar::Adjustment() const noexcept {
        return m_Adjustment;
    }

    EpochDay HijriTabularCalendar::Epoch() const noexcept {
        return m_Epoch;
    }

    bool HijriTabularCalendar::IsLeap(int year) const noexcept {
        return m_Pattern.Contains((year - 1) % kCycleYears + 1);
    }

    EpochDay HijriTabularCalendar::StartOf(int year) const noexcept {
        int completedCycles = (year - 1) / kCycleYears;
        int yearOfCycle = (year - 1) % kCycleYears + 1;
        EpochDay day = m_Epoch + static_cast<EpochDay>(completedCycles) * kCycleDays;
        for (int y = 1; y < yearOfCycle; ++y) {
            day += m_Pattern.Contains(y) ? 355 : 354;
        }
        return day;
    }

    StatusCode HijriTabularCalendar::ToEpochDay(const CalendarDate &date, EpochDay &outDay) const {
        auto status = CheckFields(date);
        if (status != StatusCode::Ok) {
            return status;
        }
        outDay = StartOf(date.year) + DaysBeforeMonth(date.month.number) + date.day - 1 - m_Adjustment;
        return StatusCode::Ok;
    }

    StatusCode HijriTabularCalendar::FromEpochDay(EpochDay day, CalendarDate &outDate) const {
        if (day < MinimumEpochDay() || day > MaximumEpochDay()) {
            return StatusCode::OutOfRange;
        }
        EpochDay offset = day + m_Adjustment - m_Epoch;
        auto cycle = static_cast<int>(offset / kCycleDays);
        auto remaining = static_cast<int>(offset % kCycleDays);
        int yearOfCycle = 1;
        while (yearOfCycle < kCycleYears) {
            int length = m_Pattern.Contains(yearOfCycle) ? 355 : 354;
            if (remaining < length) {
                break;
            }
            remaining -= length;
            ++yearOfCycle;
        }
        int year = cycle * kCycleYears + yearOfCycle;
        int month = 1;
        while (month < 12 && remaining >= DaysBeforeMonth(month + 1)) {
            ++month;
        }
        outDate = MakeDate(kEraAnnoHegirae, year, MonthSpec::Regular(month), remaining - DaysBeforeMonth(month) + 1);
        return StatusCode::Ok;
    }

    StatusCode HijriTabularCalendar::LengthOfMonth(int era, int year, MonthSpec month, int &outLength) const {
        if (era != kEraAnnoHegirae) {
            return StatusCode::InvalidDate;
        }
        if (year < kMinYear || year > kMaxYear) {
            return StatusCode::OutOfRange;
        }
        if (month.leap || month.number < 1 || month.number > 12) {
            return StatusCode::InvalidDate;
        }
        if (month.number == 12) {
            outLength = IsLeap(year) ? 30 : 29;
        } else {
            outLength = month.number % 2 == 1 ? 30 : 29;
        }
        return StatusCode::Ok;
    }

    StatusCode HijriTabularCalendar::LengthOfYear(int era, int year, int &outLength) const {
        if (era != kEraAnnoHegirae) {
            return StatusCode::InvalidDate;
        }
        if (year < kMinYear || year > kMaxYear) {
            return StatusCode::OutOfRange;
        }
        outLength = IsLeap(year) ? 355 : 354;
        return StatusCode::Ok;
    }

    EpochDay HijriTabularCalendar::MinimumEpochDay() const noexcept {
        return m_Epoch - m_Adjustment;
    }

    EpochDay HijriTabularCalendar::MaximumEpochDay() const noexcept {
        return StartOf(kMaxYear + 1) - 1 - m_Adjustment;
    }

    StatusCode HijriTabularCalendar::YearRange(int era, int &outMin, int &outMax) const {
        if (era != kEraAnnoHegirae) {
            return StatusCode::InvalidDate;
        }
        outMin = kMinYear;
        outMax = kMaxYear;
        return StatusCode::Ok;
    }

    bool HijriTabularCalendar::IsLeapYear(int era, int year) const {
        return era == kEraAnnoHegirae && IsLeap(year);
    }
}
