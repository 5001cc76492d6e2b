#include "almanac/calendars/historic_calendar.h"

#include <utility>

namespace almanac {
    HistoricCalendar::HistoricCalendar(std::string variant, ChronoHistory history)
        : m_Variant(std::move(variant)),
          m_History(std::move(history)) {
    }

    StatusCode HistoricCalendar::Create(std::string_view variant, std::unique_ptr<CalendarSystem> &outCalendar) {
        if (!IsHistoricVariant(variant)) {
            return StatusCode::UnsupportedVariant;
        }
        ChronoHistory history;
        auto status = ChronoHistory::Parse(variant, history);
        if (status != StatusCode::Ok) {
            return status;
        }
        outCalendar.reset(new HistoricCalendar(std::string(variant), std::move(history)));
        return StatusCode::Ok;
    }

    bool HistoricCalendar::IsHistoricVariant(std::string_view variant) noexcept {
        return variant.size() > kVariantPrefix.size() && variant.substr(0, kVariantPrefix.size()) == kVariantPrefix;
    }

    CalendarFamily HistoricCalendar::Family() const noexcept {
        return CalendarFamily::Historic;
    }

    std::string_view HistoricCalendar::Variant() const noexcept {
        return m_Variant;
    }

    std::string_view HistoricCalendar::Summary() const noexcept {
        return "Julian/Gregorian calendar with regional reform dates";
    }

    StatusCode HistoricCalendar::ToHistoricDay(const CalendarDate &date, HistoricDay &outDay) const {
        auto status = CheckFields(date);
        if (status != StatusCode::Ok) {
            return status;
        }
        outDay = HistoricDay{LinearYear(date.era, date.year), date.month.number, date.day};
        return StatusCode::Ok;
    }

    StatusCode HistoricCalendar::ToEpochDay(const CalendarDate &date, EpochDay &outDay) const {
        HistoricDay day{};
        auto status = ToHistoricDay(date, day);
        if (status != StatusCode::Ok) {
            return status;
        }
        return m_History.ToEpochDay(day, outDay);
    }

    StatusCode HistoricCalendar::FromEpochDay(EpochDay day, CalendarDate &outDate) const {
        HistoricDay date{};
        auto status = m_History.FromEpochDay(day, date);
        if (status != StatusCode::Ok) {
            return status;
        }
        int era = 0;
        int year = 0;
        SplitLinearYear(date.year, era, year);
        outDate = MakeDate(era, year, MonthSpec::Regular(date.month), date.day);
        return StatusCode::Ok;
    }

    StatusCode HistoricCalendar::MaximumDayOfMonth(int era, int year, MonthSpec month, int &outDay) const {
        int minYear = 0;
        int maxYear = 0;
        auto status = YearRange(era, minYear, maxYear);
        if (status != StatusCode::Ok) {
            return status;
        }
        if (year < minYear || year > maxYear) {
            return StatusCode::OutOfRange;
        }
        if (month.leap || month.number < 1 || month.number > 12) {
            return StatusCode::InvalidDate;
        }
        outDay = m_History.MaximumDayOfMonth(HistoricDay{LinearYear(era, year), month.number, 1});
        return StatusCode::Ok;
    }

    StatusCode HistoricCalendar::LengthOfMonth(int era, int year, MonthSpec month, int &outLength) const {
        int maximum = 0;
        auto status = MaximumDayOfMonth(era, year, month, maximum);
        if (status != StatusCode::Ok) {
            return status;
        }
        int proleptic = LinearYear(era, year);
        int length = 0;
        for (int day = 1; day <= maximum; ++day) {
            if (m_History.IsValid(HistoricDay{proleptic, month.number, day})) {
                ++length;
            }
        }
        outLength = length;
        return StatusCode::Ok;
    }

    StatusCode HistoricCalendar::LengthOfYear(int era, int year, int &outLength) const {
        EpochDay start = 0;
        auto status = StartOfYear(era, year, start);
        if (status != StatusCode::Ok) {
            return status;
        }
        int proleptic = LinearYear(era, year);
        EpochDay end = MaximumEpochDay() + 1;
        if (proleptic < ChronoHistory::kMaxProlepticYear) {
            int nextEra = 0;
            int nextYear = 0;
            SplitLinearYear(proleptic + 1, nextEra, nextYear);
            status = StartOfYear(nextEra, nextYear, end);
            if (status != StatusCode::Ok) {
                return status;
            }
        }
        outLength = static_cast<int>(end - start);
        return StatusCode::Ok;
    }

    EpochDay HistoricCalendar::MinimumEpochDay() const noexcept {
        return m_History.MinimumEpochDay();
    }

    EpochDay HistoricCalendar::MaximumEpochDay() const noexcept {
        return m_History.MaximumEpochDay();
    }

    StatusCode HistoricCalendar::YearRange(int era, int &outMin, int &outMax) const {
        if (era == kEraBC) {
            outMin = 1;
            outMax = 1 - ChronoHistory::kMinProlepticYear;
            return StatusCode::Ok;
        }
        if (era == kEraAD) {
            outMin = 1;
            outMax = ChronoHistory::kMaxProlepticYear;
            return StatusCode::Ok;
        }
        return StatusCode::InvalidDate;
    }

    bool HistoricCalendar::IsValid(const CalendarDate &date) const {
        HistoricDay day{};
        return ToHistoricDay(date, day) == StatusCode::Ok && m_History.IsValid(day);
    }

    bool HistoricCalendar::IsLeapYear(int era, int year) const {
        int length = 0;
        return LengthOfMonth(era, year, MonthSpec::Regular(2), length) == StatusCode::Ok && length == 29;
    }

    std::vector<int> HistoricCalendar::Eras() const {
        return {kEraBC, kEraAD};
    }

    StatusCode HistoricCalendar::ResolveEra(const CalendarDate &date, Leniency, CalendarDate &outDate) const {
        // BC and AD never overlap, so a valid date already carries its era.
        EpochDay day = 0;
        auto status = ToEpochDay(date, day);
        if (status != StatusCode::Ok) {
            return status;
        }
        outDate = date;
        return StatusCode::Ok;
    }

    int HistoricCalendar::LinearYear(int era, int year) const {
        return era == kEraBC ? 1 - year : year;
    }

    void HistoricCalendar::SplitLinearYear(int linearYear, int &outEra, int &outYear) const {
        if (linearYear < 1) {
            outEra = kEraBC;
            outYear = 1 - linearYear;
        } else {
            outEra = kEraAD;
            outYear = linearYear;
        }
    }

    const ChronoHistory &HistoricCalendar::History() const noexcept {
        return m_History;
    }

    StatusCode HistoricCalendar::DisplayedYear(const CalendarDate &date, int &outYear) const {
        HistoricDay day{};
        auto status = ToHistoricDay(date, day);
        if (status != StatusCode::Ok) {
            return status;
        }
        if (!m_History.IsValid(day)) {
            return StatusCode::InvalidDate;
        }
        outYear = m_History.DisplayedYear(day);
        return StatusCode::Ok;
    }

    StatusCode HistoricCalendar::PreferredEra(const CalendarDate &date, HistoricEra &outEra) const {
        HistoricDay day{};
        auto status = ToHistoricDay(date, day);
        if (status != StatusCode::Ok) {
            return status;
        }
        EpochDay epochDay = 0;
        status = m_History.ToEpochDay(day, epochDay);
        if (status != StatusCode::Ok) {
            return status;
        }
        outEra = m_History.PreferredEra(day, epochDay);
        return StatusCode::Ok;
    }

    StatusCode HistoricCalendar::YearOfEra(const CalendarDate &date, HistoricEra era, int &outYear) const {
        HistoricDay day{};
        auto status = ToHistoricDay(date, day);
        if (status != StatusCode::Ok) {
            return status;
        }
        int year = almanac::YearOfEra(era, day.year);
        if (year < 1) {
            return StatusCode::OutOfRange;
        }
        outYear = year;
        return StatusCode::Ok;
    }
}
