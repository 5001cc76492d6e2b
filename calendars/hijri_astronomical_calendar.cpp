#include "almanac/calendars/hijri_astronomical_calendar.h"

#include "almanac/calendars/hijri_tabular_calendar.h"

namespace almanac {
    namespace {
        constexpr std::string_view kIslamicPrefix = "islamic-";
        constexpr std::string_view kResourceExtension = ".txt";
    }

    HijriAstronomicalCalendar::HijriAstronomicalCalendar(MonthTable table) : m_Table(std::move(table)) {
    }

    bool HijriAstronomicalCalendar::IsTableVariant(std::string_view variant) noexcept {
        if (variant.size() <= kIslamicPrefix.size() || variant.substr(0, kIslamicPrefix.size()) != kIslamicPrefix) {
            return false;
        }
        if (variant.find(':') != std::string_view::npos || variant.find('/') != std::string_view::npos) {
            return false;
        }
        return !HijriTabularCalendar::IsKnownBase(variant);
    }

    StatusCode HijriAstronomicalCalendar::Create(std::string_view variant,
                                                 const std::string &directory,
                                                 std::unique_ptr<CalendarSystem> &outCalendar) {
        if (!IsTableVariant(variant)) {
            return StatusCode::UnsupportedVariant;
        }
        std::string path = directory.empty() ? std::string() : directory + "/";
        path += std::string(variant);
        path += std::string(kResourceExtension);
        MonthTable table;
        auto status = MonthTable::Load(path, variant, table);
        if (status != StatusCode::Ok) {
            return status;
        }
        return FromTable(std::move(table), outCalendar);
    }

    StatusCode HijriAstronomicalCalendar::FromTable(MonthTable table, std::unique_ptr<CalendarSystem> &outCalendar) {
        if (table.Empty()) {
            return StatusCode::ResourceFormatError;
        }
        // Islamic months are never intercalated.
        for (int year = table.MinYear(); year <= table.MaxYear(); ++year) {
            if (table.LeapMonth(year) != 0) {
                return StatusCode::ResourceFormatError;
            }
        }
        outCalendar.reset(new HijriAstronomicalCalendar(std::move(table)));
        return StatusCode::Ok;
    }

    CalendarFamily HijriAstronomicalCalendar::Family() const noexcept {
        return CalendarFamily::HijriAstronomical;
    }

    std::string_view HijriAstronomicalCalendar::Variant() const noexcept {
        return m_Table.Variant();
    }

    std::string_view HijriAstronomicalCalendar::Summary() const noexcept {
        return "Islamic calendar driven by a month-length table";
    }

    StatusCode HijriAstronomicalCalendar::ToEpochDay(const CalendarDate &date, EpochDay &outDay) const {
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

    StatusCode HijriAstronomicalCalendar::FromEpochDay(EpochDay day, CalendarDate &outDate) const {
        int year = 0;
        MonthSpec month{};
        int dayOfMonth = 0;
        auto status = m_Table.Locate(day, year, month, dayOfMonth);
        if (status != StatusCode::Ok) {
            return status;
        }
        outDate = MakeDate(kEraAnnoHegirae, year, month, dayOfMonth);
        return StatusCode::Ok;
    }

    StatusCode HijriAstronomicalCalendar::LengthOfMonth(int era, int year, MonthSpec month, int &outLength) const {
        if (era != kEraAnnoHegirae) {
            return StatusCode::InvalidDate;
        }
        return m_Table.LengthOf(year, month, outLength);
    }

    StatusCode HijriAstronomicalCalendar::LengthOfYear(int era, int year, int &outLength) const {
        if (era != kEraAnnoHegirae) {
            return StatusCode::InvalidDate;
        }
        return m_Table.LengthOfYear(year, outLength);
    }

    EpochDay HijriAstronomicalCalendar::MinimumEpochDay() const noexcept {
        return m_Table.FirstDay();
    }

    EpochDay HijriAstronomicalCalendar::MaximumEpochDay() const noexcept {
        return m_Table.LastDay();
    }

    StatusCode HijriAstronomicalCalendar::YearRange(int era, int &outMin, int &outMax) const {
        if (era != kEraAnnoHegirae) {
            return StatusCode::InvalidDate;
        }
        outMin = m_Table.MinYear();
        outMax = m_Table.MaxYear();
        return StatusCode::Ok;
    }

    bool HijriAstronomicalCalendar::IsLeapYear(int era, int year) const {
        int length = 0;
        return LengthOfYear(era, year, length) == StatusCode::Ok && length > 354;
    }

    const MonthTable &HijriAstronomicalCalendar::Table() const noexcept {
        return m_Table;
    }
}
