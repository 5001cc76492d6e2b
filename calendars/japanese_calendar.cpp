#include "almanac/calendars/japanese_calendar.h"

#include <algorithm>

namespace almanac {
    namespace {
        constexpr std::string_view kResourceFile = "japanese-lunisolar.txt";

        class RelatedGregorianYearRule final : public BoundedIntRule {
        public:
            explicit RelatedGregorianYearRule(const JapaneseCalendar &system) noexcept : m_System(system) {
            }

            FieldId Id() const noexcept override {
                return FieldId::RelatedGregorianYear;
            }

            StatusCode GetValue(const CalendarDate &date, int &outValue) const override {
                outValue = m_System.LinearYear(date.era, date.year);
                return StatusCode::Ok;
            }

            StatusCode GetMinimum(const CalendarDate &, int &outValue) const override {
                outValue = m_System.RelatedYearOf(m_System.MinimumEpochDay());
                return StatusCode::Ok;
            }

            StatusCode GetMaximum(const CalendarDate &, int &outValue) const override {
                outValue = JapaneseCalendar::kMaxGregorianYear;
                return StatusCode::Ok;
            }

            StatusCode WithValue(const CalendarDate &date, const int &value, bool, CalendarDate &outDate) const override {
                if (!IsValid(date, value)) {
                    return StatusCode::OutOfRange;
                }
                int era = 0;
                int year = 0;
                m_System.SplitLinearYear(value, era, year);
                return m_System.WithYear(date, era, year, outDate);
            }

            FieldId ChildAtFloor(const CalendarDate &) const override {
                return FieldId::Month;
            }

        private:
            const JapaneseCalendar &m_System;
        };
    }

    const std::vector<EraRecord> &JapaneseCalendar::NengoRecords() {
        static const std::vector<EraRecord> kRecords = {
            {kAnsei, "Ansei", FromGregorian(1855, 1, 15), 1854},
            {kManEn, "Man'en", FromGregorian(1860, 4, 8), 1860},
            {kBunkyu, "Bunkyu", FromGregorian(1861, 3, 29), 1861},
            {kGenji, "Genji", FromGregorian(1864, 3, 27), 1864},
            {kKeio, "Keio", FromGregorian(1865, 5, 1), 1865},
            {kMeiji, "Meiji", FromGregorian(1868, 10, 23), 1868},
            {kTaisho, "Taisho", FromGregorian(1912, 7, 30), 1912},
            {kShowa, "Showa", FromGregorian(1926, 12, 25), 1926},
            {kHeisei, "Heisei", FromGregorian(1989, 1, 8), 1989},
            {kReiwa, "Reiwa", FromGregorian(2019, 5, 1), 2019}
        };
        return kRecords;
    }

    JapaneseCalendar::JapaneseCalendar(MonthTable lunisolar, EraResolver resolver)
        : m_Lunisolar(std::move(lunisolar)),
          m_Resolver(std::move(resolver)),
          m_SupportedEras() {
        for (const auto &era: m_Resolver.Records()) {
            if (m_Resolver.EndOf(era, MaximumEpochDay()) >= MinimumEpochDay()) {
                m_SupportedEras.push_back(era.id);
            }
        }
        RegisterRule(std::make_unique<RelatedGregorianYearRule>(*this));
    }

    StatusCode JapaneseCalendar::Create(const std::string &directory, std::unique_ptr<CalendarSystem> &outCalendar) {
        std::string path = directory.empty() ? std::string() : directory + "/";
        path += std::string(kResourceFile);
        MonthTable table;
        auto status = MonthTable::Load(path, kLunisolarVariant, table);
        if (status != StatusCode::Ok) {
            return status;
        }
        return FromTable(std::move(table), outCalendar);
    }

    StatusCode JapaneseCalendar::FromTable(MonthTable lunisolar, std::unique_ptr<CalendarSystem> &outCalendar) {
        // The lunisolar rows must hand over to the Gregorian calendar without a gap.
        if (lunisolar.Empty() || lunisolar.LastDay() != kGregorianStart - 1) {
            return StatusCode::ResourceFormatError;
        }
        EraResolver resolver;
        auto status = EraResolver::Build(NengoRecords(), resolver);
        if (status != StatusCode::Ok) {
            return status;
        }
        std::unique_ptr<JapaneseCalendar> calendar(new JapaneseCalendar(std::move(lunisolar), std::move(resolver)));
        status = calendar->RuleStatus();
        if (status != StatusCode::Ok) {
            return status;
        }
        outCalendar = std::move(calendar);
        return StatusCode::Ok;
    }

    CalendarFamily JapaneseCalendar::Family() const noexcept {
        return CalendarFamily::Japanese;
    }

    std::string_view JapaneseCalendar::Variant() const noexcept {
        return "japanese";
    }

    std::string_view JapaneseCalendar::Summary() const noexcept {
        return "Japanese nengo calendar, lunisolar until 1872";
    }

    bool JapaneseCalendar::IsLunisolarYear(int relatedYear) const noexcept {
        return relatedYear <= m_Lunisolar.MaxYear();
    }

    StatusCode JapaneseCalendar::RelatedYear(int era, int year, int &outRelated) const {
        const EraRecord *record = m_Resolver.ById(era);
        if (record == nullptr) {
            return StatusCode::InvalidDate;
        }
        outRelated = record->firstRelatedYear + year - 1;
        return StatusCode::Ok;
    }

    int JapaneseCalendar::RelatedYearOf(EpochDay day) const noexcept {
        if (day < kGregorianStart) {
            int year = 0;
            MonthSpec month{};
            int dayOfMonth = 0;
            if (m_Lunisolar.Locate(day, year, month, dayOfMonth) != StatusCode::Ok) {
                return m_Lunisolar.MinYear();
            }
            return year;
        }
        int year = 0;
        int month = 0;
        int dayOfMonth = 0;
        ToGregorian(day, year, month, dayOfMonth);
        return year;
    }

    StatusCode JapaneseCalendar::ToEpochDay(const CalendarDate &date, EpochDay &outDay) const {
        auto status = CheckFields(date);
        if (status != StatusCode::Ok) {
            return status;
        }
        int related = 0;
        status = RelatedYear(date.era, date.year, related);
        if (status != StatusCode::Ok) {
            return status;
        }
        if (IsLunisolarYear(related)) {
            EpochDay start = 0;
            status = m_Lunisolar.StartOf(related, date.month, start);
            if (status != StatusCode::Ok) {
                return status;
            }
            outDay = start + date.day - 1;
        } else {
            outDay = FromGregorian(related, date.month.number, date.day);
        }
        if (outDay < MinimumEpochDay() || outDay > MaximumEpochDay()) {
            return StatusCode::OutOfRange;
        }
        return StatusCode::Ok;
    }

    StatusCode JapaneseCalendar::FromEpochDay(EpochDay day, CalendarDate &outDate) const {
        if (day < MinimumEpochDay() || day > MaximumEpochDay()) {
            return StatusCode::OutOfRange;
        }
        int related = 0;
        MonthSpec month{};
        int dayOfMonth = 0;
        if (day < kGregorianStart) {
            auto status = m_Lunisolar.Locate(day, related, month, dayOfMonth);
            if (status != StatusCode::Ok) {
                return status;
            }
        } else {
            int monthNumber = 0;
            ToGregorian(day, related, monthNumber, dayOfMonth);
            month = MonthSpec::Regular(monthNumber);
        }
        const EraRecord *era = m_Resolver.Find(day, related);
        if (era == nullptr) {
            return StatusCode::OutOfRange;
        }
        outDate = MakeDate(era->id, related - era->firstRelatedYear + 1, month, dayOfMonth);
        return StatusCode::Ok;
    }

    StatusCode JapaneseCalendar::LengthOfMonth(int era, int year, MonthSpec month, int &outLength) const {
        int related = 0;
        auto status = RelatedYear(era, year, related);
        if (status != StatusCode::Ok) {
            return status;
        }
        if (related < m_Lunisolar.MinYear() || related > kMaxGregorianYear) {
            return StatusCode::OutOfRange;
        }
        if (IsLunisolarYear(related)) {
            return m_Lunisolar.LengthOf(related, month, outLength);
        }
        if (month.leap || month.number < 1 || month.number > 12) {
            return StatusCode::InvalidDate;
        }
        outLength = GregorianMonthLength(related, month.number);
        return StatusCode::Ok;
    }

    StatusCode JapaneseCalendar::LengthOfYear(int era, int year, int &outLength) const {
        int related = 0;
        auto status = RelatedYear(era, year, related);
        if (status != StatusCode::Ok) {
            return status;
        }
        if (related < m_Lunisolar.MinYear() || related > kMaxGregorianYear) {
            return StatusCode::OutOfRange;
        }
        if (IsLunisolarYear(related)) {
            return m_Lunisolar.LengthOfYear(related, outLength);
        }
        outLength = IsGregorianLeap(related) ? 366 : 365;
        return StatusCode::Ok;
    }

    EpochDay JapaneseCalendar::MinimumEpochDay() const noexcept {
        return m_Lunisolar.FirstDay();
    }

    EpochDay JapaneseCalendar::MaximumEpochDay() const noexcept {
        return FromGregorian(kMaxGregorianYear, 12, 31);
    }

    StatusCode JapaneseCalendar::YearRange(int era, int &outMin, int &outMax) const {
        const EraRecord *record = m_Resolver.ById(era);
        if (record == nullptr ||
            std::find(m_SupportedEras.begin(), m_SupportedEras.end(), era) == m_SupportedEras.end()) {
            return StatusCode::InvalidDate;
        }
        EpochDay first = std::max(record->start, MinimumEpochDay());
        EpochDay last = m_Resolver.EndOf(*record, MaximumEpochDay());
        outMin = RelatedYearOf(first) - record->firstRelatedYear + 1;
        outMax = RelatedYearOf(last) - record->firstRelatedYear + 1;
        return StatusCode::Ok;
    }

    bool JapaneseCalendar::IsLeapYear(int era, int year) const {
        int related = 0;
        if (RelatedYear(era, year, related) != StatusCode::Ok) {
            return false;
        }
        if (IsLunisolarYear(related)) {
            return m_Lunisolar.LeapMonth(related) != 0;
        }
        return IsGregorianLeap(related);
    }

    int JapaneseCalendar::MonthsInYear(int era, int year) const {
        int related = 0;
        if (RelatedYear(era, year, related) != StatusCode::Ok) {
            return 0;
        }
        return IsLunisolarYear(related) ? m_Lunisolar.MonthsInYear(related) : 12;
    }

    StatusCode JapaneseCalendar::MonthAt(int era, int year, int ordinal, MonthSpec &outMonth) const {
        int related = 0;
        auto status = RelatedYear(era, year, related);
        if (status != StatusCode::Ok) {
            return status;
        }
        if (IsLunisolarYear(related)) {
            return m_Lunisolar.MonthAt(related, ordinal, outMonth);
        }
        return CalendarSystem::MonthAt(era, year, ordinal, outMonth);
    }

    int JapaneseCalendar::MonthOrdinal(int era, int year, MonthSpec month) const {
        int related = 0;
        if (RelatedYear(era, year, related) != StatusCode::Ok) {
            return 0;
        }
        if (IsLunisolarYear(related)) {
            return m_Lunisolar.MonthOrdinal(related, month);
        }
        return CalendarSystem::MonthOrdinal(era, year, month);
    }

    std::vector<int> JapaneseCalendar::Eras() const {
        return m_SupportedEras;
    }

    bool JapaneseCalendar::RollsPastLunisolarEnd(const CalendarDate &date, EpochDay &outDay) const {
        if (!Matches(date) || date.month.leap) {
            return false;
        }
        int minYear = 0;
        int maxYear = 0;
        if (YearRange(date.era, minYear, maxYear) != StatusCode::Ok || date.year < minYear || date.year > maxYear) {
            return false;
        }
        int related = 0;
        if (RelatedYear(date.era, date.year, related) != StatusCode::Ok || related != m_Lunisolar.MaxYear()) {
            return false;
        }
        MonthSpec last{};
        if (m_Lunisolar.MonthAt(related, m_Lunisolar.MonthsInYear(related), last) != StatusCode::Ok ||
            last != date.month) {
            return false;
        }
        int length = 0;
        if (m_Lunisolar.LengthOf(related, last, length) != StatusCode::Ok) {
            return false;
        }
        // The final lunar month was cut short by the reform; a day it would
        // otherwise have had continues in the Gregorian calendar.
        if (date.day <= length || date.day > kMaxLunarMonthLength) {
            return false;
        }
        EpochDay start = 0;
        if (m_Lunisolar.StartOf(related, last, start) != StatusCode::Ok) {
            return false;
        }
        outDay = start + date.day - 1;
        return true;
    }

    StatusCode JapaneseCalendar::ResolveEra(const CalendarDate &date, Leniency leniency, CalendarDate &outDate) const {
        EpochDay rolled = 0;
        if (leniency != Leniency::Strict && RollsPastLunisolarEnd(date, rolled)) {
            return FromEpochDay(rolled, outDate);
        }
        EpochDay day = 0;
        auto status = ToEpochDay(date, day);
        if (status != StatusCode::Ok) {
            return status;
        }
        int related = 0;
        status = RelatedYear(date.era, date.year, related);
        if (status != StatusCode::Ok) {
            return status;
        }
        int era = date.era;
        status = m_Resolver.Resolve(date.era, day, related, leniency, era);
        if (status != StatusCode::Ok) {
            return status;
        }
        if (era == date.era) {
            outDate = date;
            return StatusCode::Ok;
        }
        const EraRecord *record = m_Resolver.ById(era);
        outDate = MakeDate(era, related - record->firstRelatedYear + 1, date.month, date.day);
        return StatusCode::Ok;
    }

    int JapaneseCalendar::LinearYear(int era, int year) const {
        int related = 0;
        if (RelatedYear(era, year, related) != StatusCode::Ok) {
            return year;
        }
        return related;
    }

    void JapaneseCalendar::SplitLinearYear(int linearYear, int &outEra, int &outYear) const {
        const EraRecord *record = m_Resolver.FindByRelatedYear(linearYear);
        if (record == nullptr) {
            record = &m_Resolver.Records().front();
        }
        outEra = record->id;
        outYear = linearYear - record->firstRelatedYear + 1;
    }

    const EraResolver &JapaneseCalendar::Resolver() const noexcept {
        return m_Resolver;
    }
}
