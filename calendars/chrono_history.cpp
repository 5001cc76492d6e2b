#include "almanac/calendars/chrono_history.h"

#include <algorithm>
#include <iterator>
#include <limits>
#include <utility>

namespace almanac {
    namespace {
        // Scaliger's reading of the leap years between 45 BC and AD 8, as proleptic years.
        constexpr int kAncientLeapYears[] = {-41, -38, -35, -32, -29, -26, -23, -20, -17, -14, -11, -8};

        constexpr std::string_view kHistoricPrefix = "historic-";
        constexpr std::string_view kCutoverPrefix = "cutover=";
        constexpr std::string_view kNewYearPrefix = "new-year=";
        constexpr std::string_view kEraPrefix = "era=";
        constexpr std::string_view kAncientJulian = "ancient-julian";

        struct CountryReform {
            std::string_view country;
            int year;
            int month;
            int day;
        };

        // Gregorian first day of the new calendar. Sweden has its own history.
        constexpr CountryReform kCountryReforms[] = {
            {"ES", 1582, 10, 15},
            {"IT", 1582, 10, 15},
            {"PT", 1582, 10, 15},
            {"PL", 1582, 10, 15},
            {"FR", 1582, 12, 20},
            {"GB", 1752, 9, 14},
            {"RU", 1918, 2, 14}
        };

        bool IsAncientLeap(int year) noexcept {
            return std::binary_search(std::begin(kAncientLeapYears), std::end(kAncientLeapYears), year);
        }

        int AncientMonthLength(int year, int month) noexcept {
            if (month == 2) {
                return IsAncientLeap(year) ? 29 : 28;
            }
            return JulianMonthLength(1, month);
        }

        EpochDay FirstRegularJulianDay() noexcept {
            return FromJulian(ChronoHistory::kFirstRegularJulianYear, 1, 1);
        }

        EpochDay AncientToEpochDay(const HistoricDay &date) noexcept {
            if (date.year >= ChronoHistory::kFirstRegularJulianYear) {
                return FromJulian(date.year, date.month, date.day);
            }
            EpochDay day = FirstRegularJulianDay();
            for (int year = ChronoHistory::kFirstRegularJulianYear - 1; year >= date.year; --year) {
                day -= IsAncientLeap(year) ? 366 : 365;
            }
            for (int month = 1; month < date.month; ++month) {
                day += AncientMonthLength(date.year, month);
            }
            return day + date.day - 1;
        }

        HistoricDay AncientFromEpochDay(EpochDay day) noexcept {
            EpochDay test = FirstRegularJulianDay();
            if (day < test) {
                for (int year = ChronoHistory::kFirstRegularJulianYear - 1; year >= ChronoHistory::kMinProlepticYear; --year) {
                    test -= IsAncientLeap(year) ? 366 : 365;
                    if (test > day) {
                        continue;
                    }
                    for (int month = 1; month <= 12; ++month) {
                        int length = AncientMonthLength(year, month);
                        if (test + length > day) {
                            return HistoricDay{year, month, static_cast<int>(day - test) + 1};
                        }
                        test += length;
                    }
                }
            }
            HistoricDay date{};
            ToJulian(day, date.year, date.month, date.day);
            return date;
        }

        bool StartsWith(std::string_view text, std::string_view prefix) noexcept {
            return text.size() >= prefix.size() && text.substr(0, prefix.size()) == prefix;
        }

        StatusCode ParseBase(std::string_view base, ChronoHistory &outHistory) {
            if (base == "first-reform") {
                outHistory = ChronoHistory::FirstGregorianReform();
                return StatusCode::Ok;
            }
            if (base == "julian") {
                outHistory = ChronoHistory::ProlepticJulian();
                return StatusCode::Ok;
            }
            if (base == "gregorian") {
                outHistory = ChronoHistory::ProlepticGregorian();
                return StatusCode::Ok;
            }
            if (base == "sweden" || base == "SE") {
                outHistory = ChronoHistory::Sweden();
                return StatusCode::Ok;
            }
            if (StartsWith(base, kCutoverPrefix)) {
                EpochDay start = 0;
                if (!ParseIsoDate(base.substr(kCutoverPrefix.size()), start)) {
                    return StatusCode::UnsupportedVariant;
                }
                return ChronoHistory::OfGregorianReform(start, outHistory);
            }
            for (const auto &reform: kCountryReforms) {
                if (reform.country == base) {
                    return ChronoHistory::OfGregorianReform(FromGregorian(reform.year, reform.month, reform.day),
                                                            outHistory);
                }
            }
            return StatusCode::UnsupportedVariant;
        }
    }

    std::string_view HistoricEraName(HistoricEra era) noexcept {
        switch (era) {
            case HistoricEra::BC:
                return "BC";
            case HistoricEra::AD:
                return "AD";
            case HistoricEra::Hispanic:
                return "HISPANIC";
            case HistoricEra::Byzantine:
                return "BYZANTINE";
            case HistoricEra::AbUrbeCondita:
                return "AUC";
        }
        return "UNKNOWN";
    }

    int YearOfEra(HistoricEra era, int prolepticYear) noexcept {
        switch (era) {
            case HistoricEra::BC:
                return 1 - prolepticYear;
            case HistoricEra::AD:
                return prolepticYear;
            case HistoricEra::Hispanic:
                return prolepticYear + 38;
            case HistoricEra::Byzantine:
                return prolepticYear + 5508;
            case HistoricEra::AbUrbeCondita:
                return prolepticYear + 753;
        }
        return prolepticYear;
    }

    EraPreference::EraPreference()
        : m_Active(false),
          m_Era(HistoricEra::AD),
          m_Start(std::numeric_limits<EpochDay>::min()),
          m_End(std::numeric_limits<EpochDay>::max()) {
    }

    StatusCode EraPreference::Parse(std::string_view text, EraPreference &outPreference) {
        EraPreference preference;
        auto at = text.find('@');
        auto name = text.substr(0, at);
        if (name == "BYZANTINE") {
            preference.m_Era = HistoricEra::Byzantine;
        } else if (name == "AUC" || name == "AB_URBE_CONDITA") {
            preference.m_Era = HistoricEra::AbUrbeCondita;
        } else if (name == "HISPANIC") {
            preference.m_Era = HistoricEra::Hispanic;
        } else {
            return StatusCode::InvalidArgument;
        }
        if (at != std::string_view::npos) {
            auto range = text.substr(at + 1);
            auto slash = range.find('/');
            if (slash == std::string_view::npos || !ParseIsoDate(range.substr(0, slash), preference.m_Start) ||
                !ParseIsoDate(range.substr(slash + 1), preference.m_End)) {
                return StatusCode::InvalidArgument;
            }
            if (preference.m_End < preference.m_Start) {
                return StatusCode::InvalidArgument;
            }
        }
        preference.m_Active = true;
        outPreference = preference;
        return StatusCode::Ok;
    }

    HistoricEra EraPreference::PreferredEra(const HistoricDay &date, EpochDay day) const noexcept {
        if (!m_Active || day < m_Start || day > m_End) {
            return date.year < 1 ? HistoricEra::BC : HistoricEra::AD;
        }
        // The Spanish era begins in 38 BC.
        if (m_Era == HistoricEra::Hispanic && date < HistoricDay{-37, 1, 1}) {
            return HistoricEra::BC;
        }
        return m_Era;
    }

    bool EraPreference::IsDefault() const noexcept {
        return !m_Active;
    }

    ChronoHistory::ChronoHistory()
        : m_Initial(CalendarAlgorithm::Julian),
          m_Events(),
          m_AncientJulian(false),
          m_NewYear(),
          m_Preference() {
    }

    ChronoHistory ChronoHistory::ProlepticJulian() {
        return ChronoHistory();
    }

    ChronoHistory ChronoHistory::ProlepticGregorian() {
        ChronoHistory history;
        history.m_Initial = CalendarAlgorithm::Gregorian;
        return history;
    }

    ChronoHistory ChronoHistory::FirstGregorianReform() {
        ChronoHistory history;
        history.AddEvent(kEarliestCutover, CalendarAlgorithm::Julian, CalendarAlgorithm::Gregorian);
        return history;
    }

    ChronoHistory ChronoHistory::Sweden() {
        ChronoHistory history;
        // Julian 1700-02-29 was skipped, 1712-02-30 added back, Gregorian from 1753-03-01.
        history.AddEvent(-98546, CalendarAlgorithm::Julian, CalendarAlgorithm::Swedish);
        history.AddEvent(-94162, CalendarAlgorithm::Swedish, CalendarAlgorithm::Julian);
        history.AddEvent(-79198, CalendarAlgorithm::Julian, CalendarAlgorithm::Gregorian);
        return history;
    }

    StatusCode ChronoHistory::OfGregorianReform(EpochDay start, ChronoHistory &outHistory) {
        if (start < kEarliestCutover) {
            return StatusCode::OutOfRange;
        }
        ChronoHistory history;
        history.AddEvent(start, CalendarAlgorithm::Julian, CalendarAlgorithm::Gregorian);
        outHistory = std::move(history);
        return StatusCode::Ok;
    }

    StatusCode ChronoHistory::Parse(std::string_view text, ChronoHistory &outHistory) {
        if (StartsWith(text, kHistoricPrefix)) {
            text.remove_prefix(kHistoricPrefix.size());
        }
        auto colon = text.find(':');
        ChronoHistory history;
        auto status = ParseBase(text.substr(0, colon), history);
        if (status != StatusCode::Ok) {
            return status;
        }
        bool newYearSeen = false;
        bool eraSeen = false;
        while (colon != std::string_view::npos) {
            auto next = text.find(':', colon + 1);
            auto modifier = text.substr(colon + 1, next == std::string_view::npos ? std::string_view::npos : next - colon - 1);
            colon = next;
            if (modifier == kAncientJulian) {
                if (history.m_Initial != CalendarAlgorithm::Julian) {
                    return StatusCode::UnsupportedVariant;
                }
                history.m_AncientJulian = true;
            } else if (StartsWith(modifier, kNewYearPrefix) && !newYearSeen) {
                status = NewYearStrategy::Parse(modifier.substr(kNewYearPrefix.size()), history.m_NewYear);
                if (status != StatusCode::Ok) {
                    return status == StatusCode::OutOfRange ? status : StatusCode::UnsupportedVariant;
                }
                newYearSeen = true;
            } else if (StartsWith(modifier, kEraPrefix) && !eraSeen) {
                status = EraPreference::Parse(modifier.substr(kEraPrefix.size()), history.m_Preference);
                if (status != StatusCode::Ok) {
                    return StatusCode::UnsupportedVariant;
                }
                eraSeen = true;
            } else {
                return StatusCode::UnsupportedVariant;
            }
        }
        outHistory = std::move(history);
        return StatusCode::Ok;
    }

    void ChronoHistory::AddEvent(EpochDay start, CalendarAlgorithm from, CalendarAlgorithm to) {
        m_Events.push_back(CutoverEvent{start, from, to, FromEpochDay(to, start), FromEpochDay(from, start - 1)});
    }

    const std::vector<CutoverEvent> &ChronoHistory::Events() const noexcept {
        return m_Events;
    }

    EpochDay ChronoHistory::GregorianCutover() const noexcept {
        return m_Events.empty() ? MinimumEpochDay() : m_Events.back().start;
    }

    bool ChronoHistory::AlgorithmOf(const HistoricDay &date, CalendarAlgorithm &outAlgorithm) const {
        for (auto it = m_Events.rbegin(); it != m_Events.rend(); ++it) {
            if (it->dateAtCutover <= date) {
                outAlgorithm = it->to;
                return true;
            }
            if (it->dateBeforeCutover < date) {
                return false;
            }
        }
        outAlgorithm = m_Initial;
        return true;
    }

    bool ChronoHistory::IsValid(const HistoricDay &date) const {
        if (date.year < kMinProlepticYear || date.year > kMaxProlepticYear || date.month < 1 || date.month > 12 ||
            date.day < 1) {
            return false;
        }
        CalendarAlgorithm algorithm = m_Initial;
        if (!AlgorithmOf(date, algorithm)) {
            return false;
        }
        return date.day <= MaximumDayOfMonth(algorithm, date.year, date.month);
    }

    StatusCode ChronoHistory::ToEpochDay(const HistoricDay &date, EpochDay &outDay) const {
        if (date.year < kMinProlepticYear || date.year > kMaxProlepticYear) {
            return StatusCode::OutOfRange;
        }
        CalendarAlgorithm algorithm = m_Initial;
        if (!IsValid(date) || !AlgorithmOf(date, algorithm)) {
            return StatusCode::InvalidDate;
        }
        outDay = ToEpochDay(algorithm, date);
        return StatusCode::Ok;
    }

    StatusCode ChronoHistory::FromEpochDay(EpochDay day, HistoricDay &outDate) const {
        if (day < MinimumEpochDay() || day > MaximumEpochDay()) {
            return StatusCode::OutOfRange;
        }
        CalendarAlgorithm algorithm = m_Initial;
        for (auto it = m_Events.rbegin(); it != m_Events.rend(); ++it) {
            if (day >= it->start) {
                algorithm = it->to;
                break;
            }
        }
        outDate = FromEpochDay(algorithm, day);
        return StatusCode::Ok;
    }

    int ChronoHistory::MaximumDayOfMonth(const HistoricDay &date) const {
        for (int day = 31; day >= 28; --day) {
            if (IsValid(HistoricDay{date.year, date.month, day})) {
                return day;
            }
        }
        return 0;
    }

    EpochDay ChronoHistory::MinimumEpochDay() const noexcept {
        return ToEpochDay(m_Initial, HistoricDay{kMinProlepticYear, 1, 1});
    }

    EpochDay ChronoHistory::MaximumEpochDay() const noexcept {
        auto algorithm = m_Events.empty() ? m_Initial : m_Events.back().to;
        return ToEpochDay(algorithm, HistoricDay{kMaxProlepticYear, 12, 31});
    }

    bool ChronoHistory::HasAncientJulianLeapYears() const noexcept {
        return m_AncientJulian;
    }

    const NewYearStrategy &ChronoHistory::NewYear() const noexcept {
        return m_NewYear;
    }

    const EraPreference &ChronoHistory::Preference() const noexcept {
        return m_Preference;
    }

    int ChronoHistory::DisplayedYear(const HistoricDay &date) const noexcept {
        return m_NewYear.DisplayedYear(date);
    }

    HistoricEra ChronoHistory::PreferredEra(const HistoricDay &date, EpochDay day) const noexcept {
        return m_Preference.PreferredEra(date, day);
    }

    EpochDay ChronoHistory::ToEpochDay(CalendarAlgorithm algorithm, const HistoricDay &date) const noexcept {
        switch (algorithm) {
            case CalendarAlgorithm::Gregorian:
                return FromGregorian(date.year, date.month, date.day);
            case CalendarAlgorithm::Swedish:
                if (date.year == 1712 && date.month == 2 && date.day == 30) {
                    return FromJulian(1712, 3, 1) - 1;
                }
                return FromJulian(date.year, date.month, date.day) - 1;
            case CalendarAlgorithm::Julian:
                break;
        }
        if (m_AncientJulian) {
            return AncientToEpochDay(date);
        }
        return FromJulian(date.year, date.month, date.day);
    }

    HistoricDay ChronoHistory::FromEpochDay(CalendarAlgorithm algorithm, EpochDay day) const noexcept {
        HistoricDay date{};
        switch (algorithm) {
            case CalendarAlgorithm::Gregorian:
                ToGregorian(day, date.year, date.month, date.day);
                return date;
            case CalendarAlgorithm::Swedish:
                ToJulian(day + 1, date.year, date.month, date.day);
                if (date.year == 1712 && date.month == 3 && date.day == 1) {
                    date.month = 2;
                    date.day = 30;
                }
                return date;
            case CalendarAlgorithm::Julian:
                break;
        }
        if (m_AncientJulian) {
            return AncientFromEpochDay(day);
        }
        ToJulian(day, date.year, date.month, date.day);
        return date;
    }

    int ChronoHistory::MaximumDayOfMonth(CalendarAlgorithm algorithm, int year, int month) const noexcept {
        switch (algorithm) {
            case CalendarAlgorithm::Gregorian:
                return GregorianMonthLength(year, month);
            case CalendarAlgorithm::Swedish:
                if (month == 2 && year == 1712) {
                    return 30;
                }
                if (month == 2 && year == 1700) {
                    return 28;
                }
                return JulianMonthLength(year, month);
            case CalendarAlgorithm::Julian:
                break;
        }
        if (m_AncientJulian && year < kFirstRegularJulianYear) {
            return AncientMonthLength(year, month);
        }
        return JulianMonthLength(year, month);
    }
}
