#include "almanac/week_model.h"

#include <algorithm>
#include <iterator>

namespace almanac {
    namespace {
        // Regional week data, default Monday / one day / Saturday to Sunday.
        constexpr std::string_view kFirstSunday[] = {
            "AG", "AS", "BD", "BR", "BS", "BT", "BW", "BZ", "CA", "CN", "CO", "DM", "DO", "ET", "GT", "GU",
            "HK", "HN", "ID", "IL", "IN", "JM", "JP", "KE", "KH", "KR", "LA", "MH", "MM", "MO", "MT", "MX",
            "MZ", "NI", "NP", "PA", "PE", "PH", "PK", "PR", "PY", "SA", "SG", "SV", "TH", "TT", "TW", "UM",
            "US", "VE", "VI", "WS", "YE", "ZA", "ZW"
        };

        constexpr std::string_view kFirstSaturday[] = {
            "AE", "AF", "BH", "DJ", "DZ", "EG", "IQ", "IR", "JO", "KW", "LY", "OM", "QA", "SD", "SY"
        };

        constexpr std::string_view kFirstFriday[] = {"MV"};

        constexpr std::string_view kMinimalDaysFour[] = {
            "AD", "AN", "AT", "AX", "BE", "BG", "CH", "CZ", "DE", "DK", "EE", "ES", "FI", "FJ", "FO", "FR",
            "GB", "GF", "GG", "GI", "GP", "GR", "HU", "IE", "IM", "IS", "IT", "JE", "LI", "LT", "LU", "MC",
            "MQ", "NL", "NO", "PL", "PT", "RE", "RU", "SE", "SJ", "SK", "SM", "VA"
        };

        constexpr std::string_view kWeekendFromFriday[] = {
            "AE", "BH", "DZ", "EG", "IL", "IQ", "IR", "JO", "KW", "LY", "OM", "QA", "SA", "SD", "SY", "YE"
        };

        constexpr std::string_view kWeekendFromThursday[] = {"AF"};

        constexpr std::string_view kWeekendFromSunday[] = {"IN", "UG"};

        constexpr std::string_view kWeekendToSaturday[] = {
            "AE", "BH", "DZ", "EG", "IL", "IQ", "JO", "KW", "LY", "OM", "QA", "SA", "SD", "SY", "YE"
        };

        constexpr std::string_view kWeekendToFriday[] = {"AF", "IR"};

        template<std::size_t N>
        bool Contains(const std::string_view (&countries)[N], std::string_view country) noexcept {
            return std::find(std::begin(countries), std::end(countries), country) != std::end(countries);
        }
    }

    WeekModel WeekModel::Iso() noexcept {
        return WeekModel{Weekday::Monday, 4, Weekday::Saturday, Weekday::Sunday};
    }

    StatusCode WeekModel::Of(Weekday firstDay,
                             int minimalDays,
                             Weekday weekendStart,
                             Weekday weekendEnd,
                             WeekModel &outModel) noexcept {
        if (minimalDays < 1 || minimalDays > 7) {
            return StatusCode::InvalidArgument;
        }
        outModel = WeekModel{firstDay, minimalDays, weekendStart, weekendEnd};
        return StatusCode::Ok;
    }

    bool operator==(const WeekModel &left, const WeekModel &right) noexcept {
        return left.firstDayOfWeek == right.firstDayOfWeek &&
               left.minimalDaysInFirstWeek == right.minimalDaysInFirstWeek &&
               left.startOfWeekend == right.startOfWeekend &&
               left.endOfWeekend == right.endOfWeekend;
    }

    bool operator!=(const WeekModel &left, const WeekModel &right) noexcept {
        return !(left == right);
    }

    WeekModel WeekModelForCountry(std::string_view country) noexcept {
        if (country.empty()) {
            return WeekModel::Iso();
        }
        WeekModel model{Weekday::Monday, 1, Weekday::Saturday, Weekday::Sunday};
        if (Contains(kFirstSunday, country)) {
            model.firstDayOfWeek = Weekday::Sunday;
        } else if (Contains(kFirstSaturday, country)) {
            model.firstDayOfWeek = Weekday::Saturday;
        } else if (Contains(kFirstFriday, country)) {
            model.firstDayOfWeek = Weekday::Friday;
        }
        if (Contains(kMinimalDaysFour, country)) {
            model.minimalDaysInFirstWeek = 4;
        }
        if (Contains(kWeekendFromFriday, country)) {
            model.startOfWeekend = Weekday::Friday;
        } else if (Contains(kWeekendFromThursday, country)) {
            model.startOfWeekend = Weekday::Thursday;
        } else if (Contains(kWeekendFromSunday, country)) {
            model.startOfWeekend = Weekday::Sunday;
        }
        if (Contains(kWeekendToSaturday, country)) {
            model.endOfWeekend = Weekday::Saturday;
        } else if (Contains(kWeekendToFriday, country)) {
            model.endOfWeekend = Weekday::Friday;
        }
        return model;
    }

    int LocalDayOfWeek(const WeekModel &model, Weekday day) noexcept {
        return static_cast<int>(FloorMod(static_cast<int>(day) - static_cast<int>(model.firstDayOfWeek), 7)) + 1;
    }

    Weekday WeekdayAt(const WeekModel &model, int localDay) noexcept {
        auto iso = FloorMod(static_cast<int>(model.firstDayOfWeek) + localDay - 2, 7) + 1;
        return static_cast<Weekday>(iso);
    }

    bool IsWeekend(const WeekModel &model, Weekday day) noexcept {
        int start = static_cast<int>(model.startOfWeekend);
        int end = static_cast<int>(model.endOfWeekend);
        int value = static_cast<int>(day);
        if (start <= end) {
            return value >= start && value <= end;
        }
        return value >= start || value <= end;
    }

    std::string_view WeekdayName(Weekday day) noexcept {
        switch (day) {
            case Weekday::Monday:
                return "Monday";
            case Weekday::Tuesday:
                return "Tuesday";
            case Weekday::Wednesday:
                return "Wednesday";
            case Weekday::Thursday:
                return "Thursday";
            case Weekday::Friday:
                return "Friday";
            case Weekday::Saturday:
                return "Saturday";
            case Weekday::Sunday:
                return "Sunday";
        }
        return "Unknown";
    }
}
