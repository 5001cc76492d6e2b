#include "almanac/epoch.h"

#include <charconv>

namespace almanac {
    namespace {
        constexpr std::int64_t kJulianDayOfEpoch = 2440588;
        constexpr int kMonthDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    }

    std::int64_t FloorDiv(std::int64_t value, std::int64_t divisor) noexcept {
        std::int64_t quotient = value / divisor;
        if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
            --quotient;
        }
        return quotient;
    }

    std::int64_t FloorMod(std::int64_t value, std::int64_t divisor) noexcept {
        return value - FloorDiv(value, divisor) * divisor;
    }

    bool IsGregorianLeap(int year) noexcept {
        return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
    }

    bool IsJulianLeap(int year) noexcept {
        return FloorMod(year, 4) == 0;
    }

    int GregorianMonthLength(int year, int month) noexcept {
        if (month == 2 && IsGregorianLeap(year)) {
            return 29;
        }
        return kMonthDays[month - 1];
    }

    int JulianMonthLength(int year, int month) noexcept {
        if (month == 2 && IsJulianLeap(year)) {
            return 29;
        }
        return kMonthDays[month - 1];
    }

    EpochDay FromGregorian(int year, int month, int day) noexcept {
        year -= month <= 2;
        const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(year - era * 400);
        const unsigned doy = (153u * (static_cast<unsigned>(month + (month > 2 ? -3 : 9))) + 2u) / 5u + static_cast<unsigned>(day) - 1u;
        const unsigned doe = yoe * 365u + yoe / 4u - yoe / 100u + yoe / 400u + doy;
        return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
    }

    void ToGregorian(EpochDay day, int &year, int &month, int &dayOfMonth) noexcept {
        day += 719468;
        const std::int64_t era = (day >= 0 ? day : day - 146096) / 146097;
        const unsigned doe = static_cast<unsigned>(day - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100 + yoe / 400);
        const unsigned mp = (5 * doy + 2) / 153;
        dayOfMonth = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
        month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
        year = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400 + (month <= 2 ? 1 : 0));
    }

    EpochDay FromJulian(int year, int month, int day) noexcept {
        const std::int64_t a = (14 - month) / 12;
        const std::int64_t y = static_cast<std::int64_t>(year) + 4800 - a;
        const std::int64_t m = month + 12 * a - 3;
        const std::int64_t jdn = day + (153 * m + 2) / 5 + 365 * y + FloorDiv(y, 4) - 32083;
        return jdn - kJulianDayOfEpoch;
    }

    void ToJulian(EpochDay day, int &year, int &month, int &dayOfMonth) noexcept {
        const std::int64_t c = day + kJulianDayOfEpoch + 32082;
        const std::int64_t d = FloorDiv(4 * c + 3, 1461);
        const std::int64_t e = c - FloorDiv(1461 * d, 4);
        const std::int64_t m = (5 * e + 2) / 153;
        dayOfMonth = static_cast<int>(e - (153 * m + 2) / 5 + 1);
        month = static_cast<int>(m + 3 - 12 * (m / 10));
        year = static_cast<int>(d - 4800 + m / 10);
    }

    Weekday DayOfWeek(EpochDay day) noexcept {
        // 1970-01-01 was a Thursday.
        return static_cast<Weekday>(FloorMod(day + 3, 7) + 1);
    }

    bool ParseIsoDate(std::string_view text, EpochDay &outDay) noexcept {
        if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
            return false;
        }
        int parts[3] = {0, 0, 0};
        const std::string_view fields[3] = {text.substr(0, 4), text.substr(5, 2), text.substr(8, 2)};
        for (int i = 0; i < 3; ++i) {
            auto result = std::from_chars(fields[i].data(), fields[i].data() + fields[i].size(), parts[i]);
            if (result.ec != std::errc() || result.ptr != fields[i].data() + fields[i].size()) {
                return false;
            }
        }
        if (parts[1] < 1 || parts[1] > 12 || parts[2] < 1 || parts[2] > GregorianMonthLength(parts[0], parts[1])) {
            return false;
        }
        outDay = FromGregorian(parts[0], parts[1], parts[2]);
        return true;
    }
}
