#include "almanac/calendar_date.h"

#include <cstdio>

namespace almanac {

bool operator==(const MonthSpec &left, const MonthSpec &right) noexcept {
    return left.number == right.number && left.leap == right.leap;
}

bool operator!=(const MonthSpec &left, const MonthSpec &right) noexcept {
    return !(left == right);
}

bool operator<(const MonthSpec &left, const MonthSpec &right) noexcept {
    if (left.number != right.number) {
        return left.number < right.number;
    }
    return !left.leap && right.leap;
}

bool operator==(const CalendarDate &left, const CalendarDate &right) noexcept {
    return left.family == right.family
           && left.variant == right.variant
           && left.era == right.era
           && left.year == right.year
           && left.month == right.month
           && left.day == right.day;
}

bool operator!=(const CalendarDate &left, const CalendarDate &right) noexcept {
    return !(left == right);
}

int CompareFields(const CalendarDate &left, const CalendarDate &right) noexcept {
    if (left.era != right.era) {
        return left.era < right.era ? -1 : 1;
    }
    if (left.year != right.year) {
        return left.year < right.year ? -1 : 1;
    }
    if (left.month != right.month) {
        return left.month < right.month ? -1 : 1;
    }
    if (left.day != right.day) {
        return left.day < right.day ? -1 : 1;
    }
    return 0;
}

std::string FormatDate(const CalendarDate &date) {
    char buffer[96];
    std::snprintf(buffer, sizeof(buffer), "%d/%d-%02d%s-%02d",
                  date.era, date.year, date.month.number, date.month.leap ? "*" : "", date.day);
    std::string text = date.variant;
    text.push_back('[');
    text.append(buffer);
    text.push_back(']');
    return text;
}

}
