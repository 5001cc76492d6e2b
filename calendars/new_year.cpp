#include "almanac/calendars/new_year.h"

#include <algorithm>
#include <charconv>
#include <limits>

#include "almanac/epoch.h"

namespace almanac {

namespace {
    struct RuleName {
        NewYearRule rule;
        std::string_view name;
    };

    constexpr RuleName kRuleNames[] = {
        {NewYearRule::BeginOfJanuary, "BEGIN_OF_JANUARY"},
        {NewYearRule::BeginOfMarch, "BEGIN_OF_MARCH"},
        {NewYearRule::BeginOfSeptember, "BEGIN_OF_SEPTEMBER"},
        {NewYearRule::ChristmasStyle, "CHRISTMAS_STYLE"},
        {NewYearRule::EasterStyle, "EASTER_STYLE"},
        {NewYearRule::GoodFriday, "GOOD_FRIDAY"},
        {NewYearRule::MariaAnunciata, "MARIA_ANUNCIATA"},
        {NewYearRule::CalculusPisanus, "CALCULUS_PISANUS"},
        {NewYearRule::Epiphany, "EPIPHANY"}
    };

    HistoricDay MarchDayToDate(int annoDomini, int marchDay) noexcept {
        if (marchDay > 31) {
            return HistoricDay{annoDomini, 4, marchDay - 31};
        }
        return HistoricDay{annoDomini, 3, marchDay};
    }
}

bool operator==(const HistoricDay &left, const HistoricDay &right) noexcept {
    return left.year == right.year && left.month == right.month && left.day == right.day;
}

bool operator!=(const HistoricDay &left, const HistoricDay &right) noexcept {
    return !(left == right);
}

bool operator<(const HistoricDay &left, const HistoricDay &right) noexcept {
    if (left.year != right.year) {
        return left.year < right.year;
    }
    if (left.month != right.month) {
        return left.month < right.month;
    }
    return left.day < right.day;
}

bool operator<=(const HistoricDay &left, const HistoricDay &right) noexcept {
    return !(right < left);
}

std::string_view NewYearRuleName(NewYearRule rule) noexcept {
    for (const auto &entry: kRuleNames) {
        if (entry.rule == rule) {
            return entry.name;
        }
    }
    return "UNKNOWN";
}

StatusCode ParseNewYearRule(std::string_view text, NewYearRule &outRule) {
    for (const auto &entry: kRuleNames) {
        if (entry.name == text) {
            outRule = entry.rule;
            return StatusCode::Ok;
        }
    }
    return StatusCode::InvalidArgument;
}

int EasterMarchDay(int annoDomini) noexcept {
    auto a = static_cast<int>(FloorMod(annoDomini, 4));
    auto b = static_cast<int>(FloorMod(annoDomini, 7));
    auto c = static_cast<int>(FloorMod(annoDomini, 19));
    int d = (19 * c + 15) % 30;
    int e = (2 * a + 4 * b - d + 34) % 7;
    return d + e + 22;
}

HistoricDay NewYearOf(NewYearRule rule, int annoDomini) noexcept {
    switch (rule) {
        case NewYearRule::BeginOfJanuary:
            return HistoricDay{annoDomini, 1, 1};
        case NewYearRule::BeginOfMarch:
            return HistoricDay{annoDomini, 3, 1};
        case NewYearRule::BeginOfSeptember:
            return HistoricDay{annoDomini - 1, 9, 1};
        case NewYearRule::ChristmasStyle:
            return HistoricDay{annoDomini - 1, 12, 25};
        case NewYearRule::EasterStyle:
            return MarchDayToDate(annoDomini, EasterMarchDay(annoDomini) - 1);
        case NewYearRule::GoodFriday:
            return MarchDayToDate(annoDomini, EasterMarchDay(annoDomini) - 2);
        case NewYearRule::MariaAnunciata:
        case NewYearRule::CalculusPisanus:
            return HistoricDay{annoDomini, 3, 25};
        case NewYearRule::Epiphany:
            return HistoricDay{annoDomini, 1, 6};
    }
    return HistoricDay{annoDomini, 1, 1};
}

NewYearStrategy::NewYearStrategy() : m_Segments() {
}

StatusCode NewYearStrategy::Parse(std::string_view text, NewYearStrategy &outStrategy) {
    NewYearStrategy strategy;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        auto end = text.find(',', pos);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        auto item = text.substr(pos, end - pos);
        auto at = item.find('@');
        if (at == std::string_view::npos) {
            return StatusCode::InvalidArgument;
        }
        NewYearRule rule = NewYearRule::BeginOfJanuary;
        auto status = ParseNewYearRule(item.substr(0, at), rule);
        if (status != StatusCode::Ok) {
            return status;
        }
        auto yearText = item.substr(at + 1);
        int until = 0;
        auto result = std::from_chars(yearText.data(), yearText.data() + yearText.size(), until);
        if (result.ec != std::errc() || result.ptr != yearText.data() + yearText.size()) {
            return StatusCode::InvalidArgument;
        }
        status = strategy.Add(rule, until);
        if (status != StatusCode::Ok) {
            return status;
        }
        pos = end + 1;
    }
    outStrategy = std::move(strategy);
    return StatusCode::Ok;
}

StatusCode NewYearStrategy::Add(NewYearRule rule, int untilAnnoDomini) {
    if (untilAnnoDomini <= kEarliestUntil) {
        return StatusCode::OutOfRange;
    }
    if (m_Segments.empty() && rule != NewYearRule::BeginOfJanuary) {
        m_Segments.push_back(Segment{NewYearRule::BeginOfJanuary, kEarliestUntil});
    }
    for (const auto &segment: m_Segments) {
        if (segment.until == untilAnnoDomini) {
            return segment.rule == rule ? StatusCode::Ok : StatusCode::InvalidArgument;
        }
    }
    m_Segments.push_back(Segment{rule, untilAnnoDomini});
    std::sort(m_Segments.begin(), m_Segments.end(), [](const Segment &left, const Segment &right) {
        return left.until < right.until;
    });
    return StatusCode::Ok;
}

NewYearRule NewYearStrategy::RuleFor(int annoDomini) const noexcept {
    int previous = std::numeric_limits<int>::min();
    for (const auto &segment: m_Segments) {
        if (annoDomini >= previous && annoDomini < segment.until) {
            return segment.rule;
        }
        previous = segment.until;
    }
    return NewYearRule::BeginOfJanuary;
}

HistoricDay NewYearStrategy::NewYear(int annoDomini) const noexcept {
    return NewYearOf(RuleFor(annoDomini), annoDomini);
}

int NewYearStrategy::DisplayedYear(const HistoricDay &date) const noexcept {
    int year = date.year;
    auto rule = RuleFor(year);
    switch (rule) {
        case NewYearRule::BeginOfJanuary:
            return year;
        case NewYearRule::BeginOfSeptember:
        case NewYearRule::ChristmasStyle:
            // The following year may already have begun in this calendar year.
            return NewYear(year + 1) <= date ? year + 1 : year;
        case NewYearRule::CalculusPisanus:
            return NewYearOf(rule, year) <= date ? year + 1 : year;
        default:
            return date < NewYearOf(rule, year) ? year - 1 : year;
    }
}

bool NewYearStrategy::IsDefault() const noexcept {
    return m_Segments.empty();
}

std::string NewYearStrategy::ToString() const {
    if (m_Segments.empty()) {
        return std::string(NewYearRuleName(NewYearRule::BeginOfJanuary));
    }
    std::string text;
    for (const auto &segment: m_Segments) {
        if (!text.empty()) {
            text += ',';
        }
        text += NewYearRuleName(segment.rule);
        text += '@';
        text += std::to_string(segment.until);
    }
    return text;
}

}
