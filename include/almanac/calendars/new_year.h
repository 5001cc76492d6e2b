#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "almanac/status.h"

namespace almanac {
    // Day of a historic calendar. year is the proleptic AD year, 0 being 1 BC.
    struct HistoricDay {
        int year;
        int month;
        int day;
    };

    bool operator==(const HistoricDay &left, const HistoricDay &right) noexcept;
    bool operator!=(const HistoricDay &left, const HistoricDay &right) noexcept;
    bool operator<(const HistoricDay &left, const HistoricDay &right) noexcept;
    bool operator<=(const HistoricDay &left, const HistoricDay &right) noexcept;

    enum class NewYearRule {
        BeginOfJanuary,
        BeginOfMarch,
        BeginOfSeptember,
        ChristmasStyle,
        EasterStyle,
        GoodFriday,
        MariaAnunciata,
        CalculusPisanus,
        Epiphany
    };

    std::string_view NewYearRuleName(NewYearRule rule) noexcept;
    StatusCode ParseNewYearRule(std::string_view text, NewYearRule &outRule);

    // Day of March of Easter Sunday by the Julian computus; values above 31 fall in April.
    int EasterMarchDay(int annoDomini) noexcept;

    // First day of the year numbered annoDomini under rule, which may lie in the previous year.
    HistoricDay NewYearOf(NewYearRule rule, int annoDomini) noexcept;

    // Sequence of new-year rules, each valid until (exclusive) an AD year.
    // Years after the last segment begin on January 1.
    class NewYearStrategy {
    public:
        // Council of Tours; no rule may end before or at this year.
        static constexpr int kEarliestUntil = 567;

        NewYearStrategy();

        // Parses "RULE@year[,RULE@year...]".
        static StatusCode Parse(std::string_view text, NewYearStrategy &outStrategy);

        StatusCode Add(NewYearRule rule, int untilAnnoDomini);

        NewYearRule RuleFor(int annoDomini) const noexcept;

        HistoricDay NewYear(int annoDomini) const noexcept;

        // Year number shown for date when years begin according to this strategy.
        int DisplayedYear(const HistoricDay &date) const noexcept;

        bool IsDefault() const noexcept;

        std::string ToString() const;

    private:
        struct Segment {
            NewYearRule rule;
            int until;
        };

        std::vector<Segment> m_Segments;
    };
}
