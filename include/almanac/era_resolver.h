#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "almanac/config.h"
#include "almanac/epoch.h"
#include "almanac/status.h"

namespace almanac {
    struct EraRecord {
        int id;
        std::string name;
        EpochDay start;
        // Gregorian year in which year 1 of the era is counted.
        int firstRelatedYear;
    };

    class EraResolver {
    public:
        EraResolver();

        // Fails with InvalidArgument unless starts and first related years
        // are strictly increasing and ids are unique.
        static StatusCode Build(std::vector<EraRecord> records, EraResolver &outResolver);

        bool Empty() const noexcept;

        const std::vector<EraRecord> &Records() const noexcept;

        // Active era for a day whose related Gregorian year is known.
        const EraRecord *Find(EpochDay day, int relatedYear) const noexcept;

        const EraRecord *FindByEpochDay(EpochDay day) const noexcept;

        const EraRecord *FindByRelatedYear(int relatedYear) const noexcept;

        const EraRecord *ById(int id) const noexcept;

        // era must be one of Records(); anything else has no neighbours.
        const EraRecord *Next(const EraRecord &era) const noexcept;

        const EraRecord *Previous(const EraRecord &era) const noexcept;

        // Last day belonging to the era, or fallback when it is the latest one.
        EpochDay EndOf(const EraRecord &era, EpochDay fallback) const noexcept;

        StatusCode Resolve(int requestedEra,
                           EpochDay day,
                           int relatedYear,
                           Leniency leniency,
                           int &outEra) const;

    private:
        std::vector<EraRecord> m_Records;

        std::size_t IndexOf(const EraRecord &era) const noexcept;
    };
}
