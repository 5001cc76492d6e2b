#include "almanac/era_resolver.h"

#include <algorithm>
#include <unordered_set>

namespace almanac {

EraResolver::EraResolver() : m_Records() {
}

StatusCode EraResolver::Build(std::vector<EraRecord> records, EraResolver &outResolver) {
    if (records.empty()) {
        return StatusCode::InvalidArgument;
    }
    std::unordered_set<int> ids;
    for (std::size_t i = 0; i < records.size(); ++i) {
        if (!ids.insert(records[i].id).second) {
            return StatusCode::InvalidArgument;
        }
        if (i > 0) {
            const auto &previous = records[i - 1];
            if (records[i].start <= previous.start || records[i].firstRelatedYear < previous.firstRelatedYear) {
                return StatusCode::InvalidArgument;
            }
        }
    }
    outResolver.m_Records = std::move(records);
    return StatusCode::Ok;
}

bool EraResolver::Empty() const noexcept {
    return m_Records.empty();
}

const std::vector<EraRecord> &EraResolver::Records() const noexcept {
    return m_Records;
}

const EraRecord *EraResolver::Find(EpochDay day, int relatedYear) const noexcept {
    if (m_Records.empty()) {
        return nullptr;
    }
    // Latest era already counted in relatedYear, then back off while it starts after day.
    auto it = std::upper_bound(m_Records.begin(), m_Records.end(), relatedYear,
                               [](int year, const EraRecord &era) {
                                   return year < era.firstRelatedYear;
                               });
    if (it == m_Records.begin()) {
        return nullptr;
    }
    --it;
    while (it->start > day) {
        if (it == m_Records.begin()) {
            return nullptr;
        }
        --it;
    }
    return &*it;
}

const EraRecord *EraResolver::FindByEpochDay(EpochDay day) const noexcept {
    auto it = std::upper_bound(m_Records.begin(), m_Records.end(), day,
                               [](EpochDay value, const EraRecord &era) {
                                   return value < era.start;
                               });
    if (it == m_Records.begin()) {
        return nullptr;
    }
    return &*(it - 1);
}

const EraRecord *EraResolver::FindByRelatedYear(int relatedYear) const noexcept {
    auto it = std::upper_bound(m_Records.begin(), m_Records.end(), relatedYear,
                               [](int year, const EraRecord &era) {
                                   return year < era.firstRelatedYear;
                               });
    if (it == m_Records.begin()) {
        return nullptr;
    }
    return &*(it - 1);
}

const EraRecord *EraResolver::ById(int id) const noexcept {
    for (const auto &era: m_Records) {
        if (era.id == id) {
            return &era;
        }
    }
    return nullptr;
}

const EraRecord *EraResolver::Next(const EraRecord &era) const noexcept {
    auto index = IndexOf(era);
    if (index + 1 >= m_Records.size()) {
        return nullptr;
    }
    return &m_Records[index + 1];
}

const EraRecord *EraResolver::Previous(const EraRecord &era) const noexcept {
    auto index = IndexOf(era);
    if (index == 0 || index >= m_Records.size()) {
        return nullptr;
    }
    return &m_Records[index - 1];
}

EpochDay EraResolver::EndOf(const EraRecord &era, EpochDay fallback) const noexcept {
    const EraRecord *next = Next(era);
    return next == nullptr ? fallback : next->start - 1;
}

StatusCode EraResolver::Resolve(int requestedEra,
                                EpochDay day,
                                int relatedYear,
                                Leniency leniency,
                                int &outEra) const {
    if (ById(requestedEra) == nullptr) {
        return StatusCode::InvalidArgument;
    }
    if (leniency == Leniency::Lax) {
        outEra = requestedEra;
        return StatusCode::Ok;
    }
    const EraRecord *computed = Find(day, relatedYear);
    if (computed == nullptr) {
        return StatusCode::OutOfRange;
    }
    if (computed->id != requestedEra && leniency == Leniency::Strict) {
        return StatusCode::EraMismatch;
    }
    outEra = computed->id;
    return StatusCode::Ok;
}

std::size_t EraResolver::IndexOf(const EraRecord &era) const noexcept {
    for (std::size_t index = 0; index < m_Records.size(); ++index) {
        if (&m_Records[index] == &era) {
            return index;
        }
    }
    return m_Records.size();
}

}
