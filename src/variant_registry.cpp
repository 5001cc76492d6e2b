#include "almanac/variant_registry.h"

#include <algorithm>
#include <iostream>
#include <utility>

#include "almanac/calendars/chinese_calendar.h"
#include "almanac/calendars/coptic_calendar.h"
#include "almanac/calendars/hijri_astronomical_calendar.h"
#include "almanac/calendars/hijri_tabular_calendar.h"
#include "almanac/calendars/historic_calendar.h"
#include "almanac/calendars/indian_calendar.h"
#include "almanac/calendars/japanese_calendar.h"

namespace almanac {
    namespace {
        constexpr std::string_view kFixedVariants[] = {"coptic", "indian", "chinese"};
    }

    VariantRegistry::VariantRegistry(ResourceConfig resources, LoggingConfig logging)
        : m_Resources(std::move(resources)),
          m_Logging(logging),
          m_Mutex(),
          m_Systems(),
          m_Metrics() {
    }

    StatusCode VariantRegistry::Initialize() {
        for (auto variant: kFixedVariants) {
            CalendarSystemPtr system;
            auto status = Get(variant, system);
            if (status != StatusCode::Ok) {
                return status;
            }
        }
        for (const auto &variant: m_Resources.preload) {
            CalendarSystemPtr system;
            auto status = Get(variant, system);
            if (status != StatusCode::Ok) {
                if (m_Logging.enabled) {
                    std::cout << "[Registry] preload failed for " << variant << ": " << StatusName(status) << std::endl;
                }
                return status;
            }
        }
        return StatusCode::Ok;
    }

    StatusCode VariantRegistry::Get(std::string_view variant, CalendarSystemPtr &outSystem) {
        std::string key(variant);
        {
            std::lock_guard<std::mutex> lock(m_Mutex);
            ++m_Metrics.lookups;
            auto it = m_Systems.find(key);
            if (it != m_Systems.end()) {
                ++m_Metrics.hits;
                outSystem = it->second;
                return StatusCode::Ok;
            }
        }

        std::unique_ptr<CalendarSystem> built;
        auto status = Construct(variant, built);
        if (status == StatusCode::NotFound) {
            status = StatusCode::UnsupportedVariant;
        }
        if (status == StatusCode::Ok && built->RuleStatus() != StatusCode::Ok) {
            status = built->RuleStatus();
        }
        if (status != StatusCode::Ok) {
            std::lock_guard<std::mutex> lock(m_Mutex);
            ++m_Metrics.failedConstructions;
            if (m_Logging.enabled) {
                std::cout << "[Registry] cannot build " << key << ": " << StatusName(status) << std::endl;
            }
            return status;
        }

        CalendarSystemPtr candidate(std::move(built));
        std::lock_guard<std::mutex> lock(m_Mutex);
        auto inserted = m_Systems.emplace(key, candidate);
        if (!inserted.second) {
            ++m_Metrics.discardedConstructions;
            outSystem = inserted.first->second;
            return StatusCode::Ok;
        }
        ++m_Metrics.constructions;
        // Aliases such as "islamic-civil:+0" share the instance of the canonical name.
        std::string canonical(candidate->Variant());
        if (canonical != key) {
            auto aliased = m_Systems.emplace(canonical, candidate);
            if (!aliased.second) {
                inserted.first->second = aliased.first->second;
            }
        }
        if (m_Logging.enabled) {
            std::cout << "[Registry] built " << key << std::endl;
        }
        outSystem = inserted.first->second;
        return StatusCode::Ok;
    }

    bool VariantRegistry::Contains(std::string_view variant) const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        return m_Systems.find(std::string(variant)) != m_Systems.end();
    }

    std::vector<std::string> VariantRegistry::Variants() const {
        std::vector<std::string> keys;
        {
            std::lock_guard<std::mutex> lock(m_Mutex);
            keys.reserve(m_Systems.size());
            for (const auto &entry: m_Systems) {
                keys.push_back(entry.first);
            }
        }
        std::sort(keys.begin(), keys.end());
        return keys;
    }

    VariantRegistry::Metrics VariantRegistry::GetMetrics() const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        return m_Metrics;
    }

    const ResourceConfig &VariantRegistry::Resources() const noexcept {
        return m_Resources;
    }

    StatusCode VariantRegistry::Construct(std::string_view variant, std::unique_ptr<CalendarSystem> &outSystem) const {
        if (variant == "coptic") {
            outSystem = std::make_unique<CopticCalendar>();
            return StatusCode::Ok;
        }
        if (variant == "indian") {
            outSystem = std::make_unique<IndianCalendar>();
            return StatusCode::Ok;
        }
        if (variant == "chinese") {
            return ChineseCalendar::Create(outSystem);
        }
        if (variant == "japanese") {
            return JapaneseCalendar::Create(m_Resources.directory, outSystem);
        }
        if (HistoricCalendar::IsHistoricVariant(variant)) {
            return HistoricCalendar::Create(variant, outSystem);
        }
        if (HijriTabularCalendar::IsKnownBase(variant.substr(0, variant.find(':')))) {
            return HijriTabularCalendar::Create(variant, outSystem);
        }
        if (HijriAstronomicalCalendar::IsTableVariant(variant)) {
            return HijriAstronomicalCalendar::Create(variant, m_Resources.directory, outSystem);
        }
        return StatusCode::UnsupportedVariant;
    }
}
