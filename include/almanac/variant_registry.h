#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "almanac/calendars/calendar_system.h"
#include "almanac/config.h"
#include "almanac/status.h"

namespace almanac {
    // Memoizing lookup from variant string to calendar system. Systems are
    // built outside the lock; when two threads race on one variant the first
    // inserted instance wins and every caller receives it.
    class VariantRegistry {
    public:
        struct Metrics {
            std::uint64_t lookups;
            std::uint64_t hits;
            std::uint64_t constructions;
            std::uint64_t failedConstructions;
            std::uint64_t discardedConstructions;
        };

        VariantRegistry(ResourceConfig resources, LoggingConfig logging);

        VariantRegistry(const VariantRegistry &) = delete;
        VariantRegistry &operator=(const VariantRegistry &) = delete;

        // Builds coptic, indian and chinese plus every configured preload variant.
        StatusCode Initialize();

        StatusCode Get(std::string_view variant, CalendarSystemPtr &outSystem);

        bool Contains(std::string_view variant) const;

        // Cached variant keys, sorted.
        std::vector<std::string> Variants() const;

        Metrics GetMetrics() const;

        const ResourceConfig &Resources() const noexcept;

    private:
        ResourceConfig m_Resources;
        LoggingConfig m_Logging;
        mutable std::mutex m_Mutex;
        std::unordered_map<std::string, CalendarSystemPtr> m_Systems;
        Metrics m_Metrics;

        StatusCode Construct(std::string_view variant, std::unique_ptr<CalendarSystem> &outSystem) const;
    };
}
