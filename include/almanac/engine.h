#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "almanac/calendar_date.h"
#include "almanac/calendars/calendar_system.h"
#include "almanac/config.h"
#include "almanac/epoch.h"
#include "almanac/status.h"
#include "almanac/variant_registry.h"
#include "almanac/week_model.h"

namespace almanac {
    // Feature flag: build the default history calendar while creating the engine.
    inline constexpr std::string_view kFlagEagerHistory = "eager-history";

    class AlmanacEngine {
    public:
        static StatusCode Create(const EngineConfig &config, std::unique_ptr<AlmanacEngine> &outEngine);

        ~AlmanacEngine();

        StatusCode Calendar(std::string_view variant, CalendarSystemPtr &outSystem);

        // Calendar named by defaultHistory.
        StatusCode DefaultHistory(CalendarSystemPtr &outSystem);

        StatusCode FromEpochDay(std::string_view variant, EpochDay day, CalendarDate &outDate);

        StatusCode ToEpochDay(const CalendarDate &date, EpochDay &outDay);

        // Same day expressed in the target calendar.
        StatusCode Convert(const CalendarDate &date, std::string_view targetVariant, CalendarDate &outDate);

        // Ok for a date its calendar accepts, otherwise the calendar's verdict.
        StatusCode Validate(const CalendarDate &date);

        // Era resolution with the configured default leniency.
        StatusCode Resolve(const CalendarDate &date, CalendarDate &outDate);

        StatusCode Resolve(const CalendarDate &date, Leniency leniency, CalendarDate &outDate);

        StatusCode Encode(const CalendarDate &date, std::vector<std::uint8_t> &outBytes);

        // Decodes and checks the date against its calendar.
        StatusCode Decode(const std::vector<std::uint8_t> &bytes, CalendarDate &outDate);

        // Replaces the configuration and starts over with a fresh registry.
        // Systems handed out before stay usable.
        StatusCode Reconfigure(const EngineConfig &config);

        const EngineConfig &Config() const;

        VariantRegistry &Registry();

        const VariantRegistry &Registry() const;

        WeekModel DefaultWeekModel() const;

    private:
        struct Impl;
        std::unique_ptr<Impl> m_Impl;

        explicit AlmanacEngine(std::unique_ptr<Impl> impl);
    };
}
