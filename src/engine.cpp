#include "almanac/engine.h"

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>

#include "almanac/codec.h"

namespace almanac {

namespace {

bool HasFlag(const EngineConfig &config, std::string_view flag) {
    return std::find(config.featureFlags.begin(), config.featureFlags.end(), flag) != config.featureFlags.end();
}

StatusCode BuildRegistry(const EngineConfig &config, std::unique_ptr<VariantRegistry> &outRegistry) {
    auto registry = std::make_unique<VariantRegistry>(config.resources, config.logging);
    auto status = registry->Initialize();
    if (status != StatusCode::Ok) {
        return status;
    }
    if (HasFlag(config, kFlagEagerHistory)) {
        CalendarSystemPtr history;
        status = registry->Get(config.defaultHistory, history);
        if (status != StatusCode::Ok) {
            return status;
        }
    }
    outRegistry = std::move(registry);
    return StatusCode::Ok;
}

}

struct AlmanacEngine::Impl {
    EngineConfig m_Config;
    std::unique_ptr<VariantRegistry> m_Registry;

    void Log(std::string_view message) const {
        if (m_Config.logging.enabled) {
            std::cout << "[Engine] " << message << std::endl;
        }
    }

    StatusCode SystemOf(const CalendarDate &date, CalendarSystemPtr &outSystem) {
        auto status = m_Registry->Get(date.variant, outSystem);
        if (status != StatusCode::Ok) {
            return status;
        }
        return outSystem->Family() == date.family ? StatusCode::Ok : StatusCode::InvalidArgument;
    }
};

StatusCode AlmanacEngine::Create(const EngineConfig &config, std::unique_ptr<AlmanacEngine> &outEngine) {
    auto impl = std::make_unique<Impl>();
    impl->m_Config = config;
    auto status = BuildRegistry(config, impl->m_Registry);
    if (status != StatusCode::Ok) {
        if (config.logging.enabled) {
            std::cout << "[Engine] create failed: " << StatusName(status) << std::endl;
        }
        return status;
    }
    impl->Log("created with resources at " + impl->m_Config.resources.directory);
    outEngine.reset(new AlmanacEngine(std::move(impl)));
    return StatusCode::Ok;
}

AlmanacEngine::AlmanacEngine(std::unique_ptr<Impl> impl) : m_Impl(std::move(impl)) {}

AlmanacEngine::~AlmanacEngine() = default;

StatusCode AlmanacEngine::Calendar(std::string_view variant, CalendarSystemPtr &outSystem) {
    return m_Impl->m_Registry->Get(variant, outSystem);
}

StatusCode AlmanacEngine::DefaultHistory(CalendarSystemPtr &outSystem) {
    return m_Impl->m_Registry->Get(m_Impl->m_Config.defaultHistory, outSystem);
}

StatusCode AlmanacEngine::FromEpochDay(std::string_view variant, EpochDay day, CalendarDate &outDate) {
    CalendarSystemPtr system;
    auto status = Calendar(variant, system);
    if (status != StatusCode::Ok) {
        return status;
    }
    return system->FromEpochDay(day, outDate);
}

StatusCode AlmanacEngine::ToEpochDay(const CalendarDate &date, EpochDay &outDay) {
    CalendarSystemPtr system;
    auto status = m_Impl->SystemOf(date, system);
    if (status != StatusCode::Ok) {
        return status;
    }
    return system->ToEpochDay(date, outDay);
}

StatusCode AlmanacEngine::Convert(const CalendarDate &date, std::string_view targetVariant, CalendarDate &outDate) {
    EpochDay day = 0;
    auto status = ToEpochDay(date, day);
    if (status != StatusCode::Ok) {
        return status;
    }
    CalendarDate converted;
    status = FromEpochDay(targetVariant, day, converted);
    if (status != StatusCode::Ok) {
        return status;
    }
    if (m_Impl->m_Config.logging.enabled && m_Impl->m_Config.logging.verbose) {
        std::cout << "[Engine] " << FormatDate(date) << " -> " << FormatDate(converted) << " (epoch day " << day << ")"
                  << std::endl;
    }
    outDate = std::move(converted);
    return StatusCode::Ok;
}

StatusCode AlmanacEngine::Validate(const CalendarDate &date) {
    EpochDay day = 0;
    return ToEpochDay(date, day);
}

StatusCode AlmanacEngine::Resolve(const CalendarDate &date, CalendarDate &outDate) {
    return Resolve(date, m_Impl->m_Config.defaultLeniency, outDate);
}

StatusCode AlmanacEngine::Resolve(const CalendarDate &date, Leniency leniency, CalendarDate &outDate) {
    CalendarSystemPtr system;
    auto status = m_Impl->SystemOf(date, system);
    if (status != StatusCode::Ok) {
        return status;
    }
    return system->ResolveEra(date, leniency, outDate);
}

StatusCode AlmanacEngine::Encode(const CalendarDate &date, std::vector<std::uint8_t> &outBytes) {
    auto status = Validate(date);
    if (status != StatusCode::Ok) {
        return status;
    }
    return DateCodec::Encode(date, outBytes);
}

StatusCode AlmanacEngine::Decode(const std::vector<std::uint8_t> &bytes, CalendarDate &outDate) {
    CalendarDate date;
    auto status = DateCodec::Decode(bytes, date);
    if (status != StatusCode::Ok) {
        return status;
    }
    status = Validate(date);
    if (status != StatusCode::Ok) {
        return status;
    }
    outDate = std::move(date);
    return StatusCode::Ok;
}

StatusCode AlmanacEngine::Reconfigure(const EngineConfig &config) {
    std::unique_ptr<VariantRegistry> registry;
    auto status = BuildRegistry(config, registry);
    if (status != StatusCode::Ok) {
        m_Impl->Log(std::string("reconfigure failed: ") + std::string(StatusName(status)));
        return status;
    }
    m_Impl->m_Config = config;
    m_Impl->m_Registry = std::move(registry);
    m_Impl->Log("reconfigured");
    return StatusCode::Ok;
}

const EngineConfig &AlmanacEngine::Config() const {
    return m_Impl->m_Config;
}

VariantRegistry &AlmanacEngine::Registry() {
    return *m_Impl->m_Registry;
}

const VariantRegistry &AlmanacEngine::Registry() const {
    return *m_Impl->m_Registry;
}

WeekModel AlmanacEngine::DefaultWeekModel() const {
    return WeekModelForCountry(m_Impl->m_Config.weekCountry);
}

}
