#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace almanac {
    enum class Leniency {
        Strict,
        Smart,
        Lax
    };

    struct ResourceConfig {
        std::string directory;
        std::vector<std::string> preload;
    };

    struct LoggingConfig {
        bool enabled;
        bool verbose;
    };

    struct EngineConfig {
        ResourceConfig resources;
        LoggingConfig logging;
        Leniency defaultLeniency;
        std::string defaultHistory;
        std::string weekCountry;
        std::vector<std::string> featureFlags;
    };

    EngineConfig MakeDefaultConfig();
}
