#include "almanac/config.h"

#ifndef ALMANAC_DATA_DIR
#define ALMANAC_DATA_DIR "data"
#endif

namespace almanac {

EngineConfig MakeDefaultConfig() {
    EngineConfig config{};
    config.resources = ResourceConfig{ALMANAC_DATA_DIR, {}};
    config.logging = LoggingConfig{true, false};
    config.defaultLeniency = Leniency::Smart;
    config.defaultHistory = "historic-first-reform";
    return config;
}

}
