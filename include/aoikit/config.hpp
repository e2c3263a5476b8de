#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "aoikit/cache.hpp"
#include "aoikit/normalize.hpp"

namespace aoikit {

    /// Default GeoServer WMS endpoint
    inline const std::string DEFAULT_WMS_URL = "https://geoserver01.haketech.com/geoserver/wms";

    /**
     * @brief Runtime settings of the AOI and feature lookup core
     */
    struct Config {
        double tolerance_deg = DEFAULT_TOLERANCE_DEG;
        CacheConfig cache;
        std::chrono::milliseconds sweep_interval{std::chrono::minutes(5)};
        std::string wms_url = DEFAULT_WMS_URL;
    };

    /// Returns the value of a variable, or nullptr when unset
    using EnvLookup = std::function<const char *(const char *)>;

    /**
     * @brief Build a Config from environment variables
     *
     * Recognised variables, all optional:
     *  - AOIKIT_SIMPLIFY_TOLERANCE  degrees, >= 0
     *  - AOIKIT_CACHE_TTL_MS        milliseconds, 1..MAX_CACHE_TTL
     *  - AOIKIT_CACHE_MAX_SIZE      entries, > 0
     *  - AOIKIT_SWEEP_INTERVAL_MS   milliseconds, 1..MAX_SWEEP_INTERVAL
     *  - AOIKIT_WMS_URL             upstream endpoint
     *
     * @param lookup Variable source, std::getenv by default
     * @throws std::invalid_argument for malformed or out of range values
     */
    Config load_config(const EnvLookup &lookup);

    Config load_config_from_env();

} // namespace aoikit
