#include "aoikit/config.hpp"

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include "aoikit/sweeper.hpp"

namespace aoikit {

    namespace {

        std::string trimmed(const std::string &s) {
            auto start = s.find_first_not_of(" \t");
            if (start == std::string::npos)
                return "";
            auto end = s.find_last_not_of(" \t");
            return s.substr(start, end - start + 1);
        }

        double parse_double(const char *name, const std::string &raw) {
            std::string value = trimmed(raw);
            std::size_t used = 0;
            double v = 0.0;
            try {
                v = std::stod(value, &used);
            } catch (const std::exception &) {
                throw std::invalid_argument(std::string(name) + ": not a number: " + raw);
            }
            if (used != value.size() || !std::isfinite(v))
                throw std::invalid_argument(std::string(name) + ": not a number: " + raw);
            return v;
        }

        long long parse_positive(const char *name, const std::string &raw) {
            std::string value = trimmed(raw);
            std::size_t used = 0;
            long long v = 0;
            try {
                v = std::stoll(value, &used);
            } catch (const std::exception &) {
                throw std::invalid_argument(std::string(name) + ": not an integer: " + raw);
            }
            if (used != value.size())
                throw std::invalid_argument(std::string(name) + ": not an integer: " + raw);
            if (v <= 0)
                throw std::invalid_argument(std::string(name) + ": must be positive");
            return v;
        }

        std::chrono::milliseconds parse_millis(const char *name, const std::string &raw,
                                               std::chrono::milliseconds max) {
            long long v = parse_positive(name, raw);
            if (v > max.count())
                throw std::invalid_argument(std::string(name) + ": must be at most " + std::to_string(max.count()));
            return std::chrono::milliseconds(v);
        }

    } // namespace

    Config load_config(const EnvLookup &lookup) {
        Config cfg;

        if (const char *v = lookup("AOIKIT_SIMPLIFY_TOLERANCE")) {
            cfg.tolerance_deg = parse_double("AOIKIT_SIMPLIFY_TOLERANCE", v);
            if (!(cfg.tolerance_deg >= 0.0))
                throw std::invalid_argument("AOIKIT_SIMPLIFY_TOLERANCE: must be >= 0");
        }
        if (const char *v = lookup("AOIKIT_CACHE_TTL_MS"))
            cfg.cache.ttl = parse_millis("AOIKIT_CACHE_TTL_MS", v, MAX_CACHE_TTL);
        if (const char *v = lookup("AOIKIT_CACHE_MAX_SIZE"))
            cfg.cache.max_size = static_cast<std::size_t>(parse_positive("AOIKIT_CACHE_MAX_SIZE", v));
        if (const char *v = lookup("AOIKIT_SWEEP_INTERVAL_MS"))
            cfg.sweep_interval = parse_millis("AOIKIT_SWEEP_INTERVAL_MS", v, MAX_SWEEP_INTERVAL);
        if (const char *v = lookup("AOIKIT_WMS_URL")) {
            std::string url = trimmed(v);
            if (url.empty())
                throw std::invalid_argument("AOIKIT_WMS_URL: empty");
            cfg.wms_url = url;
        }

        return cfg;
    }

    Config load_config_from_env() {
        return load_config([](const char *name) -> const char * { return std::getenv(name); });
    }

} // namespace aoikit
