#include "aoikit/feature_info.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace aoikit {

    namespace {

        std::string percent_encode(const std::string &value) {
            std::ostringstream out;
            out << std::hex << std::uppercase << std::setfill('0');
            for (unsigned char c : value) {
                bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                                  c == '-' || c == '_' || c == '.' || c == '~';
                if (unreserved)
                    out << c;
                else
                    out << '%' << std::setw(2) << static_cast<int>(c);
            }
            return out.str();
        }

    } // namespace

    void validate(const FeatureInfoQuery &query) {
        if (query.x < 0)
            throw std::invalid_argument("x must be >= 0");
        if (query.y < 0)
            throw std::invalid_argument("y must be >= 0");
        if (query.width < 1)
            throw std::invalid_argument("width must be >= 1");
        if (query.height < 1)
            throw std::invalid_argument("height must be >= 1");
        if (query.bbox.empty())
            throw std::invalid_argument("bbox is required");
        if (query.layers.empty())
            throw std::invalid_argument("layers is required");
    }

    std::string fingerprint(const FeatureInfoQuery &query) {
        std::ostringstream key;
        key << query.layers.size() << ':' << query.layers << '|' << query.x << '|' << query.y << '|'
            << query.bbox.size() << ':' << query.bbox << '|' << query.width << '|' << query.height;
        return key.str();
    }

    std::vector<std::pair<std::string, std::string>> wms_params(const FeatureInfoQuery &query) {
        return {
            {"service", "WMS"},
            {"version", "1.1.1"},
            {"request", "GetFeatureInfo"},
            {"layers", query.layers},
            {"query_layers", query.layers},
            {"info_format", "application/json"},
            {"feature_count", "10"},
            {"x", std::to_string(query.x)},
            {"y", std::to_string(query.y)},
            {"bbox", query.bbox},
            {"width", std::to_string(query.width)},
            {"height", std::to_string(query.height)},
            {"srs", "EPSG:4326"},
        };
    }

    std::string wms_url(const std::string &base, const FeatureInfoQuery &query) {
        std::string url = base;
        char sep = base.find('?') == std::string::npos ? '?' : '&';
        for (const auto &[name, value] : wms_params(query)) {
            url += sep;
            url += name;
            url += '=';
            url += percent_encode(value);
            sep = '&';
        }
        return url;
    }

    std::string FeatureLookup::lookup(const FeatureInfoQuery &query) {
        validate(query);
        std::string key = fingerprint(query);

        if (auto cached = cache_.get(key))
            return *cached;

        std::string body;
        try {
            body = source_.fetch(query);
        } catch (const std::exception &e) {
            std::cerr << "Feature info fetch failed: " << e.what() << std::endl;
            throw;
        }

        cache_.put(key, body);
        return body;
    }

} // namespace aoikit
