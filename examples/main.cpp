#include <array>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <datapod/datapod.hpp>

#include "aoikit/aoikit.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace {

    // Stands in for the GeoServer: the HTTP client lives outside this library
    class CannedSource : public aoikit::FeatureSource {
      public:
        explicit CannedSource(std::string base) : base_(std::move(base)) {}

        std::string fetch(const aoikit::FeatureInfoQuery &query) override {
            ++calls;
            std::cout << "  upstream GET " << aoikit::wms_url(base_, query) << std::endl;
            return R"({"type":"FeatureCollection","features":[]})";
        }

        int calls = 0;

      private:
        std::string base_;
    };

    // Hand drawn circle: many points, most of them redundant
    aoikit::Ring drawn_circle(double lng, double lat, double radius_deg, int points) {
        std::vector<std::array<double, 2>> coords;
        for (int i = 0; i < points; ++i) {
            double a = 2.0 * M_PI * i / points;
            coords.push_back({lng + radius_deg * std::cos(a), lat + radius_deg * std::sin(a)});
        }
        return aoikit::make_ring(coords);
    }

} // namespace

int main() {
    aoikit::Config cfg;
    try {
        cfg = aoikit::load_config_from_env();
    } catch (const std::invalid_argument &e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    // AOI creation
    aoikit::MemoryAoiStore store;
    aoikit::seed_public_samples(store);

    aoikit::Geometry circle = aoikit::make_polygon({drawn_circle(91.29, 23.84, 0.01, 2000)});
    std::cout << "Drawn AOI has " << aoikit::vertex_count(circle) << " points" << std::endl;

    aoikit::Aoi aoi = aoikit::make_aoi("user_demo", "Lake", "Drawn around the lake", circle, cfg.tolerance_deg);
    std::cout << "Stored AOI " << aoi.id << " with " << aoikit::vertex_count(aoi.geometry) << " points" << std::endl;
    store.insert(aoi);

    try {
        aoikit::make_aoi("user_demo", "Broken", "", aoikit::make_point(200.0, 10.0));
    } catch (const aoikit::OutOfBounds &e) {
        std::cout << "Rejected AOI: " << e.what() << std::endl;
    }

    auto visible = store.find("user_demo", aoikit::parse_bbox("91.28,23.83,91.29,23.84"));
    std::cout << visible.size() << " AOIs intersect the viewport" << std::endl;
    for (const auto &a : visible)
        std::cout << "  " << a.name << " (" << a.user_id << ")" << std::endl;

    // Feature lookups
    aoikit::TtlCache cache(cfg.cache);
    aoikit::CacheSweeper sweeper(cache, cfg.sweep_interval);
    CannedSource source(cfg.wms_url);
    aoikit::FeatureLookup lookup(cache, source);

    aoikit::FeatureInfoQuery query;
    query.x = 120;
    query.y = 88;
    query.bbox = "91.27,23.82,91.31,23.86";
    query.width = 256;
    query.height = 256;
    query.layers = "topp:parcels,topp:roads";

    for (int i = 0; i < 3; ++i) {
        std::string body = lookup.lookup(query);
        std::cout << "Lookup " << i << ": " << body << std::endl;
    }
    std::cout << "Upstream called " << source.calls << " time(s), cache holds " << cache.size() << std::endl;

    return 0;
}
