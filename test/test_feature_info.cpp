#include "doctest/doctest.h"
#include "aoikit/feature_info.hpp"

#include <stdexcept>
#include <string>

namespace {

    aoikit::FeatureInfoQuery sample_query() {
        aoikit::FeatureInfoQuery q;
        q.x = 10;
        q.y = 20;
        q.bbox = "91.27,23.82,91.31,23.86";
        q.width = 256;
        q.height = 256;
        q.layers = "topp:parcels,topp:roads";
        return q;
    }

    class CountingSource : public aoikit::FeatureSource {
      public:
        std::string fetch(const aoikit::FeatureInfoQuery &query) override {
            ++calls;
            if (fail)
                throw aoikit::UpstreamError("WMS request failed: 503 Service Unavailable");
            return "{\"x\":" + std::to_string(query.x) + "}";
        }

        int calls = 0;
        bool fail = false;
    };

} // namespace

TEST_CASE("Fingerprint") {
    auto q = sample_query();

    SUBCASE("Deterministic") {
        CHECK(aoikit::fingerprint(q) == aoikit::fingerprint(q));
        CHECK(aoikit::fingerprint(q) == aoikit::fingerprint(sample_query()));
    }

    SUBCASE("Any single field changes the key") {
        const std::string base = aoikit::fingerprint(q);

        auto x = q;
        x.x += 1;
        CHECK(aoikit::fingerprint(x) != base);

        auto y = q;
        y.y += 1;
        CHECK(aoikit::fingerprint(y) != base);

        auto bbox = q;
        bbox.bbox = "91.27,23.82,91.31,23.87";
        CHECK(aoikit::fingerprint(bbox) != base);

        auto width = q;
        width.width = 512;
        CHECK(aoikit::fingerprint(width) != base);

        auto height = q;
        height.height = 128;
        CHECK(aoikit::fingerprint(height) != base);

        auto layers = q;
        layers.layers = "topp:roads,topp:parcels";
        CHECK(aoikit::fingerprint(layers) != base);
    }

    SUBCASE("Separators inside fields do not collide") {
        auto a = q;
        a.layers = "a|1";
        a.x = 2;
        auto b = q;
        b.layers = "a";
        b.x = 1;
        CHECK(aoikit::fingerprint(a) != aoikit::fingerprint(b));
    }
}

TEST_CASE("Query validation") {
    CHECK_NOTHROW(aoikit::validate(sample_query()));

    auto q = sample_query();
    q.x = -1;
    CHECK_THROWS_AS(aoikit::validate(q), std::invalid_argument);

    q = sample_query();
    q.y = -5;
    CHECK_THROWS_AS(aoikit::validate(q), std::invalid_argument);

    q = sample_query();
    q.width = 0;
    CHECK_THROWS_AS(aoikit::validate(q), std::invalid_argument);

    q = sample_query();
    q.height = 0;
    CHECK_THROWS_AS(aoikit::validate(q), std::invalid_argument);

    q = sample_query();
    q.layers.clear();
    CHECK_THROWS_AS(aoikit::validate(q), std::invalid_argument);

    q = sample_query();
    q.bbox.clear();
    CHECK_THROWS_AS(aoikit::validate(q), std::invalid_argument);
}

TEST_CASE("WMS request building") {
    auto q = sample_query();

    SUBCASE("Parameters in request order") {
        auto params = aoikit::wms_params(q);
        REQUIRE(params.size() == 13);
        CHECK(params[0].first == "service");
        CHECK(params[2].second == "GetFeatureInfo");
        CHECK(params[3].second == q.layers);
        CHECK(params[4].first == "query_layers");
        CHECK(params[6].second == "10");
        CHECK(params[12].second == "EPSG:4326");
    }

    SUBCASE("URL encodes values") {
        auto url = aoikit::wms_url("https://example.org/geoserver/wms", q);
        CHECK(url.rfind("https://example.org/geoserver/wms?service=WMS&version=1.1.1&request=GetFeatureInfo", 0) == 0);
        CHECK(url.find("layers=topp%3Aparcels%2Ctopp%3Aroads") != std::string::npos);
        CHECK(url.find("bbox=91.27%2C23.82%2C91.31%2C23.86") != std::string::npos);
        CHECK(url.find("info_format=application%2Fjson") != std::string::npos);
        CHECK(url.find("&x=10&y=20&") != std::string::npos);
        CHECK(url.find("&width=256&height=256&srs=EPSG%3A4326") != std::string::npos);
    }

    SUBCASE("Existing query string is extended") {
        auto url = aoikit::wms_url("https://example.org/wms?map=demo", q);
        CHECK(url.rfind("https://example.org/wms?map=demo&service=WMS", 0) == 0);
    }
}

TEST_CASE("Cached feature lookup") {
    aoikit::TtlCache cache;
    CountingSource source;
    aoikit::FeatureLookup lookup(cache, source);
    auto q = sample_query();

    SUBCASE("Miss fetches and stores, hit skips the upstream") {
        CHECK(lookup.lookup(q) == "{\"x\":10}");
        CHECK(source.calls == 1);
        CHECK(cache.get(aoikit::fingerprint(q)).has_value());

        CHECK(lookup.lookup(q) == "{\"x\":10}");
        CHECK(source.calls == 1);
    }

    SUBCASE("Different queries are fetched separately") {
        auto other = q;
        other.x = 11;
        lookup.lookup(q);
        lookup.lookup(other);
        CHECK(source.calls == 2);
        CHECK(cache.size() == 2);
    }

    SUBCASE("Upstream failure propagates and leaves the cache untouched") {
        source.fail = true;
        CHECK_THROWS_AS(lookup.lookup(q), aoikit::UpstreamError);
        CHECK(cache.size() == 0);

        source.fail = false;
        CHECK(lookup.lookup(q) == "{\"x\":10}");
        CHECK(source.calls == 2);
    }

    SUBCASE("Invalid query never reaches the upstream") {
        q.width = 0;
        CHECK_THROWS_AS(lookup.lookup(q), std::invalid_argument);
        CHECK(source.calls == 0);
        CHECK(cache.size() == 0);
    }
}
