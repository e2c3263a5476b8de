#include "doctest/doctest.h"
#include "aoikit/aoi.hpp"
#include "aoikit/bbox.hpp"

#include <set>
#include <string>

namespace {

    aoikit::Geometry square_at(double lng, double lat, double size) {
        return aoikit::make_polygon({aoikit::make_ring(
            {{lng, lat}, {lng + size, lat}, {lng + size, lat + size}, {lng, lat + size}, {lng, lat}})});
    }

} // namespace

TEST_CASE("AOI assembly") {
    SUBCASE("Normalized geometry and metadata") {
        auto open = aoikit::make_ring({{1, 1}, {2, 1}, {2, 2}, {1, 2}});
        auto aoi = aoikit::make_aoi("user_1", "Field", "North plot", aoikit::make_polygon({open}));

        CHECK(aoi.user_id == "user_1");
        CHECK(aoi.name == "Field");
        CHECK(aoi.description == "North plot");
        CHECK(aoi.id.size() == 36);
        REQUIRE(aoi.geometry.type() == aoikit::GeometryType::Polygon);
        CHECK(aoi.geometry.polygon().rings.front().vertices.size() == 5);
    }

    SUBCASE("Every AOI gets its own id") {
        std::set<std::string> ids;
        for (int i = 0; i < 20; ++i)
            ids.insert(aoikit::make_aoi("u", "", "", aoikit::make_point(0.0, 0.0)).id);
        CHECK(ids.size() == 20);
    }

    SUBCASE("Out of range geometry is refused") {
        CHECK_THROWS_AS(aoikit::make_aoi("u", "bad", "", aoikit::make_point(200.0, 10.0)), aoikit::OutOfBounds);
    }
}

TEST_CASE("Memory AOI store") {
    aoikit::MemoryAoiStore store;

    SUBCASE("Public samples are seeded once") {
        CHECK(aoikit::seed_public_samples(store));
        CHECK(store.count(aoikit::PUBLIC_USER) == 2);
        CHECK_FALSE(aoikit::seed_public_samples(store));
        CHECK(store.count(aoikit::PUBLIC_USER) == 2);
    }

    SUBCASE("Users see their own AOIs and the public ones") {
        aoikit::seed_public_samples(store);
        store.insert(aoikit::make_aoi("alice", "A", "", square_at(10, 10, 1)));
        store.insert(aoikit::make_aoi("bob", "B", "", square_at(20, 20, 1)));

        auto alice = store.find("alice");
        CHECK(alice.size() == 3);
        for (const auto &a : alice)
            CHECK((a.user_id == "alice" || a.user_id == aoikit::PUBLIC_USER));

        CHECK(store.find("carol").size() == 2);
    }

    SUBCASE("Newest first") {
        store.insert(aoikit::make_aoi("alice", "first", "", square_at(0, 0, 1)));
        store.insert(aoikit::make_aoi("alice", "second", "", square_at(0, 0, 1)));
        store.insert(aoikit::make_aoi("alice", "third", "", square_at(0, 0, 1)));

        auto found = store.find("alice");
        REQUIRE(found.size() == 3);
        CHECK(found[0].name == "third");
        CHECK(found[2].name == "first");
    }

    SUBCASE("Bounding box filter") {
        aoikit::seed_public_samples(store);
        store.insert(aoikit::make_aoi("alice", "near", "", square_at(91.28, 23.83, 0.005)));
        store.insert(aoikit::make_aoi("alice", "far", "", square_at(0, 0, 1)));

        auto found = store.find("alice", aoikit::parse_bbox("91.28,23.83,91.29,23.84"));
        std::set<std::string> names;
        for (const auto &a : found)
            names.insert(a.name);

        CHECK(names.count("near") == 1);
        CHECK(names.count("Sample AOI - Downtown") == 1);
        CHECK(names.count("far") == 0);
        CHECK(names.count("Sample AOI - Park Marker") == 0);
    }
}
