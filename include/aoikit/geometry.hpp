#pragma once

#include <array>
#include <cstddef>
#include <utility>
#include <variant>
#include <vector>

#include <datapod/datapod.hpp>

namespace aoikit {

    /**
     * @brief A ring is one closed boundary of a polygon
     *
     * Vertices hold (lng, lat) as (x, y); z is always zero.
     */
    using Ring = datapod::Polygon;

    /**
     * @brief Polygon made of an outer ring followed by optional holes
     */
    struct Polygon {
        std::vector<Ring> rings;
    };

    /**
     * @brief Ordered collection of polygons
     */
    struct MultiPolygon {
        std::vector<Polygon> polygons;
    };

    /**
     * @brief Discriminant of a Geometry
     *
     * Values follow the alternative order of Geometry::Storage.
     */
    enum class GeometryType {
        Point,        ///< Single (lng, lat) pair
        Polygon,      ///< Outer ring plus holes
        MultiPolygon, ///< Several polygons
    };

    /**
     * @brief Tagged union over the three AOI geometry kinds
     */
    class Geometry {
      public:
        using Storage = std::variant<datapod::Point, Polygon, MultiPolygon>;

        Geometry() = default;
        Geometry(const datapod::Point &point) : storage_(point) {}
        Geometry(Polygon polygon) : storage_(std::move(polygon)) {}
        Geometry(MultiPolygon multi) : storage_(std::move(multi)) {}

        GeometryType type() const { return static_cast<GeometryType>(storage_.index()); }

        const datapod::Point &point() const { return std::get<datapod::Point>(storage_); }
        datapod::Point &point() { return std::get<datapod::Point>(storage_); }

        const Polygon &polygon() const { return std::get<Polygon>(storage_); }
        Polygon &polygon() { return std::get<Polygon>(storage_); }

        const MultiPolygon &multi_polygon() const { return std::get<MultiPolygon>(storage_); }
        MultiPolygon &multi_polygon() { return std::get<MultiPolygon>(storage_); }

      private:
        Storage storage_;
    };

    /**
     * @brief Build a ring from raw (lng, lat) pairs, as received from a client
     *
     * The ring is taken as-is: it is neither closed nor checked here.
     */
    inline Ring make_ring(const std::vector<std::array<double, 2>> &coords) {
        Ring ring;
        ring.vertices.reserve(coords.size());
        for (const auto &c : coords) {
            ring.vertices.push_back(datapod::Point{c[0], c[1], 0.0});
        }
        return ring;
    }

    inline Geometry make_point(double lng, double lat) { return Geometry(datapod::Point{lng, lat, 0.0}); }

    inline Geometry make_polygon(std::vector<Ring> rings) { return Geometry(Polygon{std::move(rings)}); }

    inline Geometry make_multi_polygon(std::vector<Polygon> polygons) {
        return Geometry(MultiPolygon{std::move(polygons)});
    }

    /**
     * @brief Total number of coordinate pairs held by a geometry
     */
    inline std::size_t vertex_count(const Geometry &geometry) {
        std::size_t count = 0;
        switch (geometry.type()) {
        case GeometryType::Point:
            count = 1;
            break;
        case GeometryType::Polygon:
            for (const auto &ring : geometry.polygon().rings)
                count += ring.vertices.size();
            break;
        case GeometryType::MultiPolygon:
            for (const auto &poly : geometry.multi_polygon().polygons)
                for (const auto &ring : poly.rings)
                    count += ring.vertices.size();
            break;
        }
        return count;
    }

} // namespace aoikit
