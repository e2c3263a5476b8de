#pragma once

#include <cmath>
#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>

#include <datapod/datapod.hpp>

#include "aoikit/geometry.hpp"

namespace aoikit {

    using BPoint = boost::geometry::model::d2::point_xy<double>;
    using BPolygon = boost::geometry::model::polygon<BPoint>;
    using BMultiPolygon = boost::geometry::model::multi_polygon<BPolygon>;
    using BBox = boost::geometry::model::box<BPoint>;

    namespace utils {

        inline BPoint to_boost(const datapod::Point &point) { return BPoint(point.x, point.y); }

        inline BBox to_boost(const datapod::AABB &box) {
            return BBox(BPoint(box.min_point.x, box.min_point.y), BPoint(box.max_point.x, box.max_point.y));
        }

        /**
         * @brief Convert a polygon to boost, first ring as outer, the rest as holes
         *
         * Winding order is corrected for boost's clockwise convention.
         */
        inline BPolygon to_boost(const Polygon &polygon) {
            BPolygon out;
            for (std::size_t r = 0; r < polygon.rings.size(); ++r) {
                if (r == 0) {
                    for (const auto &pt : polygon.rings[r].vertices)
                        out.outer().emplace_back(pt.x, pt.y);
                } else {
                    out.inners().emplace_back();
                    for (const auto &pt : polygon.rings[r].vertices)
                        out.inners().back().emplace_back(pt.x, pt.y);
                }
            }
            boost::geometry::correct(out);
            return out;
        }

        inline BMultiPolygon to_boost(const MultiPolygon &multi) {
            BMultiPolygon out;
            for (const auto &poly : multi.polygons)
                out.push_back(to_boost(poly));
            return out;
        }

    } // namespace utils

    /**
     * @brief Parse a "minLng,minLat,maxLng,maxLat" query string
     *
     * @param text Comma separated bounding box
     * @return The box as an AABB with z = 0
     * @throws std::invalid_argument unless there are exactly four finite numbers
     */
    inline datapod::AABB parse_bbox(const std::string &text) {
        std::vector<double> values;
        std::stringstream ss(text);
        std::string part;

        while (std::getline(ss, part, ',')) {
            std::size_t used = 0;
            double v = 0.0;
            try {
                v = std::stod(part, &used);
            } catch (const std::exception &) {
                throw std::invalid_argument("invalid bbox parameter: " + text);
            }
            // Allow surrounding blanks only
            if (part.find_first_not_of(" \t", used) != std::string::npos || !std::isfinite(v))
                throw std::invalid_argument("invalid bbox parameter: " + text);
            values.push_back(v);
        }

        if (values.size() != 4 || (!text.empty() && text.back() == ','))
            throw std::invalid_argument("invalid bbox parameter: " + text);

        return datapod::AABB{datapod::Point{values[0], values[1], 0.0}, datapod::Point{values[2], values[3], 0.0}};
    }

    /**
     * @brief Closed five point ring tracing a bounding box
     */
    inline Ring bbox_ring(const datapod::AABB &box) {
        return make_ring({{box.min_point.x, box.min_point.y},
                          {box.max_point.x, box.min_point.y},
                          {box.max_point.x, box.max_point.y},
                          {box.min_point.x, box.max_point.y},
                          {box.min_point.x, box.min_point.y}});
    }

    inline Geometry bbox_polygon(const datapod::AABB &box) { return make_polygon({bbox_ring(box)}); }

    /**
     * @brief Envelope of a geometry in (lng, lat)
     */
    inline datapod::AABB envelope(const Geometry &geometry) {
        BBox env;
        switch (geometry.type()) {
        case GeometryType::Point:
            env = BBox(utils::to_boost(geometry.point()), utils::to_boost(geometry.point()));
            break;
        case GeometryType::Polygon:
            env = boost::geometry::return_envelope<BBox>(utils::to_boost(geometry.polygon()));
            break;
        case GeometryType::MultiPolygon:
            env = boost::geometry::return_envelope<BBox>(utils::to_boost(geometry.multi_polygon()));
            break;
        }
        return datapod::AABB{datapod::Point{env.min_corner().x(), env.min_corner().y(), 0.0},
                             datapod::Point{env.max_corner().x(), env.max_corner().y(), 0.0}};
    }

    /**
     * @brief Check if a geometry touches or overlaps a bounding box
     *
     * Holes are respected: a box lying strictly inside a hole does not
     * intersect the polygon.
     */
    inline bool intersects(const Geometry &geometry, const datapod::AABB &box) {
        BBox b = utils::to_boost(box);
        switch (geometry.type()) {
        case GeometryType::Point:
            return boost::geometry::intersects(utils::to_boost(geometry.point()), b);
        case GeometryType::Polygon:
            return boost::geometry::intersects(utils::to_boost(geometry.polygon()), b);
        case GeometryType::MultiPolygon:
            return boost::geometry::intersects(utils::to_boost(geometry.multi_polygon()), b);
        }
        return false;
    }

} // namespace aoikit
