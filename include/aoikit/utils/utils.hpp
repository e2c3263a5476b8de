#pragma once

#include <cmath>

#include <datapod/datapod.hpp>

namespace aoikit {

    namespace utils {

        /// WGS84 coordinate limits in degrees
        constexpr double MIN_LNG = -180.0;
        constexpr double MAX_LNG = 180.0;
        constexpr double MIN_LAT = -90.0;
        constexpr double MAX_LAT = 90.0;

        /**
         * @brief Check if two points share the exact same (lng, lat)
         *
         * No tolerance: ring closure compares coordinates bit for bit.
         */
        inline bool same_coordinate(const datapod::Point &p1, const datapod::Point &p2) {
            return p1.x == p2.x && p1.y == p2.y;
        }

        /**
         * @brief Squared planar distance between two points in degree space
         */
        inline double sq_distance(const datapod::Point &p1, const datapod::Point &p2) {
            double dx = p1.x - p2.x;
            double dy = p1.y - p2.y;
            return dx * dx + dy * dy;
        }

        /**
         * @brief Squared distance from a point to the segment [a, b]
         *
         * The projection is clamped to the segment ends. A zero-length segment
         * degrades to the point-to-point distance.
         *
         * @param point The point
         * @param a Segment start
         * @param b Segment end
         * @return Squared distance in degrees^2
         */
        inline double sq_segment_distance(const datapod::Point &point, const datapod::Point &a,
                                          const datapod::Point &b) {
            double x = a.x;
            double y = a.y;
            double dx = b.x - x;
            double dy = b.y - y;

            if (dx != 0.0 || dy != 0.0) {
                double t = ((point.x - x) * dx + (point.y - y) * dy) / (dx * dx + dy * dy);
                if (t > 1.0) {
                    x = b.x;
                    y = b.y;
                } else if (t > 0.0) {
                    x += dx * t;
                    y += dy * t;
                }
            }

            dx = point.x - x;
            dy = point.y - y;
            return dx * dx + dy * dy;
        }

        /**
         * @brief Check if a point lies within [-180,180] x [-90,90]
         *
         * NaN and infinite values are never in range.
         */
        inline bool in_wgs84_range(const datapod::Point &point) {
            if (!std::isfinite(point.x) || !std::isfinite(point.y))
                return false;
            return point.x >= MIN_LNG && point.x <= MAX_LNG && point.y >= MIN_LAT && point.y <= MAX_LAT;
        }

    } // namespace utils

} // namespace aoikit
