#pragma once

#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <datapod/datapod.hpp>

#include "aoikit/geometry.hpp"
#include "aoikit/utils/utils.hpp"

namespace aoikit {

    /// Default Douglas-Peucker tolerance, about 11 m at the equator
    constexpr double DEFAULT_TOLERANCE_DEG = 1e-4;

    /// Smallest valid ring: a triangle plus its closing point
    constexpr std::size_t MIN_RING_POINTS = 4;

    /**
     * @brief Raised when a normalized geometry leaves the WGS84 coordinate range
     */
    class OutOfBounds : public std::invalid_argument {
      public:
        explicit OutOfBounds(const std::string &what) : std::invalid_argument(what) {}
    };

    namespace detail {

        inline void close_ring(Ring &ring) {
            if (ring.vertices.empty())
                return;

            if (!utils::same_coordinate(ring.vertices.front(), ring.vertices.back())) {
                datapod::Point first = ring.vertices.front();
                ring.vertices.push_back(first);
            }
        }

        inline bool ring_in_range(const Ring &ring) {
            for (const auto &pt : ring.vertices) {
                if (!utils::in_wgs84_range(pt))
                    return false;
            }
            return true;
        }

        // Written as !(t >= 0) so NaN is rejected too
        inline void check_tolerance(double tolerance) {
            if (!(tolerance >= 0.0))
                throw std::invalid_argument("simplification tolerance must be >= 0");
        }

    } // namespace detail

    /**
     * @brief Simplify a single ring with Douglas-Peucker
     *
     * The ring is closed first if needed. Interior points closer than
     * `tolerance` to the chord of their sub-segment are dropped; the first and
     * last points are always kept. Rings of 4 points or less come back
     * untouched, and a result that would fall below 4 points is replaced by
     * the closed input ring.
     *
     * @param ring The ring to simplify
     * @param tolerance Distance tolerance in degrees (>= 0)
     * @return Simplified ring
     */
    inline Ring simplify_ring(const Ring &ring, double tolerance) {
        detail::check_tolerance(tolerance);

        if (ring.vertices.size() <= MIN_RING_POINTS)
            return ring;

        Ring closed = ring;
        detail::close_ring(closed);

        const auto &pts = closed.vertices;
        const std::size_t n = pts.size();
        const double sq_tol = tolerance * tolerance;
        constexpr std::size_t no_split = std::numeric_limits<std::size_t>::max();

        std::vector<bool> keep(n, false);
        keep[0] = true;
        keep[n - 1] = true;

        // Pending (first, last) sub-segments
        std::vector<std::pair<std::size_t, std::size_t>> stack;
        stack.emplace_back(0, n - 1);

        while (!stack.empty()) {
            auto [first, last] = stack.back();
            stack.pop_back();

            double max_sq_dist = sq_tol;
            std::size_t index = no_split;

            for (std::size_t i = first + 1; i < last; ++i) {
                double sq_dist = utils::sq_segment_distance(pts[i], pts[first], pts[last]);
                if (sq_dist > max_sq_dist) {
                    index = i;
                    max_sq_dist = sq_dist;
                }
            }

            if (index == no_split)
                continue;

            keep[index] = true;
            if (index - first > 1)
                stack.emplace_back(first, index);
            if (last - index > 1)
                stack.emplace_back(index, last);
        }

        Ring result;
        for (std::size_t i = 0; i < n; ++i) {
            if (keep[i])
                result.vertices.push_back(pts[i]);
        }

        if (result.vertices.size() < MIN_RING_POINTS)
            return closed;

        return result;
    }

    /**
     * @brief Close every ring of every polygon
     *
     * Appends a copy of the first point to each ring whose ends differ.
     * Idempotent; points pass through unchanged.
     */
    inline Geometry close_rings(Geometry geometry) {
        switch (geometry.type()) {
        case GeometryType::Point:
            break;
        case GeometryType::Polygon:
            for (auto &ring : geometry.polygon().rings)
                detail::close_ring(ring);
            break;
        case GeometryType::MultiPolygon:
            for (auto &poly : geometry.multi_polygon().polygons)
                for (auto &ring : poly.rings)
                    detail::close_ring(ring);
            break;
        }
        return geometry;
    }

    /**
     * @brief Simplify every ring of a geometry independently
     *
     * Distances are measured in raw (lng, lat) degrees with no projection, so
     * the effective tolerance shrinks east-west towards the poles.
     *
     * @param geometry Geometry to simplify
     * @param tolerance_deg Distance tolerance in degrees
     * @return Simplified geometry
     * @throws std::invalid_argument if the tolerance is negative or NaN
     */
    inline Geometry simplify(Geometry geometry, double tolerance_deg = DEFAULT_TOLERANCE_DEG) {
        detail::check_tolerance(tolerance_deg);
        switch (geometry.type()) {
        case GeometryType::Point:
            break;
        case GeometryType::Polygon:
            for (auto &ring : geometry.polygon().rings)
                ring = simplify_ring(ring, tolerance_deg);
            break;
        case GeometryType::MultiPolygon:
            for (auto &poly : geometry.multi_polygon().polygons)
                for (auto &ring : poly.rings)
                    ring = simplify_ring(ring, tolerance_deg);
            break;
        }
        return geometry;
    }

    /**
     * @brief Check that every coordinate lies within [-180,180] x [-90,90]
     */
    inline bool validate_bounds(const Geometry &geometry) {
        switch (geometry.type()) {
        case GeometryType::Point:
            return utils::in_wgs84_range(geometry.point());
        case GeometryType::Polygon:
            for (const auto &ring : geometry.polygon().rings) {
                if (!detail::ring_in_range(ring))
                    return false;
            }
            return true;
        case GeometryType::MultiPolygon:
            for (const auto &poly : geometry.multi_polygon().polygons) {
                for (const auto &ring : poly.rings) {
                    if (!detail::ring_in_range(ring))
                        return false;
                }
            }
            return true;
        }
        return false;
    }

    /**
     * @brief Close, simplify and bounds-check an incoming AOI geometry
     *
     * @param geometry Schema-validated geometry from the client
     * @param tolerance_deg Simplification tolerance in degrees
     * @return Geometry ready for storage
     * @throws OutOfBounds if any coordinate is outside the WGS84 range
     */
    inline Geometry normalize(Geometry geometry, double tolerance_deg = DEFAULT_TOLERANCE_DEG) {
        detail::check_tolerance(tolerance_deg);
        Geometry out = simplify(close_rings(std::move(geometry)), tolerance_deg);
        if (!validate_bounds(out))
            throw OutOfBounds("coordinates out of bounds");
        return out;
    }

} // namespace aoikit
