#pragma once

/**
 * @file aoikit.hpp
 * @brief Geometry normalization and cached feature lookups for an AOI map service
 *
 * Includes:
 * - geometry.hpp: Point / Polygon / MultiPolygon tagged union
 * - normalize.hpp: ring closing, Douglas-Peucker simplification, bounds checks
 * - bbox.hpp: bounding box parsing and spatial filtering
 * - aoi.hpp: AOI records and the storage interface
 * - cache.hpp, sweeper.hpp: bounded TTL cache and its periodic cleanup
 * - feature_info.hpp: WMS GetFeatureInfo queries served through the cache
 * - config.hpp: runtime settings
 */

#include "aoikit/aoi.hpp"
#include "aoikit/bbox.hpp"
#include "aoikit/cache.hpp"
#include "aoikit/config.hpp"
#include "aoikit/feature_info.hpp"
#include "aoikit/geometry.hpp"
#include "aoikit/normalize.hpp"
#include "aoikit/sweeper.hpp"
