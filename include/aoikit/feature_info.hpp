#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "aoikit/cache.hpp"

namespace aoikit {

    /**
     * @brief Parameters of a WMS GetFeatureInfo lookup
     */
    struct FeatureInfoQuery {
        int x = 0;          ///< Pixel column, >= 0
        int y = 0;          ///< Pixel row, >= 0
        std::string bbox;   ///< Map extent, passed through verbatim
        int width = 1;      ///< Map width in pixels, >= 1
        int height = 1;     ///< Map height in pixels, >= 1
        std::string layers; ///< Comma joined layer names
    };

    /**
     * @brief Reject queries the upstream server cannot answer
     *
     * @throws std::invalid_argument naming the offending field
     */
    void validate(const FeatureInfoQuery &query);

    /**
     * @brief Cache key for a query
     *
     * Order sensitive. Free-text fields are length prefixed, so two queries
     * give the same key only when every field matches.
     */
    std::string fingerprint(const FeatureInfoQuery &query);

    /**
     * @brief GetFeatureInfo parameters in request order
     */
    std::vector<std::pair<std::string, std::string>> wms_params(const FeatureInfoQuery &query);

    /**
     * @brief Full GetFeatureInfo URL with percent-encoded values
     *
     * @param base WMS endpoint, e.g. https://host/geoserver/wms
     * @param query The lookup
     */
    std::string wms_url(const std::string &base, const FeatureInfoQuery &query);

    /**
     * @brief Failure of the upstream feature service
     */
    class UpstreamError : public std::runtime_error {
      public:
        explicit UpstreamError(const std::string &what) : std::runtime_error(what) {}
    };

    /**
     * @brief The external feature service
     */
    class FeatureSource {
      public:
        virtual ~FeatureSource() = default;

        /**
         * @brief Fetch the response body for a query
         *
         * @throws UpstreamError when the service fails or answers with an error status
         */
        virtual std::string fetch(const FeatureInfoQuery &query) = 0;
    };

    /**
     * @brief Feature lookups served from a TtlCache, falling back to a FeatureSource
     *
     * Only successful upstream responses are stored. The cache and the source
     * are borrowed and must outlive the lookup.
     */
    class FeatureLookup {
      public:
        FeatureLookup(TtlCache &cache, FeatureSource &source) : cache_(cache), source_(source) {}

        /**
         * @brief Answer a query, from cache when a live entry exists
         *
         * @throws std::invalid_argument for an invalid query
         * @throws UpstreamError (or whatever the source throws) on a failed fetch,
         *         leaving the cache untouched
         */
        std::string lookup(const FeatureInfoQuery &query);

      private:
        TtlCache &cache_;
        FeatureSource &source_;
    };

} // namespace aoikit
