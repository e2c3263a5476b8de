#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <datapod/datapod.hpp>

#include "aoikit/geometry.hpp"
#include "aoikit/normalize.hpp"

namespace aoikit {

    /// Owner of the sample AOIs visible to every user
    inline const std::string PUBLIC_USER = "public";

    /**
     * @brief A stored Area of Interest
     */
    struct Aoi {
        std::string id;
        std::string user_id;
        std::string name;
        std::string description;
        Geometry geometry;
        std::chrono::system_clock::time_point created_at;
    };

    /**
     * @brief Build an AOI record from client input
     *
     * The geometry goes through normalize() and the record gets a random UUID
     * and the current time.
     *
     * @throws OutOfBounds if the normalized geometry leaves the WGS84 range
     */
    Aoi make_aoi(const std::string &user_id, const std::string &name, const std::string &description,
                 Geometry geometry, double tolerance_deg = DEFAULT_TOLERANCE_DEG);

    /**
     * @brief Storage collaborator for AOI records
     */
    class AoiStore {
      public:
        virtual ~AoiStore() = default;

        virtual void insert(Aoi aoi) = 0;

        /**
         * @brief AOIs owned by a user plus the public samples, newest first
         *
         * @param user_id Requesting user
         * @param bbox When set, only AOIs intersecting the box
         */
        virtual std::vector<Aoi> find(const std::string &user_id,
                                      const std::optional<datapod::AABB> &bbox = std::nullopt) const = 0;

        virtual std::size_t count(const std::string &user_id) const = 0;
    };

    /**
     * @brief In-process AoiStore
     */
    class MemoryAoiStore : public AoiStore {
      public:
        void insert(Aoi aoi) override;
        std::vector<Aoi> find(const std::string &user_id,
                              const std::optional<datapod::AABB> &bbox = std::nullopt) const override;
        std::size_t count(const std::string &user_id) const override;

      private:
        mutable std::mutex mutex_;
        std::vector<Aoi> records_;
    };

    /**
     * @brief Insert the two public sample AOIs unless public records already exist
     *
     * @return true if the samples were inserted
     */
    bool seed_public_samples(AoiStore &store);

} // namespace aoikit
