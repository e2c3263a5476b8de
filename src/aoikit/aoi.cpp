#include "aoikit/aoi.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "aoikit/bbox.hpp"

namespace aoikit {

    Aoi make_aoi(const std::string &user_id, const std::string &name, const std::string &description,
                 Geometry geometry, double tolerance_deg) {
        Aoi aoi;
        aoi.geometry = normalize(std::move(geometry), tolerance_deg);
        aoi.id = boost::uuids::to_string(boost::uuids::random_generator()());
        aoi.user_id = user_id;
        aoi.name = name;
        aoi.description = description;
        aoi.created_at = std::chrono::system_clock::now();
        return aoi;
    }

    void MemoryAoiStore::insert(Aoi aoi) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(std::move(aoi));
    }

    std::vector<Aoi> MemoryAoiStore::find(const std::string &user_id, const std::optional<datapod::AABB> &bbox) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Aoi> out;

        // Walk newest insertions first so equal timestamps keep that order
        for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
            if (it->user_id != user_id && it->user_id != PUBLIC_USER)
                continue;
            if (bbox && !aoikit::intersects(it->geometry, *bbox))
                continue;
            out.push_back(*it);
        }

        std::stable_sort(out.begin(), out.end(),
                         [](const Aoi &a, const Aoi &b) { return a.created_at > b.created_at; });
        return out;
    }

    std::size_t MemoryAoiStore::count(const std::string &user_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(std::count_if(records_.begin(), records_.end(),
                                                      [&](const Aoi &a) { return a.user_id == user_id; }));
    }

    bool seed_public_samples(AoiStore &store) {
        if (store.count(PUBLIC_USER) > 0)
            return false;

        Ring downtown = make_ring({{91.2805, 23.8352},
                                   {91.288, 23.8352},
                                   {91.288, 23.8408},
                                   {91.2805, 23.8408},
                                   {91.2805, 23.8352}});

        store.insert(make_aoi(PUBLIC_USER, "Sample AOI - Downtown", "Demo polygon near city center",
                              make_polygon({downtown})));
        store.insert(make_aoi(PUBLIC_USER, "Sample AOI - Park Marker", "Demo point for a park",
                              make_point(91.295, 23.84)));

        std::cout << "Seeded public sample AOIs" << std::endl;
        return true;
    }

} // namespace aoikit
