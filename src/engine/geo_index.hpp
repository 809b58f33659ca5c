#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/models.hpp"

namespace krishi {

// Enumeration interface the persistence collaborator offers so the index can
// be rebuilt at startup.
class LocationSource {
public:
    virtual ~LocationSource() = default;
    virtual std::vector<Location> listLocations() = 0;
};

/**
 * GeoIndex is the in-memory spatial index over registered locations.
 *
 * Locations are spread over shards by id; each shard has its own shared
 * mutex, so registrations for different locations do not serialize on one
 * lock and queries only take shared locks. The index never persists: the
 * persistence collaborator is the source of truth and rebuild() reloads it.
 */
class GeoIndex {
public:
    static constexpr double kEarthRadiusKm = 6371.0;

    GeoIndex() = default;
    GeoIndex(const GeoIndex &) = delete;
    GeoIndex &operator=(const GeoIndex &) = delete;

    // Adds or replaces (location moves are allowed). Throws
    // InvalidCoordinatesError before touching the index.
    void registerLocation(const Location &location);
    bool remove(const std::string &locationId);

    // All locations with haversine distance <= radiusKm, ascending by
    // distance, ties by id.
    std::vector<NearbyLocation> nearby(double latitude, double longitude,
                                       double radiusKm) const;

    std::optional<Location> find(const std::string &locationId) const;
    bool contains(const std::string &locationId) const;
    std::size_t size() const;

    // Clears the index and registers every location the source returns.
    // Locations with invalid coordinates are skipped and logged.
    std::size_t rebuild(LocationSource &source);

    static double haversineKm(double lat1, double lon1, double lat2, double lon2);
    static bool validCoordinates(double latitude, double longitude);

private:
    static constexpr std::size_t kShardCount = 16;

    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, Location> locations;
    };

    Shard &shardFor(const std::string &locationId);
    const Shard &shardFor(const std::string &locationId) const;

    std::array<Shard, kShardCount> m_shards;
};

} // namespace krishi
