#include "engine/geo_index.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <mutex>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace krishi {

namespace {

constexpr double kPi = 3.14159265358979323846;

double toRadians(double degrees)
{
    return degrees * kPi / 180.0;
}

std::string describeCoordinates(double latitude, double longitude)
{
    return "(" + std::to_string(latitude) + ", " + std::to_string(longitude) + ")";
}

} // namespace

bool GeoIndex::validCoordinates(double latitude, double longitude)
{
    return std::isfinite(latitude) && std::isfinite(longitude)
        && latitude >= -90.0 && latitude <= 90.0
        && longitude >= -180.0 && longitude <= 180.0;
}

double GeoIndex::haversineKm(double lat1, double lon1, double lat2, double lon2)
{
    const double dLat = toRadians(lat2 - lat1);
    const double dLon = toRadians(lon2 - lon1);
    const double a = std::sin(dLat / 2) * std::sin(dLat / 2)
        + std::cos(toRadians(lat1)) * std::cos(toRadians(lat2))
            * std::sin(dLon / 2) * std::sin(dLon / 2);
    const double c = 2 * std::asin(std::min(1.0, std::sqrt(a)));
    return kEarthRadiusKm * c;
}

GeoIndex::Shard &GeoIndex::shardFor(const std::string &locationId)
{
    return m_shards[std::hash<std::string>{}(locationId) % kShardCount];
}

const GeoIndex::Shard &GeoIndex::shardFor(const std::string &locationId) const
{
    return m_shards[std::hash<std::string>{}(locationId) % kShardCount];
}

void GeoIndex::registerLocation(const Location &location)
{
    if (!validCoordinates(location.latitude, location.longitude)) {
        throw InvalidCoordinatesError("location " + location.id + " has invalid coordinates "
                                      + describeCoordinates(location.latitude, location.longitude));
    }
    if (location.id.empty()) {
        throw InvalidArgumentError("location id must not be empty");
    }

    Shard &shard = shardFor(location.id);
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    shard.locations[location.id] = location;
}

bool GeoIndex::remove(const std::string &locationId)
{
    Shard &shard = shardFor(locationId);
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    return shard.locations.erase(locationId) > 0;
}

std::vector<NearbyLocation> GeoIndex::nearby(double latitude, double longitude,
                                             double radiusKm) const
{
    if (!validCoordinates(latitude, longitude)) {
        throw InvalidCoordinatesError("query centre has invalid coordinates "
                                      + describeCoordinates(latitude, longitude));
    }
    if (!std::isfinite(radiusKm) || radiusKm < 0.0) {
        throw InvalidArgumentError("radius must be a non-negative number of kilometres");
    }

    std::vector<NearbyLocation> results;
    for (const Shard &shard : m_shards) {
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        for (const auto &item : shard.locations) {
            const Location &location = item.second;
            const double distance =
                haversineKm(latitude, longitude, location.latitude, location.longitude);
            if (distance <= radiusKm) {
                results.push_back({location, distance});
            }
        }
    }

    std::sort(results.begin(), results.end(),
              [](const NearbyLocation &a, const NearbyLocation &b) {
                  if (a.distanceKm != b.distanceKm) {
                      return a.distanceKm < b.distanceKm;
                  }
                  return a.location.id < b.location.id;
              });
    return results;
}

std::optional<Location> GeoIndex::find(const std::string &locationId) const
{
    const Shard &shard = shardFor(locationId);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.locations.find(locationId);
    if (it == shard.locations.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool GeoIndex::contains(const std::string &locationId) const
{
    const Shard &shard = shardFor(locationId);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    return shard.locations.count(locationId) > 0;
}

std::size_t GeoIndex::size() const
{
    std::size_t total = 0;
    for (const Shard &shard : m_shards) {
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        total += shard.locations.size();
    }
    return total;
}

std::size_t GeoIndex::rebuild(LocationSource &source)
{
    const std::vector<Location> locations = source.listLocations();

    for (Shard &shard : m_shards) {
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        shard.locations.clear();
    }

    std::size_t registered = 0;
    for (const auto &location : locations) {
        try {
            registerLocation(location);
            ++registered;
        } catch (const KrishiError &e) {
            KRLOG_WARN(QStringLiteral("GeoIndex"),
                       QStringLiteral("rebuild"),
                       QStringLiteral("location_skipped"),
                       QStringLiteral("invalid_stored_location"),
                       QStringLiteral("coordinate_validation"),
                       nlohmann::json{{"locationId", location.id},
                                      {"error", e.what()}});
        }
    }

    KRLOG_INFO(QStringLiteral("GeoIndex"),
               QStringLiteral("rebuild"),
               QStringLiteral("geo_index_rebuilt"),
               QStringLiteral("startup"),
               QStringLiteral("location_enumeration"),
               nlohmann::json{{"registered", registered},
                              {"enumerated", locations.size()}});
    return registered;
}

} // namespace krishi
