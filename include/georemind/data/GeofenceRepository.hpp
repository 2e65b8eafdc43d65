#pragma once

#include <optional>
#include <vector>

#include "georemind/data/Geofence.hpp"

namespace georemind {
namespace data {

class Connection;

class GeofenceRepository
{
public:
    explicit GeofenceRepository(Connection &connection, RadiusBounds bounds = RadiusBounds());

    std::vector<Geofence> fetchGeofences() const;
    std::optional<Geofence> findById(const QString &id) const;
    // Inserts or replaces by id after validation. Keeps the original creation time on replace.
    Geofence saveGeofence(Geofence geofence);
    bool removeGeofence(const QString &id);

private:
    Connection &m_connection;
    RadiusBounds m_bounds;
};

} // namespace data
} // namespace georemind
