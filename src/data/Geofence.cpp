#include "georemind/data/Geofence.hpp"

#include "georemind/core/Errors.hpp"

namespace georemind {
namespace data {

void validateGeofence(const Geofence &geofence, const RadiusBounds &bounds)
{
    if (geofence.id.trimmed().isEmpty()) {
        throw core::ValidationError(QStringLiteral("Geofence id must not be empty"));
    }
    if (geofence.center.latitude < -90.0 || geofence.center.latitude > 90.0) {
        throw core::ValidationError(QStringLiteral("Latitude %1 is out of range").arg(geofence.center.latitude));
    }
    if (geofence.center.longitude < -180.0 || geofence.center.longitude > 180.0) {
        throw core::ValidationError(QStringLiteral("Longitude %1 is out of range").arg(geofence.center.longitude));
    }
    if (geofence.radiusMeters < bounds.minimum || geofence.radiusMeters > bounds.maximum) {
        throw core::ValidationError(QStringLiteral("Radius %1 m is outside %2..%3 m")
                                        .arg(geofence.radiusMeters)
                                        .arg(bounds.minimum)
                                        .arg(bounds.maximum));
    }
}

} // namespace data
} // namespace georemind
