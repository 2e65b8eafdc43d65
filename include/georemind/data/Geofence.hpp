#pragma once

#include <QDateTime>
#include <QString>

namespace georemind {
namespace data {

struct GeoPoint
{
    double latitude = 0.0;
    double longitude = 0.0;
};

struct Geofence
{
    QString id;
    GeoPoint center;
    double radiusMeters = 50.0;

    // Rendering hints only.
    QString fillColor = QStringLiteral("#3388ff");
    double fillOpacity = 0.2;
    QString strokeColor = QStringLiteral("#3388ff");
    double strokeWidth = 2.0;

    QString taskName; // legacy binding by task name
    QDateTime createdAt;
};

struct RadiusBounds
{
    double minimum = 1.0;
    double maximum = 1000.0;
};

// Throws core::ValidationError for an empty id, out-of-range coordinates or a radius outside bounds.
void validateGeofence(const Geofence &geofence, const RadiusBounds &bounds = RadiusBounds());

} // namespace data
} // namespace georemind
