#pragma once

#include <QStringList>
#include <optional>

#include "georemind/data/Geofence.hpp"

namespace georemind {
namespace services {

enum class GeofenceTransition
{
    Enter,
    Exit,
};

// What the platform geofence capability delivers for registered regions.
struct GeofenceEvent
{
    GeofenceTransition transition = GeofenceTransition::Enter;
    QStringList geofenceIds;
    std::optional<data::GeoPoint> location;
};

QString transitionName(GeofenceTransition transition);
// Throws core::ValidationError for anything but "enter" or "exit".
GeofenceTransition parseTransition(const QString &name);

} // namespace services
} // namespace georemind
