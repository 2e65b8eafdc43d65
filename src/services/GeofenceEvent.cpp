#include "georemind/services/GeofenceEvent.hpp"

#include "georemind/core/Errors.hpp"

namespace georemind {
namespace services {

QString transitionName(GeofenceTransition transition)
{
    return transition == GeofenceTransition::Enter ? QStringLiteral("enter") : QStringLiteral("exit");
}

GeofenceTransition parseTransition(const QString &name)
{
    const QString normalized = name.trimmed().toLower();
    if (normalized == QLatin1String("enter")) {
        return GeofenceTransition::Enter;
    }
    if (normalized == QLatin1String("exit")) {
        return GeofenceTransition::Exit;
    }
    throw core::ValidationError(QStringLiteral("Unknown geofence transition \"%1\"").arg(name));
}

} // namespace services
} // namespace georemind
