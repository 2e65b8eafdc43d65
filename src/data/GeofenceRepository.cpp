#include "georemind/data/GeofenceRepository.hpp"

#include "georemind/core/Logging.hpp"
#include "georemind/data/Database.hpp"

#include <QSqlQuery>
#include <QVariant>

namespace georemind {
namespace data {

namespace {
const QString kSelectColumns = QStringLiteral(
    "SELECT id, latitude, longitude, radius_meters, fill_color, fill_opacity, stroke_color, stroke_width, task, "
    "created_at FROM geofences");

Geofence readGeofence(const QSqlQuery &query)
{
    Geofence geofence;
    geofence.id = query.value(0).toString();
    geofence.center.latitude = query.value(1).toDouble();
    geofence.center.longitude = query.value(2).toDouble();
    geofence.radiusMeters = query.value(3).toDouble();
    geofence.fillColor = query.value(4).toString();
    geofence.fillOpacity = query.value(5).toDouble();
    geofence.strokeColor = query.value(6).toString();
    geofence.strokeWidth = query.value(7).toDouble();
    geofence.taskName = query.value(8).toString();
    geofence.createdAt = QDateTime::fromSecsSinceEpoch(query.value(9).toLongLong());
    return geofence;
}
} // namespace

GeofenceRepository::GeofenceRepository(Connection &connection, RadiusBounds bounds)
    : m_connection(connection)
    , m_bounds(bounds)
{
}

std::vector<Geofence> GeofenceRepository::fetchGeofences() const
{
    return runWithRetry(m_connection.retryPolicy(), QStringLiteral("fetch geofences"), [&] {
        QSqlQuery query = m_connection.prepare(kSelectColumns + QStringLiteral(" ORDER BY created_at ASC, id ASC"));
        m_connection.exec(query, QStringLiteral("fetch geofences"));
        std::vector<Geofence> geofences;
        while (query.next()) {
            geofences.push_back(readGeofence(query));
        }
        return geofences;
    });
}

std::optional<Geofence> GeofenceRepository::findById(const QString &id) const
{
    return runWithRetry(m_connection.retryPolicy(), QStringLiteral("find geofence"), [&]() -> std::optional<Geofence> {
        QSqlQuery query = m_connection.prepare(kSelectColumns + QStringLiteral(" WHERE id = :id"));
        query.bindValue(QStringLiteral(":id"), id);
        m_connection.exec(query, QStringLiteral("find geofence"));
        if (query.next()) {
            return readGeofence(query);
        }
        return std::nullopt;
    });
}

Geofence GeofenceRepository::saveGeofence(Geofence geofence)
{
    validateGeofence(geofence, m_bounds);
    if (!geofence.createdAt.isValid()) {
        geofence.createdAt = QDateTime::fromSecsSinceEpoch(QDateTime::currentSecsSinceEpoch());
    }

    runWithRetry(m_connection.retryPolicy(), QStringLiteral("save geofence"), [&] {
        QSqlQuery query = m_connection.prepare(QStringLiteral(
            "INSERT INTO geofences (id, latitude, longitude, radius_meters, fill_color, fill_opacity, stroke_color, "
            "stroke_width, task, created_at) VALUES (:id, :lat, :lng, :radius, :fill, :opacity, :stroke, :width, "
            ":task, :created) ON CONFLICT(id) DO UPDATE SET latitude = excluded.latitude, "
            "longitude = excluded.longitude, radius_meters = excluded.radius_meters, fill_color = excluded.fill_color, "
            "fill_opacity = excluded.fill_opacity, stroke_color = excluded.stroke_color, "
            "stroke_width = excluded.stroke_width, task = excluded.task"));
        query.bindValue(QStringLiteral(":id"), geofence.id);
        query.bindValue(QStringLiteral(":lat"), geofence.center.latitude);
        query.bindValue(QStringLiteral(":lng"), geofence.center.longitude);
        query.bindValue(QStringLiteral(":radius"), geofence.radiusMeters);
        query.bindValue(QStringLiteral(":fill"), geofence.fillColor);
        query.bindValue(QStringLiteral(":opacity"), geofence.fillOpacity);
        query.bindValue(QStringLiteral(":stroke"), geofence.strokeColor);
        query.bindValue(QStringLiteral(":width"), geofence.strokeWidth);
        query.bindValue(QStringLiteral(":task"),
                        geofence.taskName.isEmpty() ? QVariant(QVariant::String) : QVariant(geofence.taskName));
        query.bindValue(QStringLiteral(":created"), geofence.createdAt.toSecsSinceEpoch());
        m_connection.exec(query, QStringLiteral("save geofence"));
    });
    qCDebug(lcStorage) << "Saved geofence" << geofence.id << "radius" << geofence.radiusMeters;
    return findById(geofence.id).value_or(geofence);
}

bool GeofenceRepository::removeGeofence(const QString &id)
{
    return runWithRetry(m_connection.retryPolicy(), QStringLiteral("remove geofence"), [&] {
        QSqlQuery query = m_connection.prepare(QStringLiteral("DELETE FROM geofences WHERE id = :id"));
        query.bindValue(QStringLiteral(":id"), id);
        m_connection.exec(query, QStringLiteral("remove geofence"));
        return query.numRowsAffected() > 0;
    });
}

} // namespace data
} // namespace georemind
