#pragma once

#include <QDateTime>
#include <QStringList>
#include <vector>

#include "georemind/data/Task.hpp"

namespace georemind {
namespace data {
class GeofenceRepository;
class TaskRepository;
}

namespace services {

struct Candidate
{
    data::Task task;
    QString geofenceId; // the fired geofence that matched
};

// Best first. The legacy name fallback only covers geofences no task references by id.
std::vector<Candidate> resolveCandidates(data::TaskRepository &tasks, data::GeofenceRepository &geofences,
                                         const QStringList &geofenceIds, const QDateTime &now);

// Drops tasks deferred with Do Later whose snooze has not run out.
std::vector<Candidate> withoutPending(std::vector<Candidate> candidates, const std::vector<data::TaskId> &pending);

std::vector<data::Task> candidateTasks(const std::vector<Candidate> &candidates);

} // namespace services
} // namespace georemind
