#include "georemind/services/CandidateResolver.hpp"

#include "georemind/core/Logging.hpp"
#include "georemind/core/PriorityModel.hpp"
#include "georemind/data/GeofenceRepository.hpp"
#include "georemind/data/TaskRepository.hpp"

#include <QSet>
#include <algorithm>

namespace georemind {
namespace services {

std::vector<Candidate> resolveCandidates(data::TaskRepository &tasks, data::GeofenceRepository &geofences,
                                         const QStringList &geofenceIds, const QDateTime &now)
{
    std::vector<Candidate> candidates;
    QSet<data::TaskId> seen;
    const auto take = [&](const data::Task &task, const QString &geofenceId) {
        if (!task.id || seen.contains(*task.id)) {
            return;
        }
        if (!core::isDueOn(task, now.date())) {
            qCDebug(lcTrigger) << "Task" << *task.id << "does not recur today";
            return;
        }
        seen.insert(*task.id);
        candidates.push_back(Candidate{ task, geofenceId });
    };

    const auto bound = tasks.fetchOpenTasksForGeofences(geofenceIds);
    for (const QString &geofenceId : geofenceIds) {
        bool matched = false;
        for (const auto &task : bound) {
            if (task.geofenceId == geofenceId) {
                take(task, geofenceId);
                matched = true;
            }
        }
        if (matched || tasks.hasTasksForGeofence(geofenceId)) {
            continue;
        }
        const auto geofence = geofences.findById(geofenceId);
        if (!geofence || geofence->taskName.isEmpty()) {
            continue;
        }
        qCDebug(lcTrigger) << "Geofence" << geofenceId << "falls back to legacy task name" << geofence->taskName;
        for (const auto &task : tasks.fetchOpenTasksByName(geofence->taskName)) {
            take(task, geofenceId);
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(), [&now](const Candidate &lhs, const Candidate &rhs) {
        return core::rankedBefore(lhs.task, rhs.task, now);
    });
    return candidates;
}

std::vector<Candidate> withoutPending(std::vector<Candidate> candidates, const std::vector<data::TaskId> &pending)
{
    const auto snoozed = [&pending](const Candidate &candidate) {
        return candidate.task.id && std::find(pending.begin(), pending.end(), *candidate.task.id) != pending.end();
    };
    for (const auto &candidate : candidates) {
        if (snoozed(candidate)) {
            qCDebug(lcTrigger) << "Task" << *candidate.task.id << "is snoozed";
        }
    }
    candidates.erase(std::remove_if(candidates.begin(), candidates.end(), snoozed), candidates.end());
    return candidates;
}

std::vector<data::Task> candidateTasks(const std::vector<Candidate> &candidates)
{
    std::vector<data::Task> result;
    result.reserve(candidates.size());
    for (const auto &candidate : candidates) {
        result.push_back(candidate.task);
    }
    return result;
}

} // namespace services
} // namespace georemind
