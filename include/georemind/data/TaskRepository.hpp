#pragma once

#include <QStringList>
#include <optional>
#include <vector>

#include "georemind/data/Task.hpp"

namespace georemind {
namespace data {

class Connection;

class TaskRepository
{
public:
    explicit TaskRepository(Connection &connection);

    std::vector<Task> fetchTasks() const;
    std::optional<Task> findById(TaskId id) const;
    // Not completed, bound by id to any of the given geofences.
    std::vector<Task> fetchOpenTasksForGeofences(const QStringList &geofenceIds) const;
    std::vector<Task> fetchOpenTasksByName(const QString &name) const;
    // Any task row bound to the geofence, completed ones included.
    bool hasTasksForGeofence(const QString &geofenceId) const;

    // A geofence-bound task also stores the geofence's legacy task name.
    Task addTask(Task task);
    bool updateTask(const Task &task);
    bool setCompleted(TaskId id, bool completed);
    bool removeTask(TaskId id);

private:
    Connection &m_connection;
};

} // namespace data
} // namespace georemind
