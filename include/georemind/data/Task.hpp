#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QTime>
#include <optional>

#include "georemind/data/RecurrencePattern.hpp"

namespace georemind {
namespace data {

using TaskId = qint64;

constexpr int kMinPriority = 1;
constexpr int kMaxPriority = 5;

struct Task
{
    std::optional<TaskId> id; // assigned by the store
    QString name;
    int priority = 3;
    QDate scheduledDate; // invalid means no explicit date
    QTime scheduledTime; // invalid means no explicit time
    bool isRecurring = false;
    RecurrencePattern recurrence;
    QString geofenceId; // lookup only, the task does not own the geofence
    bool isCompleted = false;
    QString notificationSound;
    std::optional<bool> enableSpeech; // unset inherits the app default
    QDateTime createdAt;

    bool hasGeofence() const { return !geofenceId.isEmpty(); }
    bool hasSchedule() const { return scheduledDate.isValid() || scheduledTime.isValid(); }

    // Clone for a new recurrence instance: new date, not completed, no identity.
    Task copyWithDate(const QDate &date) const;
};

// Throws core::ValidationError when the name is blank or the priority is outside 1..5.
void validateTask(const Task &task);

QString priorityLabel(int priority);

} // namespace data
} // namespace georemind
