#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>
#include <optional>
#include <vector>

#include "georemind/data/Task.hpp"

namespace georemind {
namespace core {

// Invalid for a task with neither date nor time.
QDateTime scheduledDateTime(const data::Task &task, const QDateTime &now);

// Scheduled geofenced tasks gain +2.0, +1.5, +1.0 or +0.5 at <= 0, 1, 3 or 24 hours left.
double effectivePriority(const data::Task &task, const QDateTime &now);

// OVERDUE, DUE NOW, DUE SOON, DUE TODAY or UPCOMING on the same thresholds. Empty for unscheduled tasks.
QString urgencyLabel(const data::Task &task, const QDateTime &now);

// Strict weak ordering: higher effective priority first, then lower id, unsaved tasks last, then name.
bool rankedBefore(const data::Task &lhs, const data::Task &rhs, const QDateTime &now);
std::vector<data::Task> rankTasks(std::vector<data::Task> tasks, const QDateTime &now);

// Highest effective priority among the tasks, 0 for an empty set.
double incomingHighest(const std::vector<data::Task> &tasks, const QDateTime &now);

enum class ArrivalDecision
{
    Alert,        // nothing active: surface the arrival normally
    Queue,        // not more urgent than the active task: no audible alert, add to pending
    PromptSwitch, // more urgent: offer the user to switch, never switch silently
};

ArrivalDecision decideArrival(std::optional<double> activePriority, double incoming);

// Non-recurring tasks are always eligible; recurring ones only on days their pattern occurs.
bool isDueOn(const data::Task &task, const QDate &date);

QString arrivalDecisionName(ArrivalDecision decision);

} // namespace core
} // namespace georemind
