#include "georemind/core/PriorityModel.hpp"

#include <algorithm>

namespace georemind {
namespace core {

namespace {
constexpr qint64 kSecondsPerHour = 3600;

// Whole hours, truncated towards zero.
std::optional<qint64> hoursUntil(const data::Task &task, const QDateTime &now)
{
    const QDateTime scheduled = scheduledDateTime(task, now);
    if (!scheduled.isValid()) {
        return std::nullopt;
    }
    return now.secsTo(scheduled) / kSecondsPerHour;
}
} // namespace

QDateTime scheduledDateTime(const data::Task &task, const QDateTime &now)
{
    if (!task.hasSchedule()) {
        return QDateTime();
    }
    const QDate date = task.scheduledDate.isValid() ? task.scheduledDate : now.date();
    const QTime time = task.scheduledTime.isValid() ? task.scheduledTime : QTime(0, 0);
    return QDateTime(date, time, now.timeSpec());
}

double effectivePriority(const data::Task &task, const QDateTime &now)
{
    const double base = task.priority;
    if (!task.hasGeofence()) {
        return base;
    }
    const auto hours = hoursUntil(task, now);
    if (!hours) {
        return base;
    }
    if (*hours <= 0) {
        return base + 2.0;
    }
    if (*hours <= 1) {
        return base + 1.5;
    }
    if (*hours <= 3) {
        return base + 1.0;
    }
    if (*hours <= 24) {
        return base + 0.5;
    }
    return base;
}

QString urgencyLabel(const data::Task &task, const QDateTime &now)
{
    const auto hours = hoursUntil(task, now);
    if (!hours) {
        return QString();
    }
    if (*hours <= 0) {
        return QStringLiteral("OVERDUE");
    }
    if (*hours <= 1) {
        return QStringLiteral("DUE NOW");
    }
    if (*hours <= 3) {
        return QStringLiteral("DUE SOON");
    }
    if (*hours <= 24) {
        return QStringLiteral("DUE TODAY");
    }
    return QStringLiteral("UPCOMING");
}

bool rankedBefore(const data::Task &lhs, const data::Task &rhs, const QDateTime &now)
{
    const double left = effectivePriority(lhs, now);
    const double right = effectivePriority(rhs, now);
    if (left != right) {
        return left > right;
    }
    if (lhs.id.has_value() != rhs.id.has_value()) {
        return lhs.id.has_value();
    }
    if (lhs.id && *lhs.id != *rhs.id) {
        return *lhs.id < *rhs.id;
    }
    return lhs.name < rhs.name;
}

std::vector<data::Task> rankTasks(std::vector<data::Task> tasks, const QDateTime &now)
{
    std::stable_sort(tasks.begin(), tasks.end(), [&now](const data::Task &lhs, const data::Task &rhs) {
        return rankedBefore(lhs, rhs, now);
    });
    return tasks;
}

double incomingHighest(const std::vector<data::Task> &tasks, const QDateTime &now)
{
    double highest = 0.0;
    for (const auto &task : tasks) {
        highest = std::max(highest, effectivePriority(task, now));
    }
    return highest;
}

ArrivalDecision decideArrival(std::optional<double> activePriority, double incoming)
{
    if (!activePriority) {
        return ArrivalDecision::Alert;
    }
    if (incoming <= *activePriority) {
        return ArrivalDecision::Queue;
    }
    return ArrivalDecision::PromptSwitch;
}

bool isDueOn(const data::Task &task, const QDate &date)
{
    if (!task.isRecurring) {
        return true;
    }
    return data::shouldOccurOn(task.recurrence, date);
}

QString arrivalDecisionName(ArrivalDecision decision)
{
    switch (decision) {
    case ArrivalDecision::Alert:
        return QStringLiteral("alert");
    case ArrivalDecision::Queue:
        return QStringLiteral("queue");
    case ArrivalDecision::PromptSwitch:
        return QStringLiteral("prompt-switch");
    }
    return QString();
}

} // namespace core
} // namespace georemind
