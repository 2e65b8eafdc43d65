#include "georemind/data/Task.hpp"

#include "georemind/core/Errors.hpp"

namespace georemind {
namespace data {

Task Task::copyWithDate(const QDate &date) const
{
    Task copy = *this;
    copy.id.reset();
    copy.scheduledDate = date;
    copy.isCompleted = false;
    copy.createdAt = QDateTime();
    return copy;
}

void validateTask(const Task &task)
{
    if (task.name.trimmed().isEmpty()) {
        throw core::ValidationError(QStringLiteral("Task name must not be empty"));
    }
    if (task.priority < kMinPriority || task.priority > kMaxPriority) {
        throw core::ValidationError(
            QStringLiteral("Task priority %1 is outside %2..%3").arg(task.priority).arg(kMinPriority).arg(kMaxPriority));
    }
    if (task.isRecurring && task.recurrence.type() == RecurrenceType::None) {
        throw core::ValidationError(QStringLiteral("Recurring task \"%1\" has no pattern").arg(task.name));
    }
}

QString priorityLabel(int priority)
{
    switch (priority) {
    case 1:
        return QStringLiteral("Very Low");
    case 2:
        return QStringLiteral("Low");
    case 3:
        return QStringLiteral("Medium");
    case 4:
        return QStringLiteral("High");
    case 5:
        return QStringLiteral("Very High");
    default:
        return QStringLiteral("Unknown");
    }
}

} // namespace data
} // namespace georemind
