#include "georemind/data/RecurrencePattern.hpp"

#include "georemind/core/Errors.hpp"

#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>
#include <algorithm>

namespace georemind {
namespace data {

namespace {
constexpr int kLookAheadDays = 14;

const std::vector<int> &fullWeek()
{
    static const std::vector<int> days{ 1, 2, 3, 4, 5, 6, 7 };
    return days;
}

const std::vector<int> &workWeek()
{
    static const std::vector<int> days{ 1, 2, 3, 4, 5 };
    return days;
}

QString weekdayName(int weekday)
{
    switch (weekday) {
    case 1: return QStringLiteral("Monday");
    case 2: return QStringLiteral("Tuesday");
    case 3: return QStringLiteral("Wednesday");
    case 4: return QStringLiteral("Thursday");
    case 5: return QStringLiteral("Friday");
    case 6: return QStringLiteral("Saturday");
    case 7: return QStringLiteral("Sunday");
    default: return QStringLiteral("Unknown");
    }
}

QString weekdayAbbreviation(int weekday)
{
    return weekdayName(weekday).left(3);
}

std::optional<RecurrenceType> typeFromName(const QString &name)
{
    if (name == QLatin1String("none")) {
        return RecurrenceType::None;
    }
    if (name == QLatin1String("daily")) {
        return RecurrenceType::Daily;
    }
    if (name == QLatin1String("weekly")) {
        return RecurrenceType::Weekly;
    }
    if (name == QLatin1String("weekdays") || name == QLatin1String("weekdaysOnly")) {
        return RecurrenceType::WeekdaysOnly;
    }
    return std::nullopt;
}

// Accepts a plain date as well as a full ISO timestamp; only the date part is kept.
QDate parseEndDate(const QString &value)
{
    QDate date = QDate::fromString(value, Qt::ISODate);
    if (!date.isValid()) {
        const QDateTime dateTime = QDateTime::fromString(value, Qt::ISODate);
        if (dateTime.isValid()) {
            date = dateTime.date();
        }
    }
    return date;
}
} // namespace

RecurrencePattern::RecurrencePattern() = default;

RecurrencePattern::RecurrencePattern(RecurrenceType type, std::vector<int> weekdays, QDate endDate)
    : m_type(type)
    , m_weekdays(std::move(weekdays))
    , m_endDate(std::move(endDate))
{
}

RecurrencePattern RecurrencePattern::none()
{
    return RecurrencePattern();
}

RecurrencePattern RecurrencePattern::daily(const QDate &endDate)
{
    return RecurrencePattern(RecurrenceType::Daily, fullWeek(), endDate);
}

RecurrencePattern RecurrencePattern::weekly(std::vector<int> weekdays, const QDate &endDate)
{
    if (weekdays.empty()) {
        throw core::ValidationError(QStringLiteral("A weekly pattern needs at least one weekday"));
    }
    for (const int day : weekdays) {
        if (day < 1 || day > 7) {
            throw core::ValidationError(QStringLiteral("Weekday %1 is outside 1..7").arg(day));
        }
    }
    std::sort(weekdays.begin(), weekdays.end());
    weekdays.erase(std::unique(weekdays.begin(), weekdays.end()), weekdays.end());
    return RecurrencePattern(RecurrenceType::Weekly, std::move(weekdays), endDate);
}

RecurrencePattern RecurrencePattern::weekdaysOnly(const QDate &endDate)
{
    return RecurrencePattern(RecurrenceType::WeekdaysOnly, workWeek(), endDate);
}

QString RecurrencePattern::toJson() const
{
    QJsonArray days;
    for (const int day : m_weekdays) {
        days.append(day);
    }
    QJsonObject object;
    object.insert(QStringLiteral("type"), recurrenceTypeName(m_type));
    object.insert(QStringLiteral("weekdays"), days);
    object.insert(QStringLiteral("endDate"),
                  m_endDate.isValid() ? QJsonValue(m_endDate.toString(Qt::ISODate)) : QJsonValue());
    return QString::fromUtf8(QJsonDocument(object).toJson(QJsonDocument::Compact));
}

RecurrencePattern RecurrencePattern::fromJson(const QString &json)
{
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(json.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        return none();
    }
    const QJsonObject object = document.object();

    const auto type = typeFromName(object.value(QStringLiteral("type")).toString());
    if (!type) {
        return none();
    }

    QDate endDate;
    const QJsonValue endValue = object.value(QStringLiteral("endDate"));
    if (endValue.isString()) {
        endDate = parseEndDate(endValue.toString());
        if (!endDate.isValid()) {
            return none();
        }
    } else if (!endValue.isNull() && !endValue.isUndefined()) {
        return none();
    }

    switch (*type) {
    case RecurrenceType::None:
        return none();
    case RecurrenceType::Daily:
        return daily(endDate);
    case RecurrenceType::WeekdaysOnly:
        return weekdaysOnly(endDate);
    case RecurrenceType::Weekly:
        break;
    }

    std::vector<int> days;
    for (const QJsonValue &value : object.value(QStringLiteral("weekdays")).toArray()) {
        if (!value.isDouble()) {
            return none();
        }
        days.push_back(value.toInt());
    }
    try {
        return weekly(std::move(days), endDate);
    } catch (const core::ValidationError &) {
        return none();
    }
}

QString RecurrencePattern::description() const
{
    switch (m_type) {
    case RecurrenceType::None:
        return QStringLiteral("One-time task");
    case RecurrenceType::Daily:
        return QStringLiteral("Daily");
    case RecurrenceType::WeekdaysOnly:
        return QStringLiteral("Weekdays (Mon-Fri)");
    case RecurrenceType::Weekly:
        break;
    }
    if (m_weekdays.size() == 7) {
        return QStringLiteral("Daily");
    }
    QStringList names;
    for (const int day : m_weekdays) {
        names << weekdayName(day);
    }
    return QStringLiteral("Weekly on %1").arg(names.join(QStringLiteral(", ")));
}

QString RecurrencePattern::shortDescription() const
{
    switch (m_type) {
    case RecurrenceType::None:
        return QStringLiteral("Once");
    case RecurrenceType::Daily:
        return QStringLiteral("Daily");
    case RecurrenceType::WeekdaysOnly:
        return QStringLiteral("Weekdays");
    case RecurrenceType::Weekly:
        break;
    }
    if (m_weekdays.size() == 7) {
        return QStringLiteral("Daily");
    }
    QStringList names;
    for (const int day : m_weekdays) {
        names << weekdayAbbreviation(day);
    }
    return names.join(QStringLiteral(", "));
}

bool RecurrencePattern::operator==(const RecurrencePattern &other) const
{
    return m_type == other.m_type && m_weekdays == other.m_weekdays && m_endDate == other.m_endDate;
}

bool shouldOccurOn(const RecurrencePattern &pattern, const QDate &date)
{
    if (!date.isValid() || pattern.type() == RecurrenceType::None) {
        return false;
    }
    if (pattern.hasEndDate() && pattern.endDate() < date) {
        return false;
    }
    const auto &days = pattern.weekdays();
    return std::binary_search(days.begin(), days.end(), date.dayOfWeek());
}

std::optional<QDate> nextOccurrence(const RecurrencePattern &pattern, const QDate &after)
{
    if (!after.isValid() || pattern.type() == RecurrenceType::None) {
        return std::nullopt;
    }
    for (int offset = 1; offset <= kLookAheadDays; ++offset) {
        const QDate candidate = after.addDays(offset);
        if (pattern.hasEndDate() && candidate > pattern.endDate()) {
            return std::nullopt;
        }
        if (shouldOccurOn(pattern, candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::vector<QDate> occurrencesInRange(const RecurrencePattern &pattern, const QDate &start, const QDate &end)
{
    std::vector<QDate> result;
    if (!start.isValid() || !end.isValid() || pattern.type() == RecurrenceType::None) {
        return result;
    }
    for (QDate day = start; day <= end; day = day.addDays(1)) {
        if (pattern.hasEndDate() && day > pattern.endDate()) {
            break;
        }
        if (shouldOccurOn(pattern, day)) {
            result.push_back(day);
        }
    }
    return result;
}

QString recurrenceTypeName(RecurrenceType type)
{
    switch (type) {
    case RecurrenceType::Daily:
        return QStringLiteral("daily");
    case RecurrenceType::Weekly:
        return QStringLiteral("weekly");
    case RecurrenceType::WeekdaysOnly:
        return QStringLiteral("weekdays");
    case RecurrenceType::None:
    default:
        return QStringLiteral("none");
    }
}

} // namespace data
} // namespace georemind
