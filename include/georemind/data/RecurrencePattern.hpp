#pragma once

#include <QDate>
#include <QString>
#include <vector>

#include <optional>

namespace georemind {
namespace data {

enum class RecurrenceType
{
    None,
    Daily,
    Weekly,
    WeekdaysOnly,
};

// Weekdays are ISO numbered (Monday = 1), sorted and unique.
class RecurrencePattern
{
public:
    RecurrencePattern();

    static RecurrencePattern none();
    static RecurrencePattern daily(const QDate &endDate = QDate());
    // Throws core::ValidationError for an empty set or a day outside 1..7.
    static RecurrencePattern weekly(std::vector<int> weekdays, const QDate &endDate = QDate());
    static RecurrencePattern weekdaysOnly(const QDate &endDate = QDate());

    RecurrenceType type() const { return m_type; }
    const std::vector<int> &weekdays() const { return m_weekdays; }
    const QDate &endDate() const { return m_endDate; }
    bool hasEndDate() const { return m_endDate.isValid(); }

    QString toJson() const;
    // Never throws: anything that does not decode to a valid pattern yields none().
    static RecurrencePattern fromJson(const QString &json);

    QString description() const;
    QString shortDescription() const;

    bool operator==(const RecurrencePattern &other) const;
    bool operator!=(const RecurrencePattern &other) const { return !(*this == other); }

private:
    RecurrencePattern(RecurrenceType type, std::vector<int> weekdays, QDate endDate);

    RecurrenceType m_type = RecurrenceType::None;
    std::vector<int> m_weekdays;
    QDate m_endDate;
};

bool shouldOccurOn(const RecurrencePattern &pattern, const QDate &date);

// Looks at most 14 days past `after`. Callers needing a longer horizon call again with a later date.
std::optional<QDate> nextOccurrence(const RecurrencePattern &pattern, const QDate &after);

std::vector<QDate> occurrencesInRange(const RecurrencePattern &pattern, const QDate &start, const QDate &end);

QString recurrenceTypeName(RecurrenceType type);

} // namespace data
} // namespace georemind
