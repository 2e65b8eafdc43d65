#pragma once

#include <vector>

#include "georemind/data/NotificationRecord.hpp"

namespace georemind {
namespace data {

class Connection;

// Append-only audit log of shown notifications.
class NotificationHistoryRepository
{
public:
    explicit NotificationHistoryRepository(Connection &connection);

    // False when the notification and geofence pair was already stored.
    bool insert(NotificationRecord record);
    std::vector<NotificationRecord> fetchAll() const;
    int clearAll();

private:
    Connection &m_connection;
};

} // namespace data
} // namespace georemind
