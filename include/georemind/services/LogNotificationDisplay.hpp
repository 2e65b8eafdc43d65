#pragma once

#include "georemind/services/NotificationDisplay.hpp"

namespace georemind {
namespace services {

// Headless display: writes notifications to the app log.
class LogNotificationDisplay : public NotificationDisplay
{
public:
    void show(const NotificationRequest &request) override;
    void cancel(int id) override;
};

} // namespace services
} // namespace georemind
