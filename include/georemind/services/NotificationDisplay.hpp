#pragma once

#include <QString>
#include <vector>

namespace georemind {
namespace services {

constexpr auto kDoNowActionId = "georemind.DO_NOW";
constexpr auto kDoLaterActionId = "georemind.DO_LATER";

struct NotificationAction
{
    QString id;
    QString label;
    bool showsUserInterface = false;
};

struct NotificationRequest
{
    int id = 0;
    QString title;
    QString body;
    std::vector<NotificationAction> actions;
    bool playSound = true;
    bool persistent = true; // dismissed by the user only
    QString sound;          // empty uses the platform default
};

// The two actions every arrival alert carries.
std::vector<NotificationAction> arrivalActions();

class NotificationDisplay
{
public:
    virtual ~NotificationDisplay() = default;

    virtual void show(const NotificationRequest &request) = 0;
    virtual void cancel(int id) = 0;
};

} // namespace services
} // namespace georemind
