#include "georemind/services/NotificationDisplay.hpp"

namespace georemind {
namespace services {

std::vector<NotificationAction> arrivalActions()
{
    return {
        NotificationAction{ QString::fromLatin1(kDoNowActionId), QStringLiteral("Do Now"), true },
        NotificationAction{ QString::fromLatin1(kDoLaterActionId), QStringLiteral("Do Later"), false },
    };
}

} // namespace services
} // namespace georemind
