#include "georemind/services/LogNotificationDisplay.hpp"

#include "georemind/core/Logging.hpp"

#include <QStringList>

namespace georemind {
namespace services {

void LogNotificationDisplay::show(const NotificationRequest &request)
{
    QStringList actions;
    for (const auto &action : request.actions) {
        actions << action.label;
    }
    qCInfo(lcApp).noquote() << QStringLiteral("[notification %1] %2: %3").arg(request.id).arg(request.title, request.body)
                            << (actions.isEmpty() ? QString() : QStringLiteral("[%1]").arg(actions.join('|')));
}

void LogNotificationDisplay::cancel(int id)
{
    qCInfo(lcApp) << "Cancelled notification" << id;
}

} // namespace services
} // namespace georemind
