#include "georemind/ipc/Mailbox.hpp"

#include "georemind/core/Logging.hpp"

#include <QEventLoop>
#include <QMetaMethod>
#include <QTimer>

namespace georemind {
namespace ipc {

MailboxReceiver::MailboxReceiver(QString name, QObject *parent)
    : QObject(parent)
    , m_name(std::move(name))
{
}

MailboxReceiver::~MailboxReceiver() = default;

std::optional<QJsonObject> MailboxReceiver::waitForMessage(std::chrono::milliseconds timeout)
{
    if (m_queue.empty() && timeout.count() > 0) {
        QEventLoop loop;
        QTimer timer;
        timer.setSingleShot(true);
        connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
        connect(this, &MailboxReceiver::messageQueued, &loop, &QEventLoop::quit);
        timer.start(static_cast<int>(timeout.count()));
        loop.exec();
    }
    if (m_queue.empty()) {
        return std::nullopt;
    }
    QJsonObject message = m_queue.front();
    m_queue.pop_front();
    return message;
}

void MailboxReceiver::deliver(const QJsonObject &message)
{
    static const QMetaMethod receivedSignal = QMetaMethod::fromSignal(&MailboxReceiver::messageReceived);
    if (isSignalConnected(receivedSignal)) {
        emit messageReceived(message);
        return;
    }
    m_queue.push_back(message);
    emit messageQueued();
}

MailboxRegistration::MailboxRegistration(MailboxDirectory &directory, const QString &name)
    : m_directory(directory)
    , m_name(name)
    , m_receiver(directory.registerMailbox(name))
{
    if (!m_receiver) {
        throw MailboxError(QStringLiteral("Mailbox %1 could not be registered").arg(name));
    }
}

MailboxRegistration::~MailboxRegistration()
{
    m_directory.unregisterMailbox(m_name);
    qCDebug(lcChannel) << "Released mailbox" << m_name;
}

} // namespace ipc
} // namespace georemind
