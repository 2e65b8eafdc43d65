#pragma once

#include <QHash>
#include <QPointer>

#include "georemind/ipc/Mailbox.hpp"

namespace georemind {
namespace ipc {

// Receiver for InProcessMailboxDirectory. Messages are delivered synchronously on the sender's thread.
class InProcessReceiver : public MailboxReceiver
{
    Q_OBJECT

public:
    using MailboxReceiver::MailboxReceiver;

    void post(const QJsonObject &message) { deliver(message); }
};

// Directory for a single process and thread: both contexts of the app living side by side.
class InProcessMailboxDirectory : public MailboxDirectory
{
public:
    std::unique_ptr<MailboxReceiver> registerMailbox(const QString &name) override;
    std::unique_ptr<MailboxSender> lookup(const QString &name) override;
    void unregisterMailbox(const QString &name) override;

    bool isRegistered(const QString &name) const;

private:
    QHash<QString, QPointer<InProcessReceiver>> m_receivers;
};

} // namespace ipc
} // namespace georemind
