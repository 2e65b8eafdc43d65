#pragma once

#include <QHash>
#include <QPointer>

#include "georemind/ipc/Mailbox.hpp"

class QLocalServer;
class QLocalSocket;

namespace georemind {
namespace ipc {

// Receiving end bound to a QLocalServer; one compact JSON document per line.
class LocalSocketReceiver : public MailboxReceiver
{
    Q_OBJECT

public:
    LocalSocketReceiver(const QString &name, const QString &serverName, QObject *parent = nullptr);
    ~LocalSocketReceiver() override;

    // Throws MailboxError when the server name is held by a live process or cannot be bound.
    void listen();
    void close();

private slots:
    void acceptConnections();

private:
    void readLines(QLocalSocket *socket);

    QString m_serverName;
    QLocalServer *m_server = nullptr;
};

// Sockets are named "<namespace>-<name>"; a stale one is replaced on registration.
class LocalSocketMailboxDirectory : public MailboxDirectory
{
public:
    explicit LocalSocketMailboxDirectory(QString namespacePrefix, int connectTimeoutMs = 250);

    std::unique_ptr<MailboxReceiver> registerMailbox(const QString &name) override;
    std::unique_ptr<MailboxSender> lookup(const QString &name) override;
    void unregisterMailbox(const QString &name) override;

    QString serverName(const QString &name) const;

private:
    QString m_namespace;
    int m_connectTimeoutMs;
    QHash<QString, QPointer<LocalSocketReceiver>> m_receivers;
};

} // namespace ipc
} // namespace georemind
