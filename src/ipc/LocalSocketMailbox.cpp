#include "georemind/ipc/LocalSocketMailbox.hpp"

#include "georemind/core/Logging.hpp"

#include <QJsonDocument>
#include <QLocalServer>
#include <QLocalSocket>

namespace georemind {
namespace ipc {

namespace {
constexpr int kWriteTimeoutMs = 500;

class LocalSocketSender : public MailboxSender
{
public:
    explicit LocalSocketSender(std::unique_ptr<QLocalSocket> socket)
        : m_socket(std::move(socket))
    {
    }

    ~LocalSocketSender() override
    {
        m_socket->disconnectFromServer();
    }

    bool send(const QJsonObject &message) override
    {
        if (m_socket->state() != QLocalSocket::ConnectedState) {
            return false;
        }
        QByteArray line = QJsonDocument(message).toJson(QJsonDocument::Compact);
        line.append('\n');
        if (m_socket->write(line) != line.size()) {
            qCWarning(lcChannel) << "Write to" << m_socket->serverName() << "failed:" << m_socket->errorString();
            return false;
        }
        while (m_socket->bytesToWrite() > 0) {
            if (!m_socket->waitForBytesWritten(kWriteTimeoutMs)) {
                qCWarning(lcChannel) << "Flush to" << m_socket->serverName() << "failed:" << m_socket->errorString();
                return false;
            }
        }
        return true;
    }

private:
    std::unique_ptr<QLocalSocket> m_socket;
};

bool serverIsAlive(const QString &serverName, int timeoutMs)
{
    QLocalSocket existing;
    existing.connectToServer(serverName);
    const bool alive = existing.waitForConnected(timeoutMs);
    existing.abort();
    return alive;
}
} // namespace

LocalSocketReceiver::LocalSocketReceiver(const QString &name, const QString &serverName, QObject *parent)
    : MailboxReceiver(name, parent)
    , m_serverName(serverName)
{
}

LocalSocketReceiver::~LocalSocketReceiver()
{
    close();
}

void LocalSocketReceiver::listen()
{
    m_server = new QLocalServer(this);
    m_server->setSocketOptions(QLocalServer::UserAccessOption);
    connect(m_server, &QLocalServer::newConnection, this, &LocalSocketReceiver::acceptConnections);

    if (m_server->listen(m_serverName)) {
        return;
    }
    if (m_server->serverError() == QAbstractSocket::AddressInUseError) {
        if (serverIsAlive(m_serverName, 250)) {
            throw MailboxError(QStringLiteral("Mailbox %1 is already registered").arg(name()));
        }
        qCInfo(lcChannel) << "Removing stale socket" << m_serverName;
        QLocalServer::removeServer(m_serverName);
        if (m_server->listen(m_serverName)) {
            return;
        }
    }
    throw MailboxError(QStringLiteral("Cannot listen on %1: %2").arg(m_serverName, m_server->errorString()));
}

void LocalSocketReceiver::close()
{
    if (m_server && m_server->isListening()) {
        m_server->close();
        qCDebug(lcChannel) << "Closed mailbox" << name();
    }
}

void LocalSocketReceiver::acceptConnections()
{
    while (QLocalSocket *socket = m_server->nextPendingConnection()) {
        socket->setParent(this);
        connect(socket, &QLocalSocket::readyRead, this, [this, socket]() { readLines(socket); });
        connect(socket, &QLocalSocket::disconnected, socket, &QObject::deleteLater);
        readLines(socket);
    }
}

void LocalSocketReceiver::readLines(QLocalSocket *socket)
{
    while (socket->canReadLine()) {
        const QByteArray line = socket->readLine().trimmed();
        if (line.isEmpty()) {
            continue;
        }
        QJsonParseError error;
        const QJsonDocument document = QJsonDocument::fromJson(line, &error);
        if (error.error != QJsonParseError::NoError || !document.isObject()) {
            qCWarning(lcChannel) << "Dropping malformed message on" << name() << ":" << error.errorString();
            continue;
        }
        deliver(document.object());
    }
}

LocalSocketMailboxDirectory::LocalSocketMailboxDirectory(QString namespacePrefix, int connectTimeoutMs)
    : m_namespace(std::move(namespacePrefix))
    , m_connectTimeoutMs(connectTimeoutMs)
{
}

std::unique_ptr<MailboxReceiver> LocalSocketMailboxDirectory::registerMailbox(const QString &name)
{
    auto receiver = std::make_unique<LocalSocketReceiver>(name, serverName(name));
    receiver->listen();
    m_receivers.insert(name, QPointer<LocalSocketReceiver>(receiver.get()));
    qCDebug(lcChannel) << "Registered mailbox" << name << "at" << serverName(name);
    return receiver;
}

std::unique_ptr<MailboxSender> LocalSocketMailboxDirectory::lookup(const QString &name)
{
    auto socket = std::make_unique<QLocalSocket>();
    socket->connectToServer(serverName(name));
    if (!socket->waitForConnected(m_connectTimeoutMs)) {
        qCDebug(lcChannel) << "No mailbox" << name << ":" << socket->errorString();
        return nullptr;
    }
    return std::make_unique<LocalSocketSender>(std::move(socket));
}

void LocalSocketMailboxDirectory::unregisterMailbox(const QString &name)
{
    const auto receiver = m_receivers.take(name);
    if (receiver) {
        receiver->close();
    }
}

QString LocalSocketMailboxDirectory::serverName(const QString &name) const
{
    return QStringLiteral("%1-%2").arg(m_namespace, name);
}

} // namespace ipc
} // namespace georemind
