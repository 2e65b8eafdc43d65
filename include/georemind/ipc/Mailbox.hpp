#pragma once

#include <QJsonObject>
#include <QObject>
#include <QString>
#include <chrono>
#include <deque>
#include <memory>
#include <optional>

#include "georemind/core/Errors.hpp"

namespace georemind {
namespace ipc {

class MailboxError : public core::Error
{
public:
    using Error::Error;
};

class MailboxSender
{
public:
    virtual ~MailboxSender() = default;

    // False when the message could not be handed over; never throws.
    virtual bool send(const QJsonObject &message) = 0;
};

class MailboxReceiver : public QObject
{
    Q_OBJECT

public:
    explicit MailboxReceiver(QString name, QObject *parent = nullptr);
    ~MailboxReceiver() override;

    const QString &name() const { return m_name; }

    // Runs a local event loop for at most timeout. Returns the first queued message, if any.
    std::optional<QJsonObject> waitForMessage(std::chrono::milliseconds timeout);

signals:
    void messageReceived(const QJsonObject &message);
    void messageQueued();

protected:
    void deliver(const QJsonObject &message);

private:
    QString m_name;
    std::deque<QJsonObject> m_queue;
};

// lookup() returns nullptr when nobody owns the name.
class MailboxDirectory
{
public:
    virtual ~MailboxDirectory() = default;

    virtual std::unique_ptr<MailboxReceiver> registerMailbox(const QString &name) = 0;
    virtual std::unique_ptr<MailboxSender> lookup(const QString &name) = 0;
    virtual void unregisterMailbox(const QString &name) = 0;
};

// Owns a registration for one scope; the name is always released on destruction.
class MailboxRegistration
{
public:
    MailboxRegistration(MailboxDirectory &directory, const QString &name);
    ~MailboxRegistration();

    MailboxRegistration(const MailboxRegistration &) = delete;
    MailboxRegistration &operator=(const MailboxRegistration &) = delete;

    MailboxReceiver &receiver() { return *m_receiver; }

private:
    MailboxDirectory &m_directory;
    QString m_name;
    std::unique_ptr<MailboxReceiver> m_receiver;
};

} // namespace ipc
} // namespace georemind
