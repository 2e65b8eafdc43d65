#include "georemind/ipc/InProcessMailbox.hpp"

#include "georemind/core/Logging.hpp"

namespace georemind {
namespace ipc {

namespace {
class InProcessSender : public MailboxSender
{
public:
    explicit InProcessSender(QPointer<InProcessReceiver> receiver)
        : m_receiver(std::move(receiver))
    {
    }

    bool send(const QJsonObject &message) override
    {
        if (!m_receiver) {
            return false;
        }
        m_receiver->post(message);
        return true;
    }

private:
    QPointer<InProcessReceiver> m_receiver;
};
} // namespace

std::unique_ptr<MailboxReceiver> InProcessMailboxDirectory::registerMailbox(const QString &name)
{
    if (isRegistered(name)) {
        throw MailboxError(QStringLiteral("Mailbox %1 is already registered").arg(name));
    }
    auto receiver = std::make_unique<InProcessReceiver>(name);
    m_receivers.insert(name, QPointer<InProcessReceiver>(receiver.get()));
    qCDebug(lcChannel) << "Registered in-process mailbox" << name;
    return receiver;
}

std::unique_ptr<MailboxSender> InProcessMailboxDirectory::lookup(const QString &name)
{
    const auto receiver = m_receivers.value(name);
    if (!receiver) {
        return nullptr;
    }
    return std::make_unique<InProcessSender>(receiver);
}

void InProcessMailboxDirectory::unregisterMailbox(const QString &name)
{
    m_receivers.remove(name);
}

bool InProcessMailboxDirectory::isRegistered(const QString &name) const
{
    return !m_receivers.value(name).isNull();
}

} // namespace ipc
} // namespace georemind
