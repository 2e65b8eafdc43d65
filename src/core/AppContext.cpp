#include "georemind/core/AppContext.hpp"

#include "georemind/core/ActiveTaskState.hpp"
#include "georemind/data/Database.hpp"
#include "georemind/data/SettingsKeyValueStore.hpp"
#include "georemind/ipc/LocalSocketMailbox.hpp"
#include "georemind/services/ActiveTaskArbiter.hpp"
#include "georemind/services/LogNotificationDisplay.hpp"
#include "georemind/services/ProcessSpeechEngine.hpp"
#include "georemind/services/TriggerHandler.hpp"

namespace georemind {
namespace core {

AppContext::AppContext(AppConfig config)
    : m_config(std::move(config))
    , m_database(std::make_unique<data::Database>(m_config.databaseOptions()))
    , m_stateStore(std::make_unique<data::SettingsKeyValueStore>(m_config.statePath))
    , m_activeTaskState(std::make_unique<ActiveTaskState>(*m_stateStore))
    , m_mailboxDirectory(std::make_unique<ipc::LocalSocketMailboxDirectory>(m_config.channelNamespace))
    , m_notificationDisplay(std::make_unique<services::LogNotificationDisplay>())
    , m_speechEngine(std::make_unique<services::ProcessSpeechEngine>(m_config.speechCommand))
{
}

AppContext::~AppContext()
{
    // The arbiter holds references into the connection and mailbox directory.
    m_arbiter.reset();
    m_connection.reset();
}

const AppConfig &AppContext::config() const
{
    return m_config;
}

data::Database &AppContext::database()
{
    return *m_database;
}

data::Connection &AppContext::connection()
{
    if (!m_connection) {
        m_connection = m_database->openConnection(data::OpenMode::ReadWrite);
    }
    return *m_connection;
}

ActiveTaskState &AppContext::activeTaskState()
{
    return *m_activeTaskState;
}

ipc::MailboxDirectory &AppContext::mailboxDirectory()
{
    return *m_mailboxDirectory;
}

services::NotificationDisplay &AppContext::notificationDisplay()
{
    return *m_notificationDisplay;
}

services::SpeechEngine &AppContext::speechEngine()
{
    return *m_speechEngine;
}

services::ActiveTaskArbiter &AppContext::arbiter()
{
    if (!m_arbiter) {
        m_arbiter = std::make_unique<services::ActiveTaskArbiter>(connection(), *m_activeTaskState,
                                                                  *m_mailboxDirectory, *m_notificationDisplay,
                                                                  *m_speechEngine, arbiterOptions());
    }
    return *m_arbiter;
}

services::TriggerOptions AppContext::triggerOptions() const
{
    services::TriggerOptions options;
    options.ackTimeout = std::chrono::milliseconds(m_config.ackTimeoutMs);
    options.speechByDefault = m_config.speechEnabled;
    options.maxSpeechWait = std::chrono::milliseconds(m_config.speechMaxWaitMs);
    options.speechPollInterval = std::chrono::milliseconds(m_config.speechPollIntervalMs);
    options.snooze = std::chrono::minutes(m_config.snoozeMinutes);
    options.defaultSound = m_config.defaultNotificationSound;
    return options;
}

services::ArbiterOptions AppContext::arbiterOptions() const
{
    services::ArbiterOptions options;
    options.snooze = std::chrono::minutes(m_config.snoozeMinutes);
    options.speechByDefault = m_config.speechEnabled;
    options.defaultSound = m_config.defaultNotificationSound;
    return options;
}

std::unique_ptr<services::TriggerHandler> AppContext::makeTriggerHandler()
{
    return std::make_unique<services::TriggerHandler>(*m_database, *m_activeTaskState, *m_mailboxDirectory,
                                                      *m_notificationDisplay, *m_speechEngine, triggerOptions());
}

} // namespace core
} // namespace georemind
