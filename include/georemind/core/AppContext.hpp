#pragma once

#include <memory>

#include "georemind/core/AppConfig.hpp"

namespace georemind {
namespace data {
class Connection;
class Database;
class KeyValueStore;
}
namespace ipc {
class MailboxDirectory;
}
namespace services {
class ActiveTaskArbiter;
class NotificationDisplay;
class SpeechEngine;
class TriggerHandler;
struct ArbiterOptions;
struct TriggerOptions;
}

namespace core {

class ActiveTaskState;

class AppContext
{
public:
    explicit AppContext(AppConfig config);
    ~AppContext();

    const AppConfig &config() const;
    data::Database &database();
    // Throws data::StorageUnavailable on first use when the database cannot be opened.
    data::Connection &connection();
    ActiveTaskState &activeTaskState();
    ipc::MailboxDirectory &mailboxDirectory();
    services::NotificationDisplay &notificationDisplay();
    services::SpeechEngine &speechEngine();
    services::ActiveTaskArbiter &arbiter();

    services::TriggerOptions triggerOptions() const;
    services::ArbiterOptions arbiterOptions() const;
    std::unique_ptr<services::TriggerHandler> makeTriggerHandler();

private:
    AppConfig m_config;
    std::unique_ptr<data::Database> m_database;
    std::unique_ptr<data::KeyValueStore> m_stateStore;
    std::unique_ptr<ActiveTaskState> m_activeTaskState;
    std::unique_ptr<ipc::MailboxDirectory> m_mailboxDirectory;
    std::unique_ptr<services::NotificationDisplay> m_notificationDisplay;
    std::unique_ptr<services::SpeechEngine> m_speechEngine;
    std::unique_ptr<data::Connection> m_connection;
    std::unique_ptr<services::ActiveTaskArbiter> m_arbiter;
};

} // namespace core
} // namespace georemind
