#pragma once

#include <QString>

#include "georemind/data/Database.hpp"
#include "georemind/data/Geofence.hpp"

class QSettings;

namespace georemind {
namespace core {

struct AppConfig
{
    QString databasePath;
    QString statePath;
    int busyTimeoutMs = 5000;

    int retryMaxAttempts = 3;
    int retryBaseDelayMs = 100;
    int retryMaxDelayMs = 2000;

    int ackTimeoutMs = 1000;
    QString channelNamespace;

    bool speechEnabled = true;
    QString speechCommand = QStringLiteral("espeak-ng");
    int speechMaxWaitMs = 10000;
    int speechPollIntervalMs = 500;

    double minRadius = 1.0;
    double maxRadius = 1000.0;

    int snoozeMinutes = 5;

    QString defaultNotificationSound; // empty uses the platform default

    // Missing keys keep their defaults; paths default into the app data directory.
    static AppConfig load(const QSettings &settings);
    static QString defaultDataDirectory();

    data::DatabaseOptions databaseOptions() const;
    data::RadiusBounds radiusBounds() const;
};

} // namespace core
} // namespace georemind
