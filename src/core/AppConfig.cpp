#include "georemind/core/AppConfig.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <QtGlobal>

namespace georemind {
namespace core {

AppConfig AppConfig::load(const QSettings &settings)
{
    AppConfig config;
    const QDir dataDir(defaultDataDirectory());
    config.databasePath =
        settings.value(QStringLiteral("storage/databasePath"), dataDir.filePath(QStringLiteral("georemind.db")))
            .toString();
    config.statePath =
        settings.value(QStringLiteral("storage/statePath"), dataDir.filePath(QStringLiteral("state.ini"))).toString();
    config.busyTimeoutMs = settings.value(QStringLiteral("storage/busyTimeoutMs"), config.busyTimeoutMs).toInt();

    config.retryMaxAttempts = qMax(1, settings.value(QStringLiteral("retry/maxAttempts"), config.retryMaxAttempts).toInt());
    config.retryBaseDelayMs = settings.value(QStringLiteral("retry/baseDelayMs"), config.retryBaseDelayMs).toInt();
    config.retryMaxDelayMs = settings.value(QStringLiteral("retry/maxDelayMs"), config.retryMaxDelayMs).toInt();

    config.ackTimeoutMs = settings.value(QStringLiteral("channel/ackTimeoutMs"), config.ackTimeoutMs).toInt();
    const QString user = qEnvironmentVariable("USER", QStringLiteral("user"));
    config.channelNamespace =
        settings.value(QStringLiteral("channel/namespace"), QStringLiteral("georemind-%1").arg(user)).toString();

    config.speechEnabled = settings.value(QStringLiteral("speech/enabled"), config.speechEnabled).toBool();
    config.speechCommand = settings.value(QStringLiteral("speech/command"), config.speechCommand).toString();
    config.speechMaxWaitMs = settings.value(QStringLiteral("speech/maxWaitMs"), config.speechMaxWaitMs).toInt();
    config.speechPollIntervalMs =
        qMax(1, settings.value(QStringLiteral("speech/pollIntervalMs"), config.speechPollIntervalMs).toInt());

    config.minRadius = settings.value(QStringLiteral("geofence/minRadius"), config.minRadius).toDouble();
    config.maxRadius = settings.value(QStringLiteral("geofence/maxRadius"), config.maxRadius).toDouble();

    config.snoozeMinutes = settings.value(QStringLiteral("pending/snoozeMinutes"), config.snoozeMinutes).toInt();

    config.defaultNotificationSound = settings.value(QStringLiteral("notification/defaultSound")).toString();
    return config;
}

QString AppConfig::defaultDataDirectory()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/georemind");
    }
    return storageFolder;
}

data::DatabaseOptions AppConfig::databaseOptions() const
{
    data::DatabaseOptions options;
    options.path = databasePath;
    options.busyTimeoutMs = busyTimeoutMs;
    options.retry.maxAttempts = retryMaxAttempts;
    options.retry.baseDelay = std::chrono::milliseconds(retryBaseDelayMs);
    options.retry.maxDelay = std::chrono::milliseconds(retryMaxDelayMs);
    return options;
}

data::RadiusBounds AppConfig::radiusBounds() const
{
    data::RadiusBounds bounds;
    bounds.minimum = minRadius;
    bounds.maximum = maxRadius;
    return bounds;
}

} // namespace core
} // namespace georemind
