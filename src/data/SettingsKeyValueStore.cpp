#include "georemind/data/SettingsKeyValueStore.hpp"

#include "georemind/core/Errors.hpp"
#include "georemind/core/Logging.hpp"

#include <QDir>
#include <QFileInfo>

namespace georemind {
namespace data {

SettingsKeyValueStore::SettingsKeyValueStore(const QString &filePath)
{
    QDir dir = QFileInfo(filePath).dir();
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }
    m_settings = std::make_unique<QSettings>(filePath, QSettings::IniFormat);
}

SettingsKeyValueStore::~SettingsKeyValueStore() = default;

QVariant SettingsKeyValueStore::value(const QString &key) const
{
    refresh();
    return m_settings->value(key);
}

void SettingsKeyValueStore::setValue(const QString &key, const QVariant &value)
{
    m_settings->setValue(key, value);
    flush(key);
}

void SettingsKeyValueStore::remove(const QString &key)
{
    m_settings->remove(key);
    flush(key);
}

QStringList SettingsKeyValueStore::childKeys(const QString &group) const
{
    refresh();
    m_settings->beginGroup(group);
    const QStringList keys = m_settings->childKeys();
    m_settings->endGroup();
    return keys;
}

QString SettingsKeyValueStore::filePath() const
{
    return m_settings->fileName();
}

// Picks up changes other processes made since the last read.
void SettingsKeyValueStore::refresh() const
{
    m_settings->sync();
}

void SettingsKeyValueStore::flush(const QString &key)
{
    m_settings->sync();
    if (m_settings->status() != QSettings::NoError) {
        qCWarning(lcStorage) << "Could not persist state key" << key << "to" << m_settings->fileName();
        throw core::StateStoreError(QStringLiteral("Cannot write %1 to %2").arg(key, m_settings->fileName()));
    }
}

} // namespace data
} // namespace georemind
