#pragma once

#include <QSettings>
#include <memory>

#include "georemind/data/KeyValueStore.hpp"

namespace georemind {
namespace data {

// KeyValueStore over an INI file; QSettings takes care of the cross-process file locking.
class SettingsKeyValueStore : public KeyValueStore
{
public:
    explicit SettingsKeyValueStore(const QString &filePath);
    ~SettingsKeyValueStore() override;

    QVariant value(const QString &key) const override;
    void setValue(const QString &key, const QVariant &value) override;
    void remove(const QString &key) override;
    QStringList childKeys(const QString &group) const override;

    QString filePath() const;

private:
    void refresh() const;
    void flush(const QString &key);

    std::unique_ptr<QSettings> m_settings;
};

} // namespace data
} // namespace georemind
