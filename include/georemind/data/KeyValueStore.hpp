#pragma once

#include <QString>
#include <QStringList>
#include <QVariant>

namespace georemind {
namespace data {

// Writes are flushed before returning or throw core::StateStoreError.
class KeyValueStore
{
public:
    virtual ~KeyValueStore() = default;

    virtual QVariant value(const QString &key) const = 0;
    virtual void setValue(const QString &key, const QVariant &value) = 0;
    virtual void remove(const QString &key) = 0;
    virtual QStringList childKeys(const QString &group) const = 0;
};

} // namespace data
} // namespace georemind
