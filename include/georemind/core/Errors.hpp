#pragma once

#include <stdexcept>
#include <string>

#include <QString>

namespace georemind {
namespace core {

class Error : public std::runtime_error
{
public:
    explicit Error(const QString &message)
        : std::runtime_error(message.toStdString())
    {
    }

    QString message() const { return QString::fromStdString(what()); }
};

// A value broke one of its construction invariants (priority range, weekday range, radius bounds).
class ValidationError : public Error
{
public:
    using Error::Error;
};

class ConflictError : public Error
{
public:
    using Error::Error;
};

class NotFoundError : public Error
{
public:
    using Error::Error;
};

// The persisted key-value state could not be written back.
class StateStoreError : public Error
{
public:
    using Error::Error;
};

} // namespace core
} // namespace georemind
