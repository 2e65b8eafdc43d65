#pragma once

#include <functional>

#include <QDateTime>

namespace georemind {
namespace core {

using Clock = std::function<QDateTime()>;

inline Clock systemClock()
{
    return [] { return QDateTime::currentDateTime(); };
}

} // namespace core
} // namespace georemind
