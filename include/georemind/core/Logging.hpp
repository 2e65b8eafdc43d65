#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcStorage)
Q_DECLARE_LOGGING_CATEGORY(lcChannel)
Q_DECLARE_LOGGING_CATEGORY(lcTrigger)
Q_DECLARE_LOGGING_CATEGORY(lcArbiter)
Q_DECLARE_LOGGING_CATEGORY(lcApp)
