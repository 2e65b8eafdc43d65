#include "georemind/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcStorage, "georemind.storage")
Q_LOGGING_CATEGORY(lcChannel, "georemind.channel")
Q_LOGGING_CATEGORY(lcTrigger, "georemind.trigger")
Q_LOGGING_CATEGORY(lcArbiter, "georemind.arbiter")
Q_LOGGING_CATEGORY(lcApp, "georemind.app")
