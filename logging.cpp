#include "logging.h"

Q_LOGGING_CATEGORY(lcEngine, "passlab.engine", QtInfoMsg)
Q_LOGGING_CATEGORY(lcHash, "passlab.hash", QtInfoMsg)
Q_LOGGING_CATEGORY(lcService, "passlab.service", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCli, "passlab.cli", QtWarningMsg)
