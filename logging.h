#ifndef LOGGING_H
#define LOGGING_H

#include <QLoggingCategory>

// Never pass password text or digests to these categories.
Q_DECLARE_LOGGING_CATEGORY(lcEngine)
Q_DECLARE_LOGGING_CATEGORY(lcHash)
Q_DECLARE_LOGGING_CATEGORY(lcService)
Q_DECLARE_LOGGING_CATEGORY(lcCli)

#endif // LOGGING_H
