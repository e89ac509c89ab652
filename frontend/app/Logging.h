#ifndef LOGGING_H
#define LOGGING_H

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcaApp)
Q_DECLARE_LOGGING_CATEGORY(lcaSidecar)
Q_DECLARE_LOGGING_CATEGORY(lcaBackend)

#endif // LOGGING_H
