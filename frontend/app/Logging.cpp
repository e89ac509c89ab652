#include "Logging.h"

Q_LOGGING_CATEGORY(lcaApp, "lca.app")
Q_LOGGING_CATEGORY(lcaSidecar, "lca.sidecar")
Q_LOGGING_CATEGORY(lcaBackend, "lca.backend")
