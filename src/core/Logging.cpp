#include "cadence/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcCadenceCore, "cadence.core")
