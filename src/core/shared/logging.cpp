#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(vmcCore, "vmc.core")
Q_LOGGING_CATEGORY(vmcStore, "vmc.store")
Q_LOGGING_CATEGORY(vmcSampling, "vmc.sampling")
Q_LOGGING_CATEGORY(vmcPool, "vmc.pool")
Q_LOGGING_CATEGORY(vmcConsensus, "vmc.consensus")
