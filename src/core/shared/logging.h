#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(vmcCore)
Q_DECLARE_LOGGING_CATEGORY(vmcStore)
Q_DECLARE_LOGGING_CATEGORY(vmcSampling)
Q_DECLARE_LOGGING_CATEGORY(vmcPool)
Q_DECLARE_LOGGING_CATEGORY(vmcConsensus)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
