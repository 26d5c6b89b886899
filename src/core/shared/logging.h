#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(qrCore)
Q_DECLARE_LOGGING_CATEGORY(qrIndex)
Q_DECLARE_LOGGING_CATEGORY(qrQuery)
Q_DECLARE_LOGGING_CATEGORY(qrRetrieval)
Q_DECLARE_LOGGING_CATEGORY(qrReader)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
