#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(qrCore, "quarry.core")
Q_LOGGING_CATEGORY(qrIndex, "quarry.index")
Q_LOGGING_CATEGORY(qrQuery, "quarry.query")
Q_LOGGING_CATEGORY(qrRetrieval, "quarry.retrieval")
Q_LOGGING_CATEGORY(qrReader, "quarry.reader")
