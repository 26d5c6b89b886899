#pragma once

#include "core/shared/pipeline_config.h"

#include <QString>

#include <map>

namespace qr {

struct Settings {
    // Database
    QString dbPath;

    // Store filters
    int minChunkChars = 20;
    QString excludedPathPrefix = QStringLiteral("600_");

    FusionWeights fusion;
    RetrievalConfig retrieval;
    MmrConfig mmr;
    ReaderConfig reader;
    PackerConfig packer;
    PipelineConfig pipeline;

    // Per-tag limits keyed by canonical tag label; unknown tags use defaultLimits.
    TagLimits defaultLimits;
    std::map<QString, TagLimits> tagLimits;
};

} // namespace qr
