#pragma once

namespace qr {

// Channel weights before lambda scaling. The fuser rescales the lexical
// weights (path, shortText, title, bm25) to sum to lambdaLex and the vector
// weight to lambdaSem.
struct FusionWeights {
    double path = 1.0;
    double shortText = 1.0;
    double title = 1.0;
    double bm25 = 1.5;
    double vector = 1.0;
    double lambdaLex = 0.6;
    double lambdaSem = 0.4;
};

struct RetrievalConfig {
    int timeoutMs = 5000;
    bool retainComponents = true;
    int docHintPrefetchLimit = 8;
    int workerThreads = 5;
};

struct MmrConfig {
    double alpha = 0.85;
    double perFilePenalty = 0.10;
};

struct ReaderConfig {
    int perChunk = 2;
    int total = 10;
    int maxChars = 4000;
};

struct PackerConfig {
    int maxChars = 1600;
    int maxPerDocument = 2;
};

struct PipelineConfig {
    int perFileCap = 5;
    bool precheckEnabled = true;
    double precheckMinOverlap = 0.10;
    bool enforceSpan = true;
};

// Per-tag retrieval limits (shortlist before diversification, final top-k).
struct TagLimits {
    int shortlistSize = 60;
    int topk = 25;
};

} // namespace qr
