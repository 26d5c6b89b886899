#pragma once

#include "core/index/chunk_store.h"
#include "core/query/channel_builder.h"
#include "core/retrieval/channel_worker_pool.h"
#include "core/shared/candidate.h"
#include "core/shared/pipeline_config.h"
#include "core/shared/tag.h"

#include <QString>

#include <memory>
#include <optional>
#include <vector>

namespace qr {

struct RetrievalOutcome {
    enum class Status {
        Ok,
        InvalidInput,
        StoreUnavailable,
        Timeout,
        StoreFailed,
    };

    Status status = Status::Ok;
    std::vector<Candidate> candidates;
    std::optional<QString> errorMessage;

    bool ok() const { return status == Status::Ok; }
};

QString retrievalStatusToString(RetrievalOutcome::Status status);

// HybridFuser -- issues every channel of a ChannelQuerySet against the chunk
// store concurrently and merges the ranked lists into one candidate list.
//
// Channel queries run on a worker pool owned by the fuser; destroying the
// fuser waits for in-flight queries. Each channel's raw scores are max-normalized to [0,1] and combined with
// the lambda-scaled weights; the sum is multiplied by a clamped document
// prior. Any channel failure or a missed deadline fails the whole call:
// partial channel results are never merged.
class HybridFuser {
public:
    HybridFuser(std::shared_ptr<ChunkStore> store,
                FusionWeights weights = {},
                RetrievalConfig config = {});

    HybridFuser(const HybridFuser&) = delete;
    HybridFuser& operator=(const HybridFuser&) = delete;

    RetrievalOutcome retrieve(const ChannelQuerySet& channels,
                              Tag tag,
                              int shortlistSize,
                              bool retainComponents) const;

    RetrievalOutcome retrieve(const ChannelQuerySet& channels,
                              Tag tag,
                              int shortlistSize) const
    {
        return retrieve(channels, tag, shortlistSize, m_config.retainComponents);
    }

    // Lexical weights rescaled to sum to lambdaLex, the vector weight to
    // lambdaSem, after normalizing the lambdas to sum to 1.
    static FusionWeights scaleFusionWeights(const FusionWeights& weights);

    // Multiplier in [0.95, 1.05] from the file name and chunk text.
    static double documentPrior(const QString& fileName, const QString& text);

private:
    std::shared_ptr<ChunkStore> m_store;
    FusionWeights m_weights;
    RetrievalConfig m_config;
    std::unique_ptr<ChannelWorkerPool> m_pool;
};

} // namespace qr
