#pragma once

#include "core/shared/candidate.h"
#include "core/shared/pipeline_config.h"

#include <QSet>
#include <QString>

#include <vector>

namespace qr {

// Maximal Marginal Relevance reordering.
//
// Relevance is the fused score scaled by the list maximum. Similarity to the
// selected set is the highest token Jaccard overlap between resolved texts.
// Each already-selected chunk from the same source costs perFilePenalty.
// Ties go to the earlier input position, so output is deterministic.
class MmrDiversifier {
public:
    explicit MmrDiversifier(MmrConfig config = {});

    // Selects up to k candidates (all of them when k < 0) and sets scores.mmr.
    std::vector<Candidate> diversify(std::vector<Candidate> candidates, int k) const;

    static double jaccard(const QSet<QString>& lhs, const QSet<QString>& rhs);

private:
    MmrConfig m_config;
};

} // namespace qr
