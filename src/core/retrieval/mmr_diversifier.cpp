#include "core/retrieval/mmr_diversifier.h"
#include "core/reader/text_analysis.h"
#include "core/shared/logging.h"

#include <QHash>

#include <algorithm>
#include <limits>

namespace qr {

MmrDiversifier::MmrDiversifier(MmrConfig config)
    : m_config(config)
{
}

double MmrDiversifier::jaccard(const QSet<QString>& lhs, const QSet<QString>& rhs)
{
    if (lhs.isEmpty() && rhs.isEmpty()) {
        return 0.0;
    }
    const QSet<QString>& smaller = lhs.size() <= rhs.size() ? lhs : rhs;
    const QSet<QString>& larger = lhs.size() <= rhs.size() ? rhs : lhs;
    int shared = 0;
    for (const QString& token : smaller) {
        if (larger.contains(token)) {
            ++shared;
        }
    }
    const int unionSize = lhs.size() + rhs.size() - shared;
    return unionSize > 0 ? static_cast<double>(shared) / unionSize : 0.0;
}

std::vector<Candidate> MmrDiversifier::diversify(std::vector<Candidate> candidates, int k) const
{
    const size_t target = k < 0 ? candidates.size()
                                : std::min(candidates.size(), static_cast<size_t>(k));
    std::vector<Candidate> selected;
    if (target == 0) {
        return selected;
    }
    selected.reserve(target);

    double maxFused = 0.0;
    for (const Candidate& candidate : candidates) {
        maxFused = std::max(maxFused, candidate.scores.fused);
    }

    std::vector<QSet<QString>> tokens;
    tokens.reserve(candidates.size());
    for (const Candidate& candidate : candidates) {
        tokens.push_back(tokenize(resolveCandidateText(candidate)));
    }

    const double alpha = m_config.alpha;
    std::vector<bool> taken(candidates.size(), false);
    std::vector<size_t> selectedIndices;
    QHash<QString, int> perSource;

    while (selected.size() < target) {
        size_t best = candidates.size();
        double bestScore = -std::numeric_limits<double>::infinity();

        for (size_t i = 0; i < candidates.size(); ++i) {
            if (taken[i]) {
                continue;
            }
            const double relevance = maxFused > 0.0 ? candidates[i].scores.fused / maxFused : 0.0;
            double similarity = 0.0;
            for (size_t j : selectedIndices) {
                similarity = std::max(similarity, jaccard(tokens[i], tokens[j]));
            }
            const int sameSource = perSource.value(candidateSource(candidates[i]), 0);
            const double score = alpha * relevance
                - (1.0 - alpha) * similarity
                - m_config.perFilePenalty * sameSource;
            if (score > bestScore) {
                bestScore = score;
                best = i;
            }
        }

        if (best == candidates.size()) {
            break;
        }
        taken[best] = true;
        selectedIndices.push_back(best);
        perSource[candidateSource(candidates[best])] += 1;

        Candidate picked = candidates[best];
        picked.scores.mmr = bestScore;
        selected.push_back(std::move(picked));
    }

    LOG_DEBUG(qrRetrieval, "MMR selected %d of %d candidate(s)",
              static_cast<int>(selected.size()), static_cast<int>(candidates.size()));
    return selected;
}

} // namespace qr
