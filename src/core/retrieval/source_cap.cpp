#include "core/retrieval/source_cap.h"
#include "core/shared/logging.h"

#include <QHash>

#include <algorithm>

namespace qr {

std::optional<std::vector<Candidate>> capPerSource(std::vector<Candidate> candidates,
                                                   int cap,
                                                   int topk)
{
    if (cap < 0 || topk < 0) {
        LOG_WARN(qrRetrieval, "Source cap rejected: cap=%d topk=%d", cap, topk);
        return std::nullopt;
    }

    std::vector<Candidate> kept;
    kept.reserve(std::min(candidates.size(), static_cast<size_t>(topk)));
    QHash<QString, int> perSource;
    for (Candidate& candidate : candidates) {
        if (static_cast<int>(kept.size()) >= topk) {
            break;
        }
        int& count = perSource[candidateSource(candidate)];
        if (count >= cap) {
            continue;
        }
        ++count;
        kept.push_back(std::move(candidate));
    }
    return kept;
}

} // namespace qr
