#include "core/shared/candidate.h"

#include <QSet>

#include <array>
#include <utility>

namespace qr {

QString resolveCandidateText(const Candidate& candidate)
{
    const std::array<const std::optional<QString>*, 4> chain = {
        &candidate.text,
        &candidate.bm25Text,
        &candidate.embeddingText,
        &candidate.content,
    };
    for (const std::optional<QString>* field : chain) {
        if (field->has_value() && !field->value().trimmed().isEmpty()) {
            return field->value();
        }
    }
    return QString();
}

QString candidateKey(const Candidate& candidate)
{
    return candidateSource(candidate) + QStringLiteral("#") + QString::number(candidate.chunkId);
}

QString candidateSource(const Candidate& candidate)
{
    return candidate.filePath.isEmpty() ? candidate.fileName : candidate.filePath;
}

std::vector<Candidate> dedupeCandidates(std::vector<Candidate> candidates)
{
    std::vector<Candidate> unique;
    unique.reserve(candidates.size());
    QSet<QString> seen;
    for (Candidate& candidate : candidates) {
        const QString key = candidateKey(candidate);
        if (seen.contains(key)) {
            continue;
        }
        seen.insert(key);
        unique.push_back(std::move(candidate));
    }
    return unique;
}

} // namespace qr
