#pragma once

#include <QString>

#include <optional>
#include <vector>

namespace qr {

// Per-channel component scores carried by a candidate. Channel components are
// zero unless the fuser was asked to retain them; fused is always set.
struct ComponentScores {
    double path = 0.0;
    double shortText = 0.0;
    double title = 0.0;
    double bm25 = 0.0;      // lexical channel
    double vector = 0.0;
    double prior = 1.0;     // document prior multiplier, clamped to [0.95, 1.05]
    double fused = 0.0;
    std::optional<double> mmr; // set by the diversifier
};

// One retrieved chunk. Identity is (filePath, chunkId).
struct Candidate {
    QString filePath;
    QString fileName;
    int chunkId = 0;

    // Text fields in resolution order; see resolveCandidateText().
    std::optional<QString> text;
    std::optional<QString> bm25Text;
    std::optional<QString> embeddingText;
    std::optional<QString> content;

    ComponentScores scores;

    // Retrieval score used for tie-breaks downstream: mmr when present,
    // otherwise fused.
    double retrievalScore() const { return scores.mmr.value_or(scores.fused); }
};

// First non-empty of text, bm25Text, embeddingText, content.
QString resolveCandidateText(const Candidate& candidate);

// "filePath#chunkId"
QString candidateKey(const Candidate& candidate);

// Path used for per-source grouping: filePath, or fileName when the path is empty.
QString candidateSource(const Candidate& candidate);

// Drops later duplicates of the same identity, keeping first occurrence order.
std::vector<Candidate> dedupeCandidates(std::vector<Candidate> candidates);

} // namespace qr
