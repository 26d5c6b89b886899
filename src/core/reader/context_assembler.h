#pragma once

#include "core/shared/candidate.h"
#include "core/shared/pipeline_config.h"
#include "core/shared/tag.h"

#include <QString>
#include <QStringList>

#include <vector>

namespace qr {

struct SentencePick {
    QString filePath;
    int chunkId = 0;
    QString sentence;
    double score = 0.0;
    double retrievalScore = 0.0; // tie-break only
};

// Compact reader context. text holds one "[source#chunk:id] sentence" line
// per pick, in pick order.
struct ContextBundle {
    QString text;
    std::vector<SentencePick> picks;

    bool isEmpty() const { return picks.empty(); }
};

// Sentence-level context builder.
//
// Each candidate's text is split into sentences and scored against the
// question. The best perChunk sentences of every candidate are pooled, and the
// best total of the pool are emitted while the text stays within maxChars.
class ContextAssembler {
public:
    static constexpr double kPhraseBonus = 0.4;
    static constexpr double kFileBonus = 0.2;
    static constexpr double kSqlBonus = 0.35;
    static constexpr double kCommandBonus = 0.10;
    static constexpr double kIndexMethodBonus = 0.05;
    static constexpr double kFirstLineMultiplier = 1.15;
    static constexpr double kRetrievalTieBreak = 1e-6;

    explicit ContextAssembler(ReaderConfig config = {});

    ContextBundle assemble(const std::vector<Candidate>& candidates,
                           const QString& question,
                           Tag tag,
                           const QStringList& phraseHints = {}) const;

    // Score of one sentence drawn from sourceText of the file at filePath.
    static double scoreSentence(const QString& sentence,
                                const QSet<QString>& questionTokens,
                                const QString& filePath,
                                const QString& sourceText,
                                Tag tag,
                                const QStringList& phraseHints);

    static QString formatLine(const SentencePick& pick);

private:
    ReaderConfig m_config;
};

} // namespace qr
