#pragma once

#include "core/index/chunk_store.h"
#include "core/query/channel_builder.h"
#include "core/reader/context_assembler.h"
#include "core/retrieval/hybrid_fuser.h"
#include "core/retrieval/tag_limits.h"
#include "core/shared/candidate.h"
#include "core/shared/settings.h"

#include <QString>
#include <QStringList>

#include <memory>
#include <optional>
#include <vector>

namespace qr {

// Generative answer provider used when no extraction rule fires. Returns
// nullopt when no answer could be produced.
class AnswerGenerator {
public:
    virtual ~AnswerGenerator() = default;
    virtual std::optional<QString> generate(const QString& context, const QString& question) = 0;
};

enum class AnswerProvenance {
    RuleExtracted,
    GenerativeFallback,
    Abstained,
};

QString provenanceToString(AnswerProvenance provenance);

struct Answer {
    QString text;
    AnswerProvenance provenance = AnswerProvenance::Abstained;
};

struct PipelineResult {
    using Status = RetrievalOutcome::Status;

    Status status = Status::Ok;
    Answer answer;
    ContextBundle context;
    std::vector<Candidate> candidates; // after diversification and capping
    std::optional<QString> errorMessage;

    bool ok() const { return status == Status::Ok; }
};

// AnswerPipeline -- question + tag to normalized answer.
//
// Retrieval failures are returned as a non-Ok status. Everything after
// retrieval is pure and always produces an answer, falling back to the
// unknown sentinel when nothing grounded is found.
class AnswerPipeline {
public:
    AnswerPipeline(std::shared_ptr<ChunkStore> store,
                   std::shared_ptr<const TagLimitsProvider> limits,
                   std::shared_ptr<AnswerGenerator> generator,
                   Settings settings,
                   QueryChannelBuilder builder = QueryChannelBuilder());

    PipelineResult answer(const QString& question, const QString& tagLabel) const;

    // "which file describes ..." / "what document describes ..." questions.
    static bool asksForFile(const QString& question);

    // "main purpose of <doc>" questions.
    static bool asksForPurpose(const QString& question);

    // Quoted phrases of the question plus the document hint.
    static QStringList phraseHints(const QString& question, const ChannelQuerySet& channels);

private:
    std::vector<Candidate> prefetchHintedDocument(const ChannelQuerySet& channels) const;
    Answer generateAnswer(const ContextBundle& context, const QString& question, Tag tag) const;

    std::shared_ptr<ChunkStore> m_store;
    std::shared_ptr<const TagLimitsProvider> m_limits;
    std::shared_ptr<AnswerGenerator> m_generator;
    Settings m_settings;
    QueryChannelBuilder m_builder;
    HybridFuser m_fuser;
};

} // namespace qr
