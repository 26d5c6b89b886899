#include "core/pipeline/answer_pipeline.h"
#include "core/reader/answer_normalizer.h"
#include "core/reader/doc_summary.h"
#include "core/reader/grounding.h"
#include "core/reader/span_extractor.h"
#include "core/retrieval/mmr_diversifier.h"
#include "core/retrieval/source_cap.h"
#include "core/shared/logging.h"
#include "core/shared/tag.h"

#include <QRegularExpression>

#include <algorithm>
#include <iterator>

namespace qr {

namespace {

PipelineResult failedResult(PipelineResult::Status status, const QString& message)
{
    PipelineResult result;
    result.status = status;
    result.errorMessage = message;
    result.answer.text = AnswerNormalizer::unknownAnswer();
    result.answer.provenance = AnswerProvenance::Abstained;
    return result;
}

Answer abstain()
{
    return Answer{AnswerNormalizer::unknownAnswer(), AnswerProvenance::Abstained};
}

} // namespace

QString provenanceToString(AnswerProvenance provenance)
{
    switch (provenance) {
    case AnswerProvenance::RuleExtracted:      return QStringLiteral("rule_extracted");
    case AnswerProvenance::GenerativeFallback: return QStringLiteral("generative_fallback");
    case AnswerProvenance::Abstained:          return QStringLiteral("abstained");
    }
    return QStringLiteral("unknown");
}

AnswerPipeline::AnswerPipeline(std::shared_ptr<ChunkStore> store,
                               std::shared_ptr<const TagLimitsProvider> limits,
                               std::shared_ptr<AnswerGenerator> generator,
                               Settings settings,
                               QueryChannelBuilder builder)
    : m_store(std::move(store))
    , m_limits(std::move(limits))
    , m_generator(std::move(generator))
    , m_settings(std::move(settings))
    , m_builder(std::move(builder))
    , m_fuser(m_store, m_settings.fusion, m_settings.retrieval)
{
}

bool AnswerPipeline::asksForFile(const QString& question)
{
    static const QRegularExpression fileQuestion(
        QStringLiteral(R"(\b(which|what)\s+(file|document)\s+describes\b)"),
        QRegularExpression::CaseInsensitiveOption);
    return fileQuestion.match(question).hasMatch();
}

bool AnswerPipeline::asksForPurpose(const QString& question)
{
    return question.contains(QLatin1String("main purpose"), Qt::CaseInsensitive);
}

QStringList AnswerPipeline::phraseHints(const QString& question, const ChannelQuerySet& channels)
{
    // Double quotes and backticks only; apostrophes in "what's" or "team's"
    // are not quotes.
    static const QRegularExpression quoted(QStringLiteral(R"((["`])([^"`]{3,})\1)"));

    QStringList hints;
    auto matchIt = quoted.globalMatch(question);
    while (matchIt.hasNext()) {
        const QString phrase = matchIt.next().captured(2).trimmed();
        if (!phrase.isEmpty() && !hints.contains(phrase, Qt::CaseInsensitive)) {
            hints.append(phrase);
        }
    }
    if (channels.docHint && !hints.contains(*channels.docHint, Qt::CaseInsensitive)) {
        hints.append(*channels.docHint);
    }
    return hints;
}

std::vector<Candidate> AnswerPipeline::prefetchHintedDocument(const ChannelQuerySet& channels) const
{
    std::vector<Candidate> prefetched;
    const int limit = m_settings.retrieval.docHintPrefetchLimit;
    if (!channels.docHint || limit <= 0 || !m_store) {
        return prefetched;
    }

    const ChannelQueryResult result = m_store->fetchDocumentChunks(*channels.docHint, limit);
    if (!result.ok()) {
        // The fused retrieval that follows reports store failures.
        LOG_WARN(qrCore, "Doc hint prefetch for '%s' failed: %s",
                 qUtf8Printable(*channels.docHint),
                 qUtf8Printable(result.errorMessage.value_or(QStringLiteral("unknown error"))));
        return prefetched;
    }

    for (const ChunkRow& row : result.rows) {
        Candidate candidate;
        candidate.filePath = row.filePath;
        candidate.fileName = row.fileName;
        candidate.chunkId = row.chunkId;
        candidate.text = row.text;
        candidate.bm25Text = row.bm25Text;
        candidate.embeddingText = row.embeddingText;
        candidate.content = row.content;
        prefetched.push_back(std::move(candidate));
    }
    LOG_DEBUG(qrCore, "Doc hint '%s' prefetched %d chunk(s)",
              qUtf8Printable(*channels.docHint), static_cast<int>(prefetched.size()));
    return prefetched;
}

Answer AnswerPipeline::generateAnswer(const ContextBundle& context,
                                      const QString& question,
                                      Tag tag) const
{
    if (!m_generator) {
        return abstain();
    }
    const std::optional<QString> generated = m_generator->generate(context.text, question);
    if (!generated || generated->trimmed().isEmpty()) {
        LOG_DEBUG(qrCore, "Generator produced no answer");
        return abstain();
    }

    QString text = generated->trimmed();
    if (m_settings.pipeline.enforceSpan && !answerInContext(text, context.text)) {
        const std::optional<QString> fallback = bestSentenceFromContext(context.text, question);
        if (fallback && answerInContext(*fallback, context.text, 0.5)) {
            LOG_DEBUG(qrCore, "Ungrounded answer replaced by best context sentence");
            text = *fallback;
        } else {
            LOG_DEBUG(qrCore, "Ungrounded answer rejected");
            return abstain();
        }
    }

    Answer answer{AnswerNormalizer::normalize(text, tag), AnswerProvenance::GenerativeFallback};
    if (AnswerNormalizer::isUnknown(answer.text)) {
        answer.provenance = AnswerProvenance::Abstained;
    }
    return answer;
}

PipelineResult AnswerPipeline::answer(const QString& question, const QString& tagLabel) const
{
    if (question.trimmed().isEmpty()) {
        LOG_WARN(qrCore, "Question rejected: empty");
        return failedResult(PipelineResult::Status::InvalidInput, QStringLiteral("empty question"));
    }
    const std::optional<Tag> tag = parseTag(tagLabel);
    if (!tag) {
        LOG_WARN(qrCore, "Question rejected: malformed tag '%s'", qUtf8Printable(tagLabel));
        return failedResult(PipelineResult::Status::InvalidInput,
                            QStringLiteral("malformed tag '%1'").arg(tagLabel));
    }

    const TagLimits limits = m_limits ? m_limits->limitsFor(tagLabel) : m_settings.defaultLimits;
    if (limits.shortlistSize < 0 || limits.topk < 0) {
        LOG_WARN(qrCore, "Negative limits for tag '%s'", qUtf8Printable(tagLabel));
        return failedResult(PipelineResult::Status::InvalidInput,
                            QStringLiteral("negative limits for tag '%1'").arg(tagLabel));
    }

    const ChannelQuerySet channels = m_builder.build(question, *tag);
    if (channels.isEmpty()) {
        return failedResult(PipelineResult::Status::InvalidInput, QStringLiteral("empty query channels"));
    }

    std::vector<Candidate> prefetched = prefetchHintedDocument(channels);

    RetrievalOutcome retrieval = m_fuser.retrieve(channels, *tag, limits.shortlistSize);
    if (!retrieval.ok()) {
        LOG_WARN(qrCore, "Retrieval failed (%s): %s",
                 qUtf8Printable(retrievalStatusToString(retrieval.status)),
                 qUtf8Printable(retrieval.errorMessage.value_or(QString())));
        return failedResult(retrieval.status,
                            retrieval.errorMessage.value_or(retrievalStatusToString(retrieval.status)));
    }

    const MmrDiversifier diversifier(m_settings.mmr);
    std::vector<Candidate> ranked = diversifier.diversify(std::move(retrieval.candidates),
                                                          limits.shortlistSize);

    if (!prefetched.empty()) {
        // Hinted chunks lead the list with the top retrieval score.
        const double leadScore = ranked.empty() ? 1.0 : ranked.front().retrievalScore();
        for (Candidate& candidate : prefetched) {
            candidate.scores.fused = leadScore;
            candidate.scores.mmr = leadScore;
        }
        std::move(ranked.begin(), ranked.end(), std::back_inserter(prefetched));
        ranked = dedupeCandidates(std::move(prefetched));
    }

    const int cap = std::max(1, std::min(m_settings.pipeline.perFileCap, std::max(1, limits.topk)));
    std::optional<std::vector<Candidate>> capped = capPerSource(std::move(ranked), cap, limits.topk);
    if (!capped) {
        return failedResult(PipelineResult::Status::InvalidInput, QStringLiteral("invalid source cap"));
    }

    PipelineResult result;
    result.candidates = std::move(*capped);

    const ContextAssembler assembler(m_settings.reader);
    result.context = assembler.assemble(result.candidates, question, *tag,
                                        phraseHints(question, channels));

    if (asksForPurpose(question) && channels.docHint) {
        if (const std::optional<QString> summary =
                DocumentSummarizer::summarize(result.candidates, *channels.docHint)) {
            result.answer = Answer{AnswerNormalizer::normalize(*summary, *tag),
                                   AnswerProvenance::RuleExtracted};
            LOG_DEBUG(qrCore, "Purpose question answered with summary of '%s'",
                      qUtf8Printable(*channels.docHint));
            return result;
        }
    }

    if (asksForFile(question) && !result.candidates.empty()) {
        result.answer = Answer{AnswerNormalizer::normalize(candidateSource(result.candidates.front()), *tag),
                               AnswerProvenance::RuleExtracted};
        LOG_DEBUG(qrCore, "File question answered with top candidate path");
        return result;
    }

    if (const std::optional<QString> span = SpanExtractor::extract(result.context.text, question, *tag)) {
        result.answer = Answer{AnswerNormalizer::normalize(*span, *tag), AnswerProvenance::RuleExtracted};
        return result;
    }

    if (m_settings.pipeline.precheckEnabled
        && !likelyAnswerable(result.context.text, question, m_settings.pipeline.precheckMinOverlap)) {
        LOG_DEBUG(qrCore, "Precheck failed; abstaining");
        result.answer = abstain();
        return result;
    }

    result.answer = generateAnswer(result.context, question, *tag);
    LOG_INFO(qrCore, "Answered tag %s via %s (%d candidate(s), %d pick(s))",
             qUtf8Printable(tagToString(*tag)),
             qUtf8Printable(provenanceToString(result.answer.provenance)),
             static_cast<int>(result.candidates.size()),
             static_cast<int>(result.context.picks.size()));
    return result;
}

} // namespace qr
