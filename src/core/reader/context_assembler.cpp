#include "core/reader/context_assembler.h"
#include "core/reader/text_analysis.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace qr {

namespace {

bool intersects(const QSet<QString>& lhs, const QSet<QString>& rhs)
{
    const QSet<QString>& smaller = lhs.size() <= rhs.size() ? lhs : rhs;
    const QSet<QString>& larger = lhs.size() <= rhs.size() ? rhs : lhs;
    for (const QString& token : smaller) {
        if (larger.contains(token)) {
            return true;
        }
    }
    return false;
}

double rankKey(const SentencePick& pick)
{
    return pick.score + ContextAssembler::kRetrievalTieBreak * pick.retrievalScore;
}

void sortPicks(std::vector<SentencePick>& picks)
{
    std::stable_sort(picks.begin(), picks.end(), [](const SentencePick& lhs, const SentencePick& rhs) {
        return rankKey(lhs) > rankKey(rhs);
    });
}

} // namespace

ContextAssembler::ContextAssembler(ReaderConfig config)
    : m_config(config)
{
}

QString ContextAssembler::formatLine(const SentencePick& pick)
{
    return QStringLiteral("[%1#chunk:%2] %3")
        .arg(pick.filePath, QString::number(pick.chunkId), pick.sentence);
}

double ContextAssembler::scoreSentence(const QString& sentence,
                                       const QSet<QString>& questionTokens,
                                       const QString& filePath,
                                       const QString& sourceText,
                                       Tag tag,
                                       const QStringList& phraseHints)
{
    const QSet<QString> tokens = tokenize(sentence);

    int shared = 0;
    for (const QString& token : tokens) {
        if (questionTokens.contains(token)) {
            ++shared;
        }
    }
    const double overlap = shared / std::max(1.0, std::sqrt(static_cast<double>(tokens.size())));

    double bonus = 0.0;
    const QString lowered = sentence.toLower();
    for (const QString& hint : phraseHints) {
        const QString trimmedHint = hint.trimmed().toLower();
        if (!trimmedHint.isEmpty() && lowered.contains(trimmedHint)) {
            bonus += kPhraseBonus;
            break;
        }
    }
    if (intersects(tokens, filenameTokens(filePath))) {
        bonus += kFileBonus;
    }
    if (containsCodeFence(sentence) || containsSchemaDefinition(sentence)) {
        bonus += kSqlBonus;
    }
    if (startsWithDataCommand(sentence)) {
        bonus += kCommandBonus;
    }
    if (mentionsIndexMethod(sentence)) {
        bonus += kIndexMethodBonus;
    }
    const TagBonusProfile& profile = tagBonusProfile(tag);
    if (profile.bonus > 0.0 && intersects(tokens, profile.tokens)) {
        bonus += profile.bonus;
    }

    double multiplier = 1.0;
    if (isDataDefinitionCommand(sentence)
        && sentence.simplified() == firstLine(sourceText).simplified()) {
        multiplier = kFirstLineMultiplier;
    }
    return (overlap + bonus) * multiplier;
}

ContextBundle ContextAssembler::assemble(const std::vector<Candidate>& candidates,
                                         const QString& question,
                                         Tag tag,
                                         const QStringList& phraseHints) const
{
    ContextBundle bundle;
    if (m_config.perChunk < 0 || m_config.total < 0 || m_config.maxChars < 0) {
        LOG_WARN(qrReader, "Context assembly skipped: negative limits (perChunk=%d total=%d maxChars=%d)",
                 m_config.perChunk, m_config.total, m_config.maxChars);
        return bundle;
    }
    if (candidates.empty() || m_config.perChunk == 0 || m_config.total == 0) {
        return bundle;
    }

    const QSet<QString> questionTokens = tokenize(question);

    std::vector<SentencePick> pool;
    for (const Candidate& candidate : candidates) {
        const QString text = resolveCandidateText(candidate);
        const QStringList sentences = splitSentences(text);
        if (sentences.isEmpty()) {
            continue;
        }

        const QString source = candidateSource(candidate);
        std::vector<SentencePick> local;
        local.reserve(static_cast<size_t>(sentences.size()));
        for (const QString& sentence : sentences) {
            SentencePick pick;
            pick.filePath = source;
            pick.chunkId = candidate.chunkId;
            pick.sentence = sentence;
            pick.score = scoreSentence(sentence, questionTokens, source, text, tag, phraseHints);
            pick.retrievalScore = candidate.retrievalScore();
            local.push_back(std::move(pick));
        }

        sortPicks(local);
        if (static_cast<int>(local.size()) > m_config.perChunk) {
            local.resize(static_cast<size_t>(m_config.perChunk));
        }
        std::move(local.begin(), local.end(), std::back_inserter(pool));
    }

    sortPicks(pool);
    if (static_cast<int>(pool.size()) > m_config.total) {
        pool.resize(static_cast<size_t>(m_config.total));
    }

    QStringList lines;
    int length = 0;
    for (SentencePick& pick : pool) {
        const QString line = formatLine(pick);
        const int added = line.size() + (lines.isEmpty() ? 0 : 1);
        if (length + added > m_config.maxChars) {
            break;
        }
        length += added;
        lines.append(line);
        bundle.picks.push_back(std::move(pick));
    }
    bundle.text = lines.join(QLatin1Char('\n'));

    LOG_DEBUG(qrReader, "Assembled %d sentence(s), %d char(s) from %d candidate(s)",
              static_cast<int>(bundle.picks.size()), static_cast<int>(bundle.text.size()),
              static_cast<int>(candidates.size()));
    return bundle;
}

} // namespace qr
