#include "core/reader/grounding.h"
#include "core/reader/span_extractor.h"
#include "core/reader/text_analysis.h"

#include <QRegularExpression>
#include <QStringList>

#include <algorithm>

namespace qr {

namespace {

QSet<QString> whitespaceWords(const QString& text)
{
    static const QRegularExpression whitespace(QStringLiteral(R"(\s+)"));
    const QStringList words = text.toLower().split(whitespace, Qt::SkipEmptyParts);
    return QSet<QString>(words.begin(), words.end());
}

// Sentences of an assembled context, annotation prefixes removed.
QStringList contextSentences(const QString& context)
{
    QStringList sentences;
    for (const QString& line : SpanExtractor::contentLines(context)) {
        sentences.append(splitSentences(line));
    }
    return sentences;
}

} // namespace

double overlapRatio(const QSet<QString>& lhs, const QSet<QString>& rhs)
{
    if (lhs.isEmpty()) {
        return 0.0;
    }
    int shared = 0;
    for (const QString& token : lhs) {
        if (rhs.contains(token)) {
            ++shared;
        }
    }
    return static_cast<double>(shared) / lhs.size();
}

bool answerInContext(const QString& answer, const QString& context, double minOverlap)
{
    const QString trimmed = answer.trimmed().toLower();
    if (trimmed.isEmpty()) {
        return false;
    }
    if (context.toLower().contains(trimmed)) {
        return true;
    }

    const QSet<QString> answerTokens = tokenize(answer);
    if (answerTokens.isEmpty()) {
        return false;
    }
    if (overlapRatio(answerTokens, tokenize(context)) >= minOverlap) {
        return true;
    }
    const QStringList sentences = contextSentences(context);
    return std::any_of(sentences.begin(), sentences.end(), [&](const QString& sentence) {
        return overlapRatio(answerTokens, tokenize(sentence)) >= minOverlap;
    });
}

std::optional<QString> bestSentenceFromContext(const QString& context, const QString& question)
{
    const QSet<QString> questionTokens = tokenize(question);
    std::optional<QString> best;
    double bestScore = 0.0;
    for (const QString& sentence : contextSentences(context)) {
        const double score = overlapRatio(questionTokens, tokenize(sentence));
        if (score > bestScore) {
            bestScore = score;
            best = sentence;
        }
    }
    return best;
}

bool likelyAnswerable(const QString& context, const QString& question, double minOverlap)
{
    const QSet<QString> questionWords = whitespaceWords(question);
    const QSet<QString> contextWords = whitespaceWords(context);
    int shared = 0;
    for (const QString& word : questionWords) {
        if (contextWords.contains(word)) {
            ++shared;
        }
    }
    return static_cast<double>(shared) / std::max(1, static_cast<int>(questionWords.size()))
        >= minOverlap;
}

} // namespace qr
