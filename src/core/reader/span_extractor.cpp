#include "core/reader/span_extractor.h"
#include "core/reader/text_analysis.h"
#include "core/shared/logging.h"

#include <QRegularExpression>
#include <QSet>

namespace qr {

namespace {

// Alphanumeric words, so "docs/beta.md" yields docs, beta and md.
QSet<QString> pathWords(const QString& text)
{
    static const QRegularExpression separator(QStringLiteral(R"([^a-z0-9]+)"));
    const QStringList words = text.toLower().split(separator, Qt::SkipEmptyParts);
    return QSet<QString>(words.begin(), words.end());
}

} // namespace

QStringList SpanExtractor::contentLines(const QString& context)
{
    static const QRegularExpression annotation(QStringLiteral(R"(^\s*\[[^\]\n]*\]\s*)"));
    static const QRegularExpression lineBreak(QStringLiteral(R"(\r?\n)"));

    QStringList lines;
    for (const QString& raw : context.split(lineBreak)) {
        QString line = raw;
        line.remove(annotation);
        line = line.trimmed();
        if (!line.isEmpty()) {
            lines.append(line);
        }
    }
    return lines;
}

bool SpanExtractor::isSectionHeader(const QString& line)
{
    static const QRegularExpression ruleLine(QStringLiteral(R"(^[-=*\s]+$)"));
    const QString trimmed = line.trimmed();
    return trimmed.startsWith(QLatin1Char('#')) || ruleLine.match(trimmed).hasMatch();
}

std::optional<QString> SpanExtractor::matchPath(const QStringList& lines, const QString& question)
{
    static const QRegularExpression pathRegex(
        QStringLiteral(R"((?:[A-Za-z0-9_.\-]+/)+[A-Za-z0-9_.\-]+\.[A-Za-z0-9]{1,8}\b)"));

    const QSet<QString> questionWords = pathWords(question);
    std::optional<QString> best;
    int bestOverlap = -1;
    for (const QString& line : lines) {
        auto matchIt = pathRegex.globalMatch(line);
        while (matchIt.hasNext()) {
            const QString path = matchIt.next().captured(0);
            int overlap = 0;
            for (const QString& word : pathWords(path)) {
                if (questionWords.contains(word)) {
                    ++overlap;
                }
            }
            if (overlap > bestOverlap) {
                bestOverlap = overlap;
                best = path;
            }
        }
    }
    return best;
}

std::optional<QString> SpanExtractor::matchSchemaLine(const QStringList& lines)
{
    std::optional<QString> shortest;
    for (const QString& line : lines) {
        if (!containsSchemaDefinition(line)) {
            continue;
        }
        if (!shortest || line.size() < shortest->size()) {
            shortest = line;
        }
    }
    if (shortest && shortest->size() > kMaxSpanChars) {
        shortest = shortest->left(kMaxSpanChars);
    }
    return shortest;
}

std::optional<QString> SpanExtractor::matchQuotedPhrase(const QStringList& lines)
{
    static const QRegularExpression quoteRegex(QStringLiteral(R"("([^"]+)")"));

    QString longest;
    for (const QString& line : lines) {
        auto matchIt = quoteRegex.globalMatch(line);
        while (matchIt.hasNext()) {
            const QString phrase = matchIt.next().captured(1).trimmed();
            if (phrase.size() > longest.size()) {
                longest = phrase;
            }
        }
    }
    if (longest.isEmpty() || longest.size() > kMaxSpanChars) {
        return std::nullopt;
    }
    return longest;
}

std::optional<QString> SpanExtractor::matchShortLine(const QStringList& lines)
{
    for (const QString& line : lines) {
        if (line.size() <= kMaxSpanChars && !isSectionHeader(line)) {
            return line;
        }
    }
    return std::nullopt;
}

std::optional<QString> SpanExtractor::extract(const QString& context,
                                              const QString& question,
                                              Tag tag)
{
    const QStringList lines = contentLines(context);
    if (lines.isEmpty()) {
        return std::nullopt;
    }

    if (auto path = matchPath(lines, question)) {
        LOG_DEBUG(qrReader, "Span rule: path '%s'", qUtf8Printable(*path));
        return path;
    }
    if (isDatabaseWorkflow(tag)) {
        if (auto schema = matchSchemaLine(lines)) {
            LOG_DEBUG(qrReader, "Span rule: schema line");
            return schema;
        }
    }
    if (auto quoted = matchQuotedPhrase(lines)) {
        LOG_DEBUG(qrReader, "Span rule: quoted phrase");
        return quoted;
    }
    if (auto line = matchShortLine(lines)) {
        LOG_DEBUG(qrReader, "Span rule: short line");
        return line;
    }
    return std::nullopt;
}

} // namespace qr
