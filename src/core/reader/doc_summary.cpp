#include "core/reader/doc_summary.h"
#include "core/reader/text_analysis.h"
#include "core/shared/logging.h"

#include <QRegularExpression>
#include <QStringList>

namespace qr {

namespace {

// Trim spaces, dashes, colons, semicolons and dots from both ends.
QString stripEdges(const QString& text)
{
    static const QString edgeChars = QStringLiteral(" -:;.");
    int start = 0;
    int end = text.size();
    while (start < end && edgeChars.contains(text.at(start))) {
        ++start;
    }
    while (end > start && edgeChars.contains(text.at(end - 1))) {
        --end;
    }
    return text.mid(start, end - start);
}

QString stripLeadingMarkers(const QString& text)
{
    static const QRegularExpression markers(QStringLiteral(R"(^[#>\-\s]+)"));
    QString stripped = text;
    stripped.remove(markers);
    return stripped;
}

bool isTableSeparatorRow(const QString& line)
{
    static const QRegularExpression separator(QStringLiteral(R"(^\|?[\s:\-|]+\|?$)"));
    return line.contains(QLatin1Char('-')) && separator.match(line).hasMatch();
}

} // namespace

std::optional<QString> DocumentSummarizer::tldrTableSummary(const QString& markdown)
{
    static const QRegularExpression header(
        QStringLiteral(R"(^\|\s*what\s+this\s+file\s+is\s*\|\s*read\s+when\s*\|\s*do\s+next\s*\|\s*$)"),
        QRegularExpression::CaseInsensitiveOption);

    const QStringList lines = markdown.split(QLatin1Char('\n'));
    for (int i = 0; i < lines.size(); ++i) {
        if (!header.match(lines.at(i).trimmed()).hasMatch()) {
            continue;
        }
        for (int j = i + 1; j < lines.size(); ++j) {
            const QString row = lines.at(j).trimmed();
            if (!row.startsWith(QLatin1Char('|'))) {
                return std::nullopt;
            }
            if (isTableSeparatorRow(row)) {
                continue;
            }
            const QStringList cells = row.mid(1).split(QLatin1Char('|'));
            const QString summary = stripEdges(cells.value(0).simplified());
            if (summary.isEmpty()) {
                return std::nullopt;
            }
            return summary;
        }
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<QString> DocumentSummarizer::tldrBlockquoteSummary(const QString& markdown)
{
    static const QRegularExpression tldrStart(QStringLiteral(R"(^>\s*tl;?dr)"),
                                              QRegularExpression::CaseInsensitiveOption);

    bool inTldr = false;
    for (const QString& line : markdown.split(QLatin1Char('\n'))) {
        const QString stripped = line.trimmed();
        if (!inTldr) {
            inTldr = tldrStart.match(stripped).hasMatch();
            continue;
        }
        if (!stripped.startsWith(QLatin1Char('>'))) {
            break;
        }
        int start = 0;
        while (start < stripped.size()
               && (stripped.at(start) == QLatin1Char('>') || stripped.at(start) == QLatin1Char(' '))) {
            ++start;
        }
        QString content = stripped.mid(start);
        if (content.startsWith(QLatin1Char('-'))) {
            content = content.mid(1).trimmed();
        }
        if (content.isEmpty()) {
            continue;
        }
        const QString summary = stripEdges(content.simplified());
        if (summary.isEmpty()) {
            return std::nullopt;
        }
        return summary;
    }
    return std::nullopt;
}

std::optional<QString> DocumentSummarizer::textSummary(const QString& text)
{
    static const QRegularExpression htmlComment(QStringLiteral(R"(<!--.*?-->)"),
                                                QRegularExpression::DotMatchesEverythingOption);
    static const QRegularExpression emphasis(QStringLiteral(R"([*`_]+)"));
    static const QRegularExpression labels[] = {
        QRegularExpression(QStringLiteral(R"(what this file is\s*[:\-]\s*(.+))"),
                           QRegularExpression::CaseInsensitiveOption),
        QRegularExpression(QStringLiteral(R"(purpose\s*[:\-]\s*(.+))"),
                           QRegularExpression::CaseInsensitiveOption),
        QRegularExpression(QStringLiteral(R"(summary\s*[:\-]\s*(.+))"),
                           QRegularExpression::CaseInsensitiveOption),
    };

    QString cleaned = text;
    cleaned.replace(htmlComment, QStringLiteral(" "));
    cleaned.replace(emphasis, QStringLiteral(" "));

    for (const QRegularExpression& label : labels) {
        const QRegularExpressionMatch match = label.match(cleaned);
        if (!match.hasMatch()) {
            continue;
        }
        const QString summary = stripLeadingMarkers(stripEdges(match.captured(1).simplified()));
        if (summary.isEmpty()) {
            continue;
        }
        const QStringList sentences = splitSentences(summary);
        return sentences.isEmpty() ? summary : sentences.first();
    }

    for (const QString& sentence : splitSentences(cleaned)) {
        if (sentence.split(QLatin1Char(' '), Qt::SkipEmptyParts).size() >= kMinSentenceWords) {
            return stripLeadingMarkers(sentence);
        }
    }
    return std::nullopt;
}

std::optional<QString> DocumentSummarizer::summarize(const std::vector<Candidate>& candidates,
                                                     const QString& slug)
{
    const QString needle = slug.trimmed().toLower();
    if (needle.isEmpty()) {
        return std::nullopt;
    }

    for (const Candidate& candidate : candidates) {
        if (!candidateSource(candidate).toLower().contains(needle)) {
            continue;
        }

        const QString content = candidate.content.value_or(QString());
        if (auto table = tldrTableSummary(content)) {
            LOG_DEBUG(qrReader, "Doc summary for '%s' from TL;DR table", qUtf8Printable(needle));
            return table;
        }
        if (auto quote = tldrBlockquoteSummary(content)) {
            LOG_DEBUG(qrReader, "Doc summary for '%s' from TL;DR blockquote", qUtf8Printable(needle));
            return quote;
        }

        QStringList texts;
        if (!content.trimmed().isEmpty()) {
            texts.append(content);
        }
        const QString readerText = resolveCandidateText(candidate);
        if (!readerText.trimmed().isEmpty() && readerText != content) {
            texts.append(readerText);
        }
        for (const QString& text : texts) {
            if (auto summary = textSummary(text)) {
                LOG_DEBUG(qrReader, "Doc summary for '%s' from text", qUtf8Printable(needle));
                return summary;
            }
        }
    }
    return std::nullopt;
}

} // namespace qr
