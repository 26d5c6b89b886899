#include "core/reader/answer_normalizer.h"
#include "core/reader/text_analysis.h"

#include <QRegularExpression>
#include <QStringList>

namespace qr {

namespace {

// Database answers collapse to one line: the shortest schema statement when
// several lines carry one, otherwise the first non-empty line.
QString reduceDatabaseAnswer(const QString& text)
{
    static const QRegularExpression lineBreak(QStringLiteral(R"(\r?\n)"));
    QStringList lines;
    for (const QString& line : text.split(lineBreak)) {
        const QString trimmed = line.trimmed();
        if (!trimmed.isEmpty()) {
            lines.append(trimmed);
        }
    }
    if (lines.isEmpty()) {
        return QString();
    }

    QString shortestSchema;
    int schemaLines = 0;
    for (const QString& line : lines) {
        if (containsSchemaDefinition(line)) {
            ++schemaLines;
            if (shortestSchema.isEmpty() || line.size() < shortestSchema.size()) {
                shortestSchema = line;
            }
        }
    }
    return schemaLines >= 2 ? shortestSchema : lines.first();
}

QString stripTrailingNoise(QString text)
{
    int end = text.size();
    while (end > 0) {
        const QChar c = text.at(end - 1);
        if (c == QLatin1Char(';') || c == QLatin1Char('`') || c.isSpace()) {
            --end;
        } else {
            break;
        }
    }
    text.truncate(end);
    return text;
}

} // namespace

QString AnswerNormalizer::normalize(const QString& raw, Tag tag)
{
    QString text = raw.trimmed();
    if (isDatabaseWorkflow(tag)) {
        text = reduceDatabaseAnswer(text);
    }
    text = stripTrailingNoise(text.simplified());

    if (text.isEmpty()) {
        return unknownAnswer();
    }
    if (text.size() > kMaxAnswerChars) {
        text = text.left(kMaxAnswerChars - 3) + QStringLiteral("...");
    }
    return text;
}

} // namespace qr
