#include "core/reader/text_analysis.h"

#include <QFileInfo>
#include <QRegularExpression>

namespace qr {

namespace {

QString stripEdgePunctuation(const QString& token)
{
    int start = 0;
    int end = token.size();
    while (start < end
           && (token.at(start) == QLatin1Char('.') || token.at(start) == QLatin1Char('-'))) {
        ++start;
    }
    while (end > start
           && (token.at(end - 1) == QLatin1Char('.') || token.at(end - 1) == QLatin1Char('-'))) {
        --end;
    }
    return token.mid(start, end - start);
}

} // namespace

QSet<QString> tokenize(const QString& text)
{
    static const QRegularExpression tokenRegex(QStringLiteral(R"([a-z0-9_.\-]+)"));

    QSet<QString> tokens;
    if (text.isEmpty()) {
        return tokens;
    }

    auto matchIt = tokenRegex.globalMatch(text.toLower());
    while (matchIt.hasNext()) {
        const QString token = stripEdgePunctuation(matchIt.next().captured(0));
        if (!token.isEmpty()) {
            tokens.insert(token);
        }
    }
    return tokens;
}

QStringList splitSentences(const QString& text)
{
    static const QRegularExpression sentenceBoundary(
        QStringLiteral(R"((?<=[.!?])\s+(?=[A-Z0-9]))"));
    static const QRegularExpression lineBoundary(QStringLiteral(R"(\r?\n)"));

    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        return {};
    }

    const QStringList parts = trimmed.size() > kLineSplitThresholdChars
        ? trimmed.split(lineBoundary, Qt::SkipEmptyParts)
        : trimmed.split(sentenceBoundary, Qt::SkipEmptyParts);

    QStringList sentences;
    sentences.reserve(parts.size());
    for (const QString& part : parts) {
        const QString sentence = part.simplified();
        if (!sentence.isEmpty()) {
            sentences.append(sentence);
        }
    }
    return sentences;
}

QSet<QString> filenameTokens(const QString& filePath)
{
    static const QRegularExpression partSeparator(QStringLiteral(R"([._\-]+)"));

    QSet<QString> tokens;
    const QString stem = QFileInfo(filePath).completeBaseName().toLower();
    if (stem.isEmpty()) {
        return tokens;
    }

    tokens.insert(stem);
    const QStringList parts = stem.split(partSeparator, Qt::SkipEmptyParts);
    for (const QString& part : parts) {
        tokens.insert(part);
    }
    return tokens;
}

QString firstLine(const QString& text)
{
    const QStringList lines = text.split(QLatin1Char('\n'));
    for (const QString& line : lines) {
        const QString trimmed = line.trimmed();
        if (!trimmed.isEmpty()) {
            return trimmed;
        }
    }
    return QString();
}

bool containsSchemaDefinition(const QString& text)
{
    static const QRegularExpression schemaRegex(
        QStringLiteral(R"(\b(create|alter)\s+(unique\s+)?(table|index)\b)"),
        QRegularExpression::CaseInsensitiveOption);
    return schemaRegex.match(text).hasMatch();
}

bool containsCodeFence(const QString& text)
{
    return text.contains(QStringLiteral("```"));
}

bool startsWithDataCommand(const QString& text)
{
    static const QRegularExpression commandRegex(
        QStringLiteral(R"(^\s*(create|alter|drop|insert|update|delete|select)\b)"),
        QRegularExpression::CaseInsensitiveOption);
    return commandRegex.match(text).hasMatch();
}

bool isDataDefinitionCommand(const QString& text)
{
    static const QRegularExpression ddlRegex(
        QStringLiteral(R"(^\s*(create|alter|drop)\b)"),
        QRegularExpression::CaseInsensitiveOption);
    return ddlRegex.match(text).hasMatch();
}

bool mentionsIndexMethod(const QString& text)
{
    static const QRegularExpression methodRegex(
        QStringLiteral(R"(\b(gin|gist|ivfflat|hnsw)\b)"),
        QRegularExpression::CaseInsensitiveOption);
    return methodRegex.match(text).hasMatch();
}

} // namespace qr
