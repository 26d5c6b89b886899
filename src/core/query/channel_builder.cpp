#include "core/query/channel_builder.h"
#include "core/shared/logging.h"

#include <QRegularExpression>
#include <QSet>

namespace qr {

namespace {

bool isNoisePunctuation(QChar ch)
{
    switch (ch.unicode()) {
    case '!':
    case '?':
    case '$':
    case '@':
    case '#':
    case '%':
    case '^':
    case '&':
    case '*':
    case '(':
    case ')':
    case '{':
    case '}':
    case '[':
    case ']':
    case '~':
    case '`':
    case '"':
    case '\'':
    case ',':
    case ';':
    case ':':
        return true;
    default:
        return false;
    }
}

const QSet<QString>& stopwords()
{
    static const QSet<QString> words = {
        QStringLiteral("a"),     QStringLiteral("an"),    QStringLiteral("and"),
        QStringLiteral("any"),   QStringLiteral("are"),   QStringLiteral("as"),
        QStringLiteral("at"),    QStringLiteral("be"),    QStringLiteral("by"),
        QStringLiteral("can"),   QStringLiteral("do"),    QStringLiteral("does"),
        QStringLiteral("for"),   QStringLiteral("from"),  QStringLiteral("how"),
        QStringLiteral("i"),     QStringLiteral("in"),    QStringLiteral("is"),
        QStringLiteral("it"),    QStringLiteral("my"),    QStringLiteral("of"),
        QStringLiteral("on"),    QStringLiteral("or"),    QStringLiteral("should"),
        QStringLiteral("that"),  QStringLiteral("the"),   QStringLiteral("there"),
        QStringLiteral("this"),  QStringLiteral("to"),    QStringLiteral("we"),
        QStringLiteral("what"),  QStringLiteral("when"),  QStringLiteral("where"),
        QStringLiteral("which"), QStringLiteral("who"),   QStringLiteral("why"),
        QStringLiteral("with"),  QStringLiteral("you"),
    };
    return words;
}

QString stripTermEdges(const QString& term)
{
    int start = 0;
    int end = term.size();
    while (start < end && !term.at(start).isLetterOrNumber() && term.at(start) != QLatin1Char('_')) {
        ++start;
    }
    while (end > start && !term.at(end - 1).isLetterOrNumber() && term.at(end - 1) != QLatin1Char('_')) {
        --end;
    }
    return term.mid(start, end - start);
}

void appendUnique(QStringList& terms, QSet<QString>& seen, const QString& term)
{
    if (term.isEmpty() || seen.contains(term)) {
        return;
    }
    seen.insert(term);
    terms.append(term);
}

} // namespace

QString KeywordChannelStrategy::normalizeQuestion(const QString& raw)
{
    QString normalized;
    normalized.reserve(raw.size());

    for (QChar ch : raw.trimmed()) {
        if (isNoisePunctuation(ch)) {
            ch = QLatin1Char(' ');
        }
        if (ch.unicode() == 0x2013 || ch.unicode() == 0x2014) {
            ch = QLatin1Char('-');
        }
        if (ch.isSpace()) {
            if (!normalized.isEmpty() && !normalized.back().isSpace()) {
                normalized.append(QLatin1Char(' '));
            }
            continue;
        }
        normalized.append(ch.toLower());
    }

    return normalized.trimmed();
}

QStringList KeywordChannelStrategy::keyTerms(const QString& normalized)
{
    QStringList terms;
    QSet<QString> seen;
    const QStringList words = normalized.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    for (const QString& word : words) {
        const QString term = stripTermEdges(word);
        if (term.size() < 2 || stopwords().contains(term)) {
            continue;
        }
        appendUnique(terms, seen, term);
    }
    return terms;
}

QStringList KeywordChannelStrategy::tagHintTerms(Tag tag)
{
    switch (tag) {
    case Tag::DbWorkflows:
        return {QStringLiteral("create"), QStringLiteral("index"),
                QStringLiteral("alter"), QStringLiteral("table")};
    case Tag::OpsHealth:
        return {QStringLiteral("health"), QStringLiteral("monitoring")};
    case Tag::MetaOps:
        return {QStringLiteral("rollout"), QStringLiteral("deploy")};
    case Tag::General:
    case Tag::RagQaSingle:
    case Tag::RagQaMulti:
        break;
    }
    return {};
}

ChannelQuerySet KeywordChannelStrategy::build(const QString& question, Tag tag) const
{
    ChannelQuerySet set;
    const QString normalized = normalizeQuestion(question);
    set.lexicalQuery = normalized.isEmpty() ? question.simplified() : normalized;
    if (set.lexicalQuery.isEmpty()) {
        return set;
    }

    const QStringList terms = keyTerms(normalized);
    set.docHint = QueryChannelBuilder::parseDocHint(question);

    QStringList shortTerms;
    QSet<QString> shortSeen;
    for (const QString& term : terms) {
        if (shortTerms.size() >= kMaxShortTerms) {
            break;
        }
        appendUnique(shortTerms, shortSeen, term);
    }
    for (const QString& hint : tagHintTerms(tag)) {
        appendUnique(shortTerms, shortSeen, hint);
    }
    set.shortQuery = shortTerms.join(QLatin1Char(' '));

    QStringList titleTerms;
    QSet<QString> titleSeen;
    for (const QString& term : terms) {
        appendUnique(titleTerms, titleSeen, term);
    }
    if (set.docHint.has_value()) {
        static const QRegularExpression slugSeparator(QStringLiteral(R"([_\-]+)"));
        const QStringList slugParts = set.docHint->split(slugSeparator, Qt::SkipEmptyParts);
        for (const QString& part : slugParts) {
            appendUnique(titleTerms, titleSeen, part);
        }
    }
    set.titleQuery = titleTerms.join(QLatin1Char(' '));
    return set;
}

QueryChannelBuilder::QueryChannelBuilder(std::shared_ptr<const ChannelStrategy> strategy,
                                         std::shared_ptr<QueryEmbedder> embedder)
    : m_strategy(strategy ? std::move(strategy) : std::make_shared<KeywordChannelStrategy>())
    , m_embedder(std::move(embedder))
{
}

ChannelQuerySet QueryChannelBuilder::build(const QString& question, Tag tag) const
{
    if (question.trimmed().isEmpty()) {
        LOG_DEBUG(qrQuery, "Empty question; no channels built");
        return {};
    }

    ChannelQuerySet set = m_strategy->build(question, tag);
    if (set.lexicalQuery.isEmpty()) {
        set.lexicalQuery = question.simplified();
    }

    if (m_embedder) {
        const QString embedText = !set.shortQuery.isEmpty() ? set.shortQuery
            : !set.titleQuery.isEmpty() ? set.titleQuery
            : set.lexicalQuery;
        set.vector = m_embedder->embed(embedText);
    }

    LOG_DEBUG(qrQuery, "Channels built: short='%s' title='%s' lexical='%s' vector=%d",
              qUtf8Printable(set.shortQuery),
              qUtf8Printable(set.titleQuery),
              qUtf8Printable(set.lexicalQuery),
              static_cast<int>(set.vector.size()));
    return set;
}

std::optional<QString> QueryChannelBuilder::parseDocHint(const QString& question)
{
    static const QRegularExpression fileRegex(
        QStringLiteral(R"(([A-Za-z0-9_\-]+)\.(md|markdown|txt|sql|py|sh|yaml|yml|toml|json)\b)"),
        QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression slugRegex(QStringLiteral(R"(\b(\d{3}_[A-Za-z0-9_\-]+)\b)"));

    const QRegularExpressionMatch fileMatch = fileRegex.match(question);
    if (fileMatch.hasMatch()) {
        return fileMatch.captured(1).toLower();
    }
    const QRegularExpressionMatch slugMatch = slugRegex.match(question);
    if (slugMatch.hasMatch()) {
        return slugMatch.captured(1).toLower();
    }
    return std::nullopt;
}

} // namespace qr
