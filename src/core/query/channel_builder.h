#pragma once

#include "core/shared/tag.h"

#include <QString>
#include <QStringList>

#include <memory>
#include <optional>
#include <vector>

namespace qr {

// Query representations for one (question, tag) pair. Immutable once built;
// consumed only by the fuser.
struct ChannelQuerySet {
    QString shortQuery;     // keyword form with tag hint terms
    QString titleQuery;     // title-weighted form
    QString lexicalQuery;   // full lexical form, no hints
    std::vector<float> vector;
    std::optional<QString> docHint; // document slug named in the question

    bool isEmpty() const { return lexicalQuery.isEmpty(); }
    bool hasVector() const { return !vector.empty(); }
};

// Dense query embedding provider. Embedding computation lives outside quarry.
class QueryEmbedder {
public:
    virtual ~QueryEmbedder() = default;
    virtual std::vector<float> embed(const QString& text) = 0;
};

// Derives the short/title/lexical forms from a question.
class ChannelStrategy {
public:
    virtual ~ChannelStrategy() = default;
    virtual ChannelQuerySet build(const QString& question, Tag tag) const = 0;
};

// Default strategy: stopword-filtered keywords for the short and title
// channels, the normalized question for the lexical channel.
class KeywordChannelStrategy : public ChannelStrategy {
public:
    static constexpr int kMaxShortTerms = 6;

    ChannelQuerySet build(const QString& question, Tag tag) const override;

    // Lower-case, drop noise punctuation, unify dashes, collapse whitespace.
    static QString normalizeQuestion(const QString& raw);

    // Distinct non-stopword terms in question order.
    static QStringList keyTerms(const QString& normalized);

    static QStringList tagHintTerms(Tag tag);
};

class QueryChannelBuilder {
public:
    explicit QueryChannelBuilder(std::shared_ptr<const ChannelStrategy> strategy = nullptr,
                                 std::shared_ptr<QueryEmbedder> embedder = nullptr);

    // Empty/whitespace questions yield an empty set; callers must not fuse it.
    ChannelQuerySet build(const QString& question, Tag tag) const;

    // Document slug named in the question: the stem of a file name with a
    // known extension ("guide.md" -> "guide") or a numbered slug
    // ("400_12_advanced-configs").
    static std::optional<QString> parseDocHint(const QString& question);

private:
    std::shared_ptr<const ChannelStrategy> m_strategy;
    std::shared_ptr<QueryEmbedder> m_embedder;
};

} // namespace qr
