#pragma once

#include <QSet>
#include <QString>

#include <optional>

namespace qr {

// Fraction of lhs tokens that also appear in rhs; 0 when lhs is empty.
double overlapRatio(const QSet<QString>& lhs, const QSet<QString>& rhs);

// True when the answer appears verbatim (case-insensitive) in the context, or
// at least minOverlap of its tokens appear in the whole context or in one of
// its sentences.
bool answerInContext(const QString& answer, const QString& context, double minOverlap = 0.6);

// Context sentence with the highest question-token overlap. nullopt when no
// sentence shares a token with the question.
std::optional<QString> bestSentenceFromContext(const QString& context, const QString& question);

// Cheap answerability gate: share of whitespace-separated question words that
// also occur in the context.
bool likelyAnswerable(const QString& context, const QString& question, double minOverlap = 0.10);

} // namespace qr
