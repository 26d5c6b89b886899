#pragma once

#include <QSet>
#include <QString>

#include <optional>

namespace qr {

// Topical label attached to a question. Unrecognised but well-formed labels
// map to General; the raw label is still used for per-tag limit lookups.
enum class Tag {
    General,
    DbWorkflows,
    OpsHealth,
    MetaOps,
    RagQaSingle,
    RagQaMulti,
};

// Returns nullopt for empty or malformed labels (anything outside [a-z0-9_]
// after trimming and lower-casing).
std::optional<Tag> parseTag(const QString& label);

// Canonical label for a tag. General maps to "general".
QString tagToString(Tag tag);

// Trimmed, lower-cased form used as the per-tag limits key.
QString canonicalTagLabel(const QString& label);

bool isDatabaseWorkflow(Tag tag);

// Sentence-scoring bonus attached to a tag. The bonus applies when
// a sentence contains any of the listed tokens.
struct TagBonusProfile {
    double bonus = 0.0;
    QSet<QString> tokens;
};

const TagBonusProfile& tagBonusProfile(Tag tag);

} // namespace qr
