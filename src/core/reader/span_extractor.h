#pragma once

#include "core/shared/tag.h"

#include <QString>
#include <QStringList>

#include <optional>

namespace qr {

// Rule-based answer extraction from an assembled context. Rules run in order
// and the first match wins:
//   1. a file path with an extension (best question overlap, then earliest)
//   2. database-workflow tags: the shortest schema-definition line
//   3. the longest double-quoted phrase, if short enough
//   4. the first short line that is not a section header
// nullopt means no rule fired and the generative fallback should run.
class SpanExtractor {
public:
    static constexpr int kMaxSpanChars = 180;

    static std::optional<QString> extract(const QString& context,
                                          const QString& question,
                                          Tag tag);

    // Context lines with the leading "[source#chunk:id]" annotation removed.
    static QStringList contentLines(const QString& context);

    static std::optional<QString> matchPath(const QStringList& lines, const QString& question);
    static std::optional<QString> matchSchemaLine(const QStringList& lines);
    static std::optional<QString> matchQuotedPhrase(const QStringList& lines);
    static std::optional<QString> matchShortLine(const QStringList& lines);

    static bool isSectionHeader(const QString& line);
};

} // namespace qr
