#pragma once

#include "core/shared/pipeline_config.h"

#include <QHash>
#include <QString>

#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace qr {

// Flat multi-document context without sentence scoring. Each accepted source
// contributes "[doc:ID] snippet" blocks joined by a blank line; the joined
// text stays within maxChars, except that an oversized first block is cut to
// a maxChars-long snippet.
class ContextPacker {
public:
    using RankedSource = std::pair<QString, double>;
    using TextLookup = std::function<std::optional<QString>(const QString& sourceId)>;

    static constexpr int kMaxSnippetChars = 600;
    static constexpr int kSnippetSentences = 2;

    // nullopt when maxChars or maxPerDocument is negative.
    static std::optional<QString> pack(std::vector<RankedSource> ranked,
                                       const TextLookup& lookup,
                                       PackerConfig config = {});

    static std::optional<QString> pack(std::vector<RankedSource> ranked,
                                       const QHash<QString, QString>& texts,
                                       PackerConfig config = {});

    // First two sentences or the first 600 characters, whichever is shorter.
    static QString snippet(const QString& text);
};

} // namespace qr
