#pragma once

#include "core/shared/candidate.h"

#include <QString>

#include <optional>
#include <vector>

namespace qr {

// One-sentence purpose summaries for "main purpose of <doc>" questions.
//
// Candidates whose path contains the document slug are tried in order. For
// each, the raw chunk content is checked for a TL;DR table ("What this file
// is | Read when | Do next") and then a "> TL;DR" blockquote. Failing both,
// the content and the reader text are searched for a "what this file is:",
// "purpose:" or "summary:" label, and finally for the first sentence of at
// least six words.
class DocumentSummarizer {
public:
    static constexpr int kMinSentenceWords = 6;

    static std::optional<QString> summarize(const std::vector<Candidate>& candidates,
                                            const QString& slug);

    // First cell of the first data row under a TL;DR table header.
    static std::optional<QString> tldrTableSummary(const QString& markdown);

    // First bullet of a "> TL;DR" blockquote.
    static std::optional<QString> tldrBlockquoteSummary(const QString& markdown);

    // Labelled purpose line, or the first sentence with enough words.
    static std::optional<QString> textSummary(const QString& text);
};

} // namespace qr
