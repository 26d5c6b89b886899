#pragma once

#include <QSet>
#include <QString>
#include <QStringList>

namespace qr {

// Texts longer than this are split line by line instead of on sentence
// punctuation, so code-like chunks stay line-aligned.
constexpr int kLineSplitThresholdChars = 4000;

// Lower-cased alphanumeric/underscore/dot/dash runs. Leading and trailing
// dots and dashes are stripped so sentence punctuation does not stick to
// words ("details." -> "details", "docs/guide.md" -> "docs", "guide.md").
QSet<QString> tokenize(const QString& text);

// Prose: split where ., ! or ? is followed by whitespace and a capital letter
// or digit. Texts above kLineSplitThresholdChars are split on newlines.
// Sentences are whitespace-simplified; empty ones are dropped.
QStringList splitSentences(const QString& text);

// Tokens of a file name: the whole stem plus its parts split on . _ and -.
QSet<QString> filenameTokens(const QString& filePath);

// First non-empty line of text, trimmed.
QString firstLine(const QString& text);

// CREATE/ALTER [UNIQUE] TABLE/INDEX anywhere in the text.
bool containsSchemaDefinition(const QString& text);

bool containsCodeFence(const QString& text);

// Starts with create/alter/drop/insert/update/delete/select.
bool startsWithDataCommand(const QString& text);

// Starts with create/alter/drop.
bool isDataDefinitionCommand(const QString& text);

// Mentions gin, gist, ivfflat or hnsw.
bool mentionsIndexMethod(const QString& text);

} // namespace qr
