#pragma once

#include "core/shared/tag.h"

#include <QString>

namespace qr {

inline constexpr const char kUnknownAnswer[] = "I don't know";

// Canonical, length-bounded answer form shared by rule-based and generative
// answers. normalize() is idempotent and never returns more than
// kMaxAnswerChars characters; an empty answer becomes kUnknownAnswer.
class AnswerNormalizer {
public:
    static constexpr int kMaxAnswerChars = 180;

    static QString normalize(const QString& raw, Tag tag);

    static QString unknownAnswer() { return QString::fromLatin1(kUnknownAnswer); }
    static bool isUnknown(const QString& answer) { return answer == unknownAnswer(); }
};

} // namespace qr
