#include "core/reader/context_packer.h"
#include "core/reader/text_analysis.h"
#include "core/shared/logging.h"

#include <QStringList>

#include <algorithm>

namespace qr {

QString ContextPacker::snippet(const QString& text)
{
    const QStringList sentences = splitSentences(text);
    const QString leading = sentences.mid(0, kSnippetSentences).join(QLatin1Char(' '));
    const QString prefix = text.trimmed().left(kMaxSnippetChars);
    return leading.size() <= prefix.size() ? leading : prefix;
}

std::optional<QString> ContextPacker::pack(std::vector<RankedSource> ranked,
                                           const TextLookup& lookup,
                                           PackerConfig config)
{
    if (config.maxChars < 0 || config.maxPerDocument < 0) {
        LOG_WARN(qrReader, "Packer rejected: maxChars=%d maxPerDocument=%d",
                 config.maxChars, config.maxPerDocument);
        return std::nullopt;
    }

    std::stable_sort(ranked.begin(), ranked.end(), [](const RankedSource& lhs, const RankedSource& rhs) {
        return lhs.second > rhs.second;
    });

    static const QString separator = QStringLiteral("\n\n");
    QStringList blocks;
    int length = 0;
    QHash<QString, int> perDocument;

    for (const RankedSource& entry : ranked) {
        const QString& sourceId = entry.first;
        if (perDocument.value(sourceId, 0) >= config.maxPerDocument) {
            continue;
        }
        const std::optional<QString> text = lookup ? lookup(sourceId) : std::nullopt;
        if (!text || text->trimmed().isEmpty()) {
            continue;
        }

        const QString header = QStringLiteral("[doc:%1] ").arg(sourceId);
        QString body = snippet(*text);
        int added = header.size() + body.size() + (blocks.isEmpty() ? 0 : separator.size());
        if (length + added > config.maxChars) {
            if (!blocks.isEmpty()) {
                break;
            }
            body = body.left(config.maxChars);
            added = header.size() + body.size();
        }

        blocks.append(header + body);
        length += added;
        perDocument[sourceId] += 1;
        if (length >= config.maxChars) {
            break;
        }
    }

    LOG_DEBUG(qrReader, "Packed %d block(s), %d char(s)",
              static_cast<int>(blocks.size()), length);
    return blocks.join(separator);
}

std::optional<QString> ContextPacker::pack(std::vector<RankedSource> ranked,
                                           const QHash<QString, QString>& texts,
                                           PackerConfig config)
{
    return pack(std::move(ranked),
                [&texts](const QString& sourceId) -> std::optional<QString> {
                    const auto it = texts.constFind(sourceId);
                    if (it == texts.constEnd()) {
                        return std::nullopt;
                    }
                    return it.value();
                },
                config);
}

} // namespace qr
