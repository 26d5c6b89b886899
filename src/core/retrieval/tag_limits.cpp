#include "core/retrieval/tag_limits.h"
#include "core/shared/tag.h"

namespace qr {

StaticTagLimits::StaticTagLimits(TagLimits defaults, std::map<QString, TagLimits> perTag)
    : m_defaults(defaults)
{
    for (auto& entry : perTag) {
        m_perTag[canonicalTagLabel(entry.first)] = entry.second;
    }
}

TagLimits StaticTagLimits::limitsFor(const QString& tagLabel) const
{
    const auto it = m_perTag.find(canonicalTagLabel(tagLabel));
    return it != m_perTag.end() ? it->second : m_defaults;
}

} // namespace qr
