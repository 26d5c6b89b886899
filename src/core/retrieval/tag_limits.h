#pragma once

#include "core/shared/pipeline_config.h"

#include <QString>

#include <map>

namespace qr {

// Per-tag retrieval limits lookup. Called once per retrieval.
class TagLimitsProvider {
public:
    virtual ~TagLimitsProvider() = default;
    virtual TagLimits limitsFor(const QString& tagLabel) const = 0;
};

// Fixed table keyed by canonical tag label; unknown labels get the defaults.
class StaticTagLimits : public TagLimitsProvider {
public:
    explicit StaticTagLimits(TagLimits defaults = {},
                             std::map<QString, TagLimits> perTag = {});

    TagLimits limitsFor(const QString& tagLabel) const override;

private:
    TagLimits m_defaults;
    std::map<QString, TagLimits> m_perTag;
};

} // namespace qr
