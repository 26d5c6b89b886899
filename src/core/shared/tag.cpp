#include "core/shared/tag.h"

#include <QRegularExpression>

namespace qr {

QString canonicalTagLabel(const QString& label)
{
    return label.trimmed().toLower();
}

std::optional<Tag> parseTag(const QString& label)
{
    static const QRegularExpression validLabel(QStringLiteral("^[a-z0-9_]+$"));

    const QString canonical = canonicalTagLabel(label);
    if (canonical.isEmpty() || !validLabel.match(canonical).hasMatch()) {
        return std::nullopt;
    }

    if (canonical == QLatin1String("db_workflows")) {
        return Tag::DbWorkflows;
    }
    if (canonical == QLatin1String("ops_health")) {
        return Tag::OpsHealth;
    }
    if (canonical == QLatin1String("meta_ops")) {
        return Tag::MetaOps;
    }
    if (canonical == QLatin1String("rag_qa_single")) {
        return Tag::RagQaSingle;
    }
    if (canonical == QLatin1String("rag_qa_multi")) {
        return Tag::RagQaMulti;
    }
    return Tag::General;
}

QString tagToString(Tag tag)
{
    switch (tag) {
    case Tag::DbWorkflows: return QStringLiteral("db_workflows");
    case Tag::OpsHealth:   return QStringLiteral("ops_health");
    case Tag::MetaOps:     return QStringLiteral("meta_ops");
    case Tag::RagQaSingle: return QStringLiteral("rag_qa_single");
    case Tag::RagQaMulti:  return QStringLiteral("rag_qa_multi");
    case Tag::General:     break;
    }
    return QStringLiteral("general");
}

bool isDatabaseWorkflow(Tag tag)
{
    return tag == Tag::DbWorkflows;
}

const TagBonusProfile& tagBonusProfile(Tag tag)
{
    static const TagBonusProfile none;
    static const TagBonusProfile opsHealth{
        0.20,
        {
            QStringLiteral("ops"),
            QStringLiteral("health"),
            QStringLiteral("healthcheck"),
            QStringLiteral("monitor"),
            QStringLiteral("monitoring"),
            QStringLiteral("uptime"),
            QStringLiteral("alert"),
            QStringLiteral("alerts"),
            QStringLiteral("metrics"),
            QStringLiteral("latency"),
            QStringLiteral("restart"),
            QStringLiteral("status"),
        },
    };
    static const TagBonusProfile metaOps{
        0.20,
        {
            QStringLiteral("rollout"),
            QStringLiteral("rollouts"),
            QStringLiteral("deploy"),
            QStringLiteral("deploys"),
            QStringLiteral("deployment"),
            QStringLiteral("deployments"),
            QStringLiteral("release"),
            QStringLiteral("canary"),
            QStringLiteral("rollback"),
        },
    };

    switch (tag) {
    case Tag::OpsHealth: return opsHealth;
    case Tag::MetaOps:   return metaOps;
    case Tag::General:
    case Tag::DbWorkflows:
    case Tag::RagQaSingle:
    case Tag::RagQaMulti:
        break;
    }
    return none;
}

} // namespace qr
