#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"
#include "core/shared/tag.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace qr {

namespace {

QJsonObject limitsToJson(const TagLimits& limits)
{
    QJsonObject json;
    json.insert(QStringLiteral("shortlist"), limits.shortlistSize);
    json.insert(QStringLiteral("topk"), limits.topk);
    return json;
}

TagLimits limitsFromJson(const QJsonObject& json, const TagLimits& defaults)
{
    TagLimits limits = defaults;
    limits.shortlistSize = json.value(QStringLiteral("shortlist")).toInt(limits.shortlistSize);
    limits.topk = json.value(QStringLiteral("topk")).toInt(limits.topk);
    return limits;
}

} // namespace

std::optional<Settings> SettingsManager::load()
{
    return load(settingsFilePath());
}

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(qrCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(qrCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings)
{
    return save(settings, settingsFilePath());
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(qrCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(qrCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(qrCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/quarry/settings.json");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("minChunkChars"), settings.minChunkChars);
    json.insert(QStringLiteral("excludedPathPrefix"), settings.excludedPathPrefix);

    QJsonObject fusion;
    fusion.insert(QStringLiteral("w_path"), settings.fusion.path);
    fusion.insert(QStringLiteral("w_short"), settings.fusion.shortText);
    fusion.insert(QStringLiteral("w_title"), settings.fusion.title);
    fusion.insert(QStringLiteral("w_bm25"), settings.fusion.bm25);
    fusion.insert(QStringLiteral("w_vec"), settings.fusion.vector);
    fusion.insert(QStringLiteral("lambda_lex"), settings.fusion.lambdaLex);
    fusion.insert(QStringLiteral("lambda_sem"), settings.fusion.lambdaSem);
    json.insert(QStringLiteral("fusion"), fusion);

    QJsonObject retrieval;
    retrieval.insert(QStringLiteral("timeoutMs"), settings.retrieval.timeoutMs);
    retrieval.insert(QStringLiteral("retainComponents"), settings.retrieval.retainComponents);
    retrieval.insert(QStringLiteral("docHintPrefetchLimit"), settings.retrieval.docHintPrefetchLimit);
    retrieval.insert(QStringLiteral("workerThreads"), settings.retrieval.workerThreads);
    json.insert(QStringLiteral("retrieval"), retrieval);

    QJsonObject mmr;
    mmr.insert(QStringLiteral("alpha"), settings.mmr.alpha);
    mmr.insert(QStringLiteral("perFilePenalty"), settings.mmr.perFilePenalty);
    json.insert(QStringLiteral("mmr"), mmr);

    QJsonObject reader;
    reader.insert(QStringLiteral("perChunk"), settings.reader.perChunk);
    reader.insert(QStringLiteral("total"), settings.reader.total);
    reader.insert(QStringLiteral("maxChars"), settings.reader.maxChars);
    json.insert(QStringLiteral("reader"), reader);

    QJsonObject packer;
    packer.insert(QStringLiteral("maxChars"), settings.packer.maxChars);
    packer.insert(QStringLiteral("maxPerDocument"), settings.packer.maxPerDocument);
    json.insert(QStringLiteral("packer"), packer);

    QJsonObject pipeline;
    pipeline.insert(QStringLiteral("perFileCap"), settings.pipeline.perFileCap);
    pipeline.insert(QStringLiteral("precheckEnabled"), settings.pipeline.precheckEnabled);
    pipeline.insert(QStringLiteral("precheckMinOverlap"), settings.pipeline.precheckMinOverlap);
    pipeline.insert(QStringLiteral("enforceSpan"), settings.pipeline.enforceSpan);
    json.insert(QStringLiteral("pipeline"), pipeline);

    QJsonObject limits;
    limits.insert(QStringLiteral("default"), limitsToJson(settings.defaultLimits));
    for (const auto& [tag, tagLimits] : settings.tagLimits) {
        limits.insert(tag, limitsToJson(tagLimits));
    }
    json.insert(QStringLiteral("limits"), limits);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);
    settings.minChunkChars = json.value(QStringLiteral("minChunkChars")).toInt(settings.minChunkChars);
    settings.excludedPathPrefix = json.value(QStringLiteral("excludedPathPrefix"))
                                      .toString(settings.excludedPathPrefix);

    const QJsonObject fusion = json.value(QStringLiteral("fusion")).toObject();
    settings.fusion.path = fusion.value(QStringLiteral("w_path")).toDouble(settings.fusion.path);
    settings.fusion.shortText = fusion.value(QStringLiteral("w_short")).toDouble(settings.fusion.shortText);
    settings.fusion.title = fusion.value(QStringLiteral("w_title")).toDouble(settings.fusion.title);
    settings.fusion.bm25 = fusion.value(QStringLiteral("w_bm25")).toDouble(settings.fusion.bm25);
    settings.fusion.vector = fusion.value(QStringLiteral("w_vec")).toDouble(settings.fusion.vector);
    settings.fusion.lambdaLex = fusion.value(QStringLiteral("lambda_lex")).toDouble(settings.fusion.lambdaLex);
    settings.fusion.lambdaSem = fusion.value(QStringLiteral("lambda_sem")).toDouble(settings.fusion.lambdaSem);

    const QJsonObject retrieval = json.value(QStringLiteral("retrieval")).toObject();
    settings.retrieval.timeoutMs = retrieval.value(QStringLiteral("timeoutMs"))
                                       .toInt(settings.retrieval.timeoutMs);
    settings.retrieval.retainComponents = retrieval.value(QStringLiteral("retainComponents"))
                                              .toBool(settings.retrieval.retainComponents);
    settings.retrieval.docHintPrefetchLimit = retrieval.value(QStringLiteral("docHintPrefetchLimit"))
                                                  .toInt(settings.retrieval.docHintPrefetchLimit);
    settings.retrieval.workerThreads = retrieval.value(QStringLiteral("workerThreads"))
                                           .toInt(settings.retrieval.workerThreads);

    const QJsonObject mmr = json.value(QStringLiteral("mmr")).toObject();
    settings.mmr.alpha = mmr.value(QStringLiteral("alpha")).toDouble(settings.mmr.alpha);
    settings.mmr.perFilePenalty = mmr.value(QStringLiteral("perFilePenalty"))
                                      .toDouble(settings.mmr.perFilePenalty);

    const QJsonObject reader = json.value(QStringLiteral("reader")).toObject();
    settings.reader.perChunk = reader.value(QStringLiteral("perChunk")).toInt(settings.reader.perChunk);
    settings.reader.total = reader.value(QStringLiteral("total")).toInt(settings.reader.total);
    settings.reader.maxChars = reader.value(QStringLiteral("maxChars")).toInt(settings.reader.maxChars);

    const QJsonObject packer = json.value(QStringLiteral("packer")).toObject();
    settings.packer.maxChars = packer.value(QStringLiteral("maxChars")).toInt(settings.packer.maxChars);
    settings.packer.maxPerDocument = packer.value(QStringLiteral("maxPerDocument"))
                                         .toInt(settings.packer.maxPerDocument);

    const QJsonObject pipeline = json.value(QStringLiteral("pipeline")).toObject();
    settings.pipeline.perFileCap = pipeline.value(QStringLiteral("perFileCap"))
                                       .toInt(settings.pipeline.perFileCap);
    settings.pipeline.precheckEnabled = pipeline.value(QStringLiteral("precheckEnabled"))
                                            .toBool(settings.pipeline.precheckEnabled);
    settings.pipeline.precheckMinOverlap = pipeline.value(QStringLiteral("precheckMinOverlap"))
                                               .toDouble(settings.pipeline.precheckMinOverlap);
    settings.pipeline.enforceSpan = pipeline.value(QStringLiteral("enforceSpan"))
                                        .toBool(settings.pipeline.enforceSpan);

    const QJsonObject limits = json.value(QStringLiteral("limits")).toObject();
    settings.defaultLimits = limitsFromJson(
        limits.value(QStringLiteral("default")).toObject(), settings.defaultLimits);
    for (auto it = limits.begin(); it != limits.end(); ++it) {
        if (it.key() == QLatin1String("default") || !it.value().isObject()) {
            continue;
        }
        settings.tagLimits[canonicalTagLabel(it.key())] =
            limitsFromJson(it.value().toObject(), settings.defaultLimits);
    }

    return settings;
}

} // namespace qr
