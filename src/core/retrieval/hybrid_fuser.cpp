#include "core/retrieval/hybrid_fuser.h"
#include "core/reader/text_analysis.h"
#include "core/shared/logging.h"

#include <QFileInfo>
#include <QHash>
#include <QRegularExpression>

#include <algorithm>
#include <chrono>
#include <future>

namespace qr {

namespace {

using Clock = std::chrono::steady_clock;

struct ChannelTask {
    Channel channel;
    std::future<ChannelQueryResult> result;
};

RetrievalOutcome failedOutcome(RetrievalOutcome::Status status, const QString& message)
{
    RetrievalOutcome outcome;
    outcome.status = status;
    outcome.errorMessage = message;
    return outcome;
}

RetrievalOutcome::Status outcomeStatusFor(ChannelQueryResult::Status status)
{
    switch (status) {
    case ChannelQueryResult::Status::Ok:          return RetrievalOutcome::Status::Ok;
    case ChannelQueryResult::Status::Unavailable: return RetrievalOutcome::Status::StoreUnavailable;
    case ChannelQueryResult::Status::Timeout:     return RetrievalOutcome::Status::Timeout;
    case ChannelQueryResult::Status::QueryFailed: return RetrievalOutcome::Status::StoreFailed;
    }
    return RetrievalOutcome::Status::StoreFailed;
}

double& componentFor(ComponentScores& scores, Channel channel)
{
    switch (channel) {
    case Channel::Path:    return scores.path;
    case Channel::Short:   return scores.shortText;
    case Channel::Title:   return scores.title;
    case Channel::Lexical: return scores.bm25;
    case Channel::Vector:  return scores.vector;
    }
    return scores.bm25;
}

double weightFor(const FusionWeights& weights, Channel channel)
{
    switch (channel) {
    case Channel::Path:    return weights.path;
    case Channel::Short:   return weights.shortText;
    case Channel::Title:   return weights.title;
    case Channel::Lexical: return weights.bm25;
    case Channel::Vector:  return weights.vector;
    }
    return 0.0;
}

Candidate candidateFromRow(const ChunkRow& row)
{
    Candidate candidate;
    candidate.filePath = row.filePath;
    candidate.fileName = row.fileName;
    candidate.chunkId = row.chunkId;
    candidate.text = row.text;
    candidate.bm25Text = row.bm25Text;
    candidate.embeddingText = row.embeddingText;
    candidate.content = row.content;
    return candidate;
}

} // namespace

QString retrievalStatusToString(RetrievalOutcome::Status status)
{
    switch (status) {
    case RetrievalOutcome::Status::Ok:               return QStringLiteral("ok");
    case RetrievalOutcome::Status::InvalidInput:     return QStringLiteral("invalid_input");
    case RetrievalOutcome::Status::StoreUnavailable: return QStringLiteral("store_unavailable");
    case RetrievalOutcome::Status::Timeout:          return QStringLiteral("timeout");
    case RetrievalOutcome::Status::StoreFailed:      return QStringLiteral("store_failed");
    }
    return QStringLiteral("unknown");
}

HybridFuser::HybridFuser(std::shared_ptr<ChunkStore> store,
                         FusionWeights weights,
                         RetrievalConfig config)
    : m_store(std::move(store))
    , m_weights(weights)
    , m_config(config)
    , m_pool(std::make_unique<ChannelWorkerPool>(config.workerThreads))
{
}

FusionWeights HybridFuser::scaleFusionWeights(const FusionWeights& weights)
{
    double lambdaLex = std::max(0.0, weights.lambdaLex);
    double lambdaSem = std::max(0.0, weights.lambdaSem);
    const double totalLambda = lambdaLex + lambdaSem;
    if (totalLambda <= 0.0) {
        lambdaLex = 0.5;
        lambdaSem = 0.5;
    } else {
        lambdaLex /= totalLambda;
        lambdaSem /= totalLambda;
    }

    FusionWeights scaled = weights;
    scaled.lambdaLex = lambdaLex;
    scaled.lambdaSem = lambdaSem;

    double* lexical[] = {&scaled.path, &scaled.shortText, &scaled.title, &scaled.bm25};
    double lexSum = 0.0;
    for (double* w : lexical) {
        *w = std::max(0.0, *w);
        lexSum += *w;
    }
    if (lexSum <= 0.0) {
        for (double* w : lexical) {
            *w = lambdaLex / 4.0;
        }
    } else {
        const double factor = lambdaLex / lexSum;
        for (double* w : lexical) {
            *w *= factor;
        }
    }

    // Single semantic channel, so its weight is always lambdaSem.
    scaled.vector = lambdaSem;
    return scaled;
}

double HybridFuser::documentPrior(const QString& fileName, const QString& text)
{
    static const QRegularExpression codeExtension(
        QStringLiteral(R"(\.(sql|sh|bash|zsh|py|ipynb|yaml|yml|toml|ini|env)$|(^|/)dockerfile$)"),
        QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression diaryName(
        QStringLiteral(R"(readme|notes|journal|diary|thoughts)"),
        QRegularExpression::CaseInsensitiveOption);

    double prior = 0.0;
    if (codeExtension.match(fileName).hasMatch()) {
        prior += 0.25;
    } else if (containsCodeFence(text)) {
        prior += 0.15;
    } else if (containsSchemaDefinition(text)) {
        prior += 0.20;
    }
    if (diaryName.match(fileName).hasMatch()) {
        prior -= 0.20;
    }
    return std::clamp(1.0 + prior / 10.0, 0.95, 1.05);
}

RetrievalOutcome HybridFuser::retrieve(const ChannelQuerySet& channels,
                                       Tag tag,
                                       int shortlistSize,
                                       bool retainComponents) const
{
    if (channels.isEmpty()) {
        LOG_WARN(qrRetrieval, "Retrieval rejected: empty channel set");
        return failedOutcome(RetrievalOutcome::Status::InvalidInput,
                             QStringLiteral("empty channel query set"));
    }
    if (shortlistSize < 0) {
        LOG_WARN(qrRetrieval, "Retrieval rejected: negative shortlist size %d", shortlistSize);
        return failedOutcome(RetrievalOutcome::Status::InvalidInput,
                             QStringLiteral("negative shortlist size"));
    }
    if (!m_store) {
        return failedOutcome(RetrievalOutcome::Status::StoreUnavailable,
                             QStringLiteral("no chunk store configured"));
    }

    RetrievalOutcome outcome;
    if (shortlistSize == 0) {
        return outcome;
    }

    const auto deadline = Clock::now() + std::chrono::milliseconds(std::max(0, m_config.timeoutMs));

    std::vector<ChannelRequest> requests;
    auto addTextRequest = [&](Channel channel, const QString& text) {
        if (text.trimmed().isEmpty()) {
            return;
        }
        ChannelRequest request;
        request.channel = channel;
        request.text = text;
        request.limit = shortlistSize;
        request.deadline = deadline;
        requests.push_back(std::move(request));
    };
    addTextRequest(Channel::Path, channels.shortQuery);
    addTextRequest(Channel::Short, channels.shortQuery);
    addTextRequest(Channel::Title, channels.titleQuery);
    addTextRequest(Channel::Lexical, channels.lexicalQuery);
    if (channels.hasVector()) {
        ChannelRequest request;
        request.channel = Channel::Vector;
        request.vector = channels.vector;
        request.limit = shortlistSize;
        request.deadline = deadline;
        requests.push_back(std::move(request));
    }

    std::vector<ChannelTask> tasks;
    tasks.reserve(requests.size());
    for (ChannelRequest& request : requests) {
        const Channel channel = request.channel;
        std::optional<std::future<ChannelQueryResult>> future = m_pool->submit(m_store, std::move(request));
        if (!future) {
            return failedOutcome(RetrievalOutcome::Status::Timeout,
                                 QStringLiteral("%1 channel rejected: worker queue full")
                                     .arg(channelToString(channel)));
        }
        tasks.push_back({channel, std::move(*future)});
    }

    std::vector<std::pair<Channel, ChannelQueryResult>> results;
    results.reserve(tasks.size());
    for (ChannelTask& task : tasks) {
        if (task.result.wait_until(deadline) != std::future_status::ready) {
            LOG_WARN(qrRetrieval, "Channel %s missed the %d ms deadline",
                     qUtf8Printable(channelToString(task.channel)), m_config.timeoutMs);
            return failedOutcome(RetrievalOutcome::Status::Timeout,
                                 QStringLiteral("%1 channel timed out")
                                     .arg(channelToString(task.channel)));
        }
        ChannelQueryResult result = task.result.get();
        if (!result.ok()) {
            const QString message = result.errorMessage.value_or(
                QStringLiteral("%1 channel failed").arg(channelToString(task.channel)));
            LOG_WARN(qrRetrieval, "Channel %s failed: %s",
                     qUtf8Printable(channelToString(task.channel)), qUtf8Printable(message));
            return failedOutcome(outcomeStatusFor(result.status), message);
        }
        results.emplace_back(task.channel, std::move(result));
    }

    const FusionWeights weights = scaleFusionWeights(m_weights);

    QHash<QString, size_t> indexByKey;
    std::vector<Candidate> merged;
    for (const auto& entry : results) {
        const Channel channel = entry.first;
        const std::vector<ChunkRow>& rows = entry.second.rows;

        double maxScore = 0.0;
        for (const ChunkRow& row : rows) {
            maxScore = std::max(maxScore, row.score);
        }

        for (const ChunkRow& row : rows) {
            Candidate incoming = candidateFromRow(row);
            const QString key = candidateKey(incoming);
            auto it = indexByKey.find(key);
            if (it == indexByKey.end()) {
                it = indexByKey.insert(key, merged.size());
                merged.push_back(std::move(incoming));
            }
            const double normalized = maxScore > 0.0 ? std::max(0.0, row.score) / maxScore : 0.0;
            double& component = componentFor(merged[it.value()].scores, channel);
            component = std::max(component, normalized);
        }
    }

    for (Candidate& candidate : merged) {
        ComponentScores& s = candidate.scores;
        double sum = 0.0;
        for (Channel channel : {Channel::Path, Channel::Short, Channel::Title,
                                Channel::Lexical, Channel::Vector}) {
            sum += weightFor(weights, channel) * componentFor(s, channel);
        }
        const QString name = candidate.fileName.isEmpty() ? candidate.filePath : candidate.fileName;
        s.prior = documentPrior(name, resolveCandidateText(candidate));
        s.fused = sum * s.prior;
    }

    std::stable_sort(merged.begin(), merged.end(), [](const Candidate& lhs, const Candidate& rhs) {
        if (lhs.scores.fused != rhs.scores.fused) {
            return lhs.scores.fused > rhs.scores.fused;
        }
        if (lhs.scores.bm25 != rhs.scores.bm25) {
            return lhs.scores.bm25 > rhs.scores.bm25;
        }
        if (lhs.filePath != rhs.filePath) {
            return lhs.filePath < rhs.filePath;
        }
        return lhs.chunkId < rhs.chunkId;
    });

    if (static_cast<int>(merged.size()) > shortlistSize) {
        merged.resize(static_cast<size_t>(shortlistSize));
    }

    if (!retainComponents) {
        for (Candidate& candidate : merged) {
            const double fused = candidate.scores.fused;
            const double prior = candidate.scores.prior;
            candidate.scores = ComponentScores{};
            candidate.scores.fused = fused;
            candidate.scores.prior = prior;
        }
    }

    LOG_DEBUG(qrRetrieval, "Fused %d channel(s) for tag %s -> %d candidate(s)",
              static_cast<int>(results.size()), qUtf8Printable(tagToString(tag)),
              static_cast<int>(merged.size()));

    outcome.candidates = std::move(merged);
    return outcome;
}

} // namespace qr
