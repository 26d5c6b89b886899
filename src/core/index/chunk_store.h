#pragma once

#include <QString>

#include <chrono>
#include <optional>
#include <vector>

namespace qr {

// Retrieval channels served by a chunk store. Path and Short both take the
// short keyword query; Path matches file paths, Short the chunk's short text.
enum class Channel {
    Path,
    Short,
    Title,
    Lexical,
    Vector,
};

QString channelToString(Channel channel);

struct ChannelRequest {
    Channel channel = Channel::Lexical;
    QString text;
    std::vector<float> vector;
    int limit = 60;
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();
};

// One chunk row as returned by the store. score is the channel's raw
// relevance (higher is better).
struct ChunkRow {
    QString filePath;
    QString fileName;
    int chunkId = 0;
    std::optional<QString> text;
    std::optional<QString> bm25Text;
    std::optional<QString> embeddingText;
    std::optional<QString> content;
    double score = 0.0;
};

struct ChannelQueryResult {
    enum class Status {
        Ok,
        Unavailable,
        Timeout,
        QueryFailed,
    };

    Status status = Status::Ok;
    std::vector<ChunkRow> rows;
    std::optional<QString> errorMessage;

    bool ok() const { return status == Status::Ok; }
};

// ChunkStore -- read-only ranked-list provider consumed by the fuser.
//
// query() must be safe to call from several threads at once; the fuser
// issues one call per channel concurrently. Implementations must stop work
// and report Timeout once request.deadline has passed.
class ChunkStore {
public:
    virtual ~ChunkStore() = default;

    virtual ChannelQueryResult query(const ChannelRequest& request) = 0;

    // Chunks of the document whose file name stem or path matches slug,
    // in chunk order.
    virtual ChannelQueryResult fetchDocumentChunks(const QString& slug, int limit) = 0;
};

} // namespace qr
