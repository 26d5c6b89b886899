#pragma once

#include "core/index/chunk_store.h"

#include <QString>
#include <QStringList>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include <sqlite3.h>

namespace qr {

struct ChunkInput {
    int chunkIndex = 0;
    QString content;
    std::optional<QString> text;
    std::optional<QString> bm25Text;
    std::optional<QString> embeddingText;
    QString shortText;
    std::vector<float> embedding;
};

struct StoreFilters {
    int minChunkChars = 20;
    QString excludedPathPrefix = QStringLiteral("600_");
};

// SqliteChunkStore -- reference chunk store over SQLite + FTS5.
//
// The owning connection is used for ingestion only. Every query() opens its
// own read-only connection, so concurrent channel queries never share a
// handle. A progress handler interrupts statements past the request deadline.
class SqliteChunkStore : public ChunkStore {
public:
    ~SqliteChunkStore() override;

    SqliteChunkStore(const SqliteChunkStore&) = delete;
    SqliteChunkStore& operator=(const SqliteChunkStore&) = delete;

    // Open or create the database at dbPath. Returns nullptr on failure.
    static std::unique_ptr<SqliteChunkStore> open(const QString& dbPath,
                                                  StoreFilters filters = {});

    // Insert or replace a document with its chunks. Chunks and their FTS5
    // rows are written in one savepoint. Returns the document id.
    std::optional<int64_t> addDocument(const QString& filePath,
                                       const QString& title,
                                       const std::vector<ChunkInput>& chunks);

    bool deleteDocument(const QString& filePath);

    int chunkCount() const;

    ChannelQueryResult query(const ChannelRequest& request) override;
    ChannelQueryResult fetchDocumentChunks(const QString& slug, int limit) override;

    // FTS5 expression for a free-text query: up to 16 distinct terms of two
    // or more characters, each quoted, OR-joined.
    static QString buildFtsExpression(const QString& text);

    const QString& dbPath() const { return m_dbPath; }

private:
    SqliteChunkStore(QString dbPath, StoreFilters filters);
    bool init();
    bool execSql(const char* sql);

    static QStringList ftsTerms(const QString& text);

    ChannelQueryResult queryFts(sqlite3* db, const ChannelRequest& request);
    ChannelQueryResult queryVector(sqlite3* db, const ChannelRequest& request);

    QString m_dbPath;
    StoreFilters m_filters;
    sqlite3* m_db = nullptr;
};

} // namespace qr
