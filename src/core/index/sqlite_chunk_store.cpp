#include "core/index/sqlite_chunk_store.h"
#include "core/index/schema.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QFileInfo>
#include <QRegularExpression>
#include <QSet>
#include <QStringList>

#include <algorithm>
#include <cmath>
#include <cstring>

namespace qr {

namespace {

using Clock = std::chrono::steady_clock;

// Read-only connection owned by a single query() call.
struct ReadConnection {
    sqlite3* db = nullptr;

    ReadConnection() = default;
    ReadConnection(const ReadConnection&) = delete;
    ReadConnection& operator=(const ReadConnection&) = delete;
    ~ReadConnection()
    {
        if (db) {
            sqlite3_close(db);
        }
    }
};

int deadlineProgressHandler(void* userData)
{
    const auto* deadline = static_cast<const Clock::time_point*>(userData);
    return Clock::now() > *deadline ? 1 : 0;
}

std::optional<QString> columnOptionalText(sqlite3_stmt* stmt, int column)
{
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    const char* value = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return value ? QString::fromUtf8(value) : QString();
}

QString columnText(sqlite3_stmt* stmt, int column)
{
    return columnOptionalText(stmt, column).value_or(QString());
}

// Columns 0..6 of every chunk SELECT below share this layout.
ChunkRow readChunkRow(sqlite3_stmt* stmt)
{
    ChunkRow row;
    row.filePath = columnText(stmt, 0);
    row.fileName = columnText(stmt, 1);
    row.chunkId = sqlite3_column_int(stmt, 2);
    row.text = columnOptionalText(stmt, 3);
    row.bm25Text = columnOptionalText(stmt, 4);
    row.embeddingText = columnOptionalText(stmt, 5);
    row.content = columnOptionalText(stmt, 6);
    return row;
}

const char* ftsColumnFor(Channel channel)
{
    switch (channel) {
    case Channel::Path:    return "file_path";
    case Channel::Short:   return "short_text";
    case Channel::Title:   return "title";
    case Channel::Lexical: return "content";
    case Channel::Vector:  break;
    }
    return "content";
}

double cosineSimilarity(const std::vector<float>& query, const float* stored, size_t dims)
{
    double dot = 0.0;
    double queryNorm = 0.0;
    double storedNorm = 0.0;
    for (size_t i = 0; i < dims; ++i) {
        dot += static_cast<double>(query[i]) * static_cast<double>(stored[i]);
        queryNorm += static_cast<double>(query[i]) * static_cast<double>(query[i]);
        storedNorm += static_cast<double>(stored[i]) * static_cast<double>(stored[i]);
    }
    if (queryNorm <= 0.0 || storedNorm <= 0.0) {
        return 0.0;
    }
    return dot / (std::sqrt(queryNorm) * std::sqrt(storedNorm));
}

void sortRows(std::vector<ChunkRow>& rows)
{
    std::stable_sort(rows.begin(), rows.end(), [](const ChunkRow& lhs, const ChunkRow& rhs) {
        if (lhs.score != rhs.score) {
            return lhs.score > rhs.score;
        }
        if (lhs.filePath != rhs.filePath) {
            return lhs.filePath < rhs.filePath;
        }
        return lhs.chunkId < rhs.chunkId;
    });
}

ChannelQueryResult failure(ChannelQueryResult::Status status, const QString& message)
{
    ChannelQueryResult result;
    result.status = status;
    result.errorMessage = message;
    return result;
}

} // namespace

QString channelToString(Channel channel)
{
    switch (channel) {
    case Channel::Path:    return QStringLiteral("path");
    case Channel::Short:   return QStringLiteral("short");
    case Channel::Title:   return QStringLiteral("title");
    case Channel::Lexical: return QStringLiteral("lexical");
    case Channel::Vector:  return QStringLiteral("vector");
    }
    return QStringLiteral("unknown");
}

SqliteChunkStore::SqliteChunkStore(QString dbPath, StoreFilters filters)
    : m_dbPath(std::move(dbPath))
    , m_filters(std::move(filters))
{
}

SqliteChunkStore::~SqliteChunkStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::unique_ptr<SqliteChunkStore> SqliteChunkStore::open(const QString& dbPath,
                                                         StoreFilters filters)
{
    std::unique_ptr<SqliteChunkStore> store(new SqliteChunkStore(dbPath, std::move(filters)));
    if (!store->init()) {
        return nullptr;
    }
    return store;
}

bool SqliteChunkStore::init()
{
    int rc = sqlite3_open(m_dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        LOG_ERROR(qrIndex, "Failed to open chunk store: %s", sqlite3_errmsg(m_db));
        return false;
    }

    sqlite3_busy_timeout(m_db, 30000);

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(qrIndex, "Failed to set connection pragmas");
        return false;
    }

    bool schemaExists = false;
    {
        sqlite3_stmt* stmt = nullptr;
        rc = sqlite3_prepare_v2(m_db,
            "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='chunks'",
            -1, &stmt, nullptr);
        if (rc == SQLITE_OK && sqlite3_step(stmt) == SQLITE_ROW) {
            schemaExists = (sqlite3_column_int(stmt, 0) > 0);
        }
        sqlite3_finalize(stmt);
    }

    if (!schemaExists) {
        if (!execSql(kDatabasePragmas)) {
            LOG_ERROR(qrIndex, "Failed to set database pragmas");
            return false;
        }
        if (!execSql(kSchemaV1)) {
            LOG_ERROR(qrIndex, "Failed to create chunk store schema");
            return false;
        }
    }

    LOG_INFO(qrIndex, "Chunk store opened: %s (schema v%d)",
             qUtf8Printable(m_dbPath), kCurrentSchemaVersion);
    return true;
}

bool SqliteChunkStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(qrIndex, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

// ── Ingestion ───────────────────────────────────────────────

std::optional<int64_t> SqliteChunkStore::addDocument(const QString& filePath,
                                                     const QString& title,
                                                     const std::vector<ChunkInput>& chunks)
{
    if (filePath.trimmed().isEmpty()) {
        LOG_WARN(qrIndex, "addDocument rejected: empty file path");
        return std::nullopt;
    }

    if (!execSql("SAVEPOINT add_document")) {
        return std::nullopt;
    }

    auto rollback = [this]() {
        execSql("ROLLBACK TO SAVEPOINT add_document");
        execSql("RELEASE SAVEPOINT add_document");
    };

    if (!deleteDocument(filePath)) {
        rollback();
        return std::nullopt;
    }

    const QFileInfo info(filePath);
    const QString fileName = info.fileName();
    const QString effectiveTitle = title.trimmed().isEmpty() ? info.completeBaseName() : title;

    const QByteArray pathUtf8 = filePath.toUtf8();
    const QByteArray nameUtf8 = fileName.toUtf8();
    const QByteArray titleUtf8 = effectiveTitle.toUtf8();

    int64_t documentId = 0;
    {
        const char* sql = R"(
            INSERT INTO documents (file_path, file_name, title, added_at)
            VALUES (?1, ?2, ?3, ?4)
        )";
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(qrIndex, "document insert prepare: %s", sqlite3_errmsg(m_db));
            rollback();
            return std::nullopt;
        }
        sqlite3_bind_text(stmt, 1, pathUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, nameUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 3, titleUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_double(stmt, 4, static_cast<double>(QDateTime::currentSecsSinceEpoch()));
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            LOG_ERROR(qrIndex, "document insert failed: %s", sqlite3_errmsg(m_db));
            rollback();
            return std::nullopt;
        }
        documentId = sqlite3_last_insert_rowid(m_db);
    }

    const char* chunkSql = R"(
        INSERT INTO chunks (document_id, chunk_index, content, text, bm25_text,
                            embedding_text, short_text, embedding)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)
    )";
    const char* ftsSql = R"(
        INSERT INTO chunk_search (rowid, file_path, title, short_text, content)
        VALUES (?1, ?2, ?3, ?4, ?5)
    )";

    auto bindOptional = [](sqlite3_stmt* stmt, int index, const std::optional<QByteArray>& value) {
        if (value.has_value()) {
            sqlite3_bind_text(stmt, index, value->constData(), -1, SQLITE_TRANSIENT);
        } else {
            sqlite3_bind_null(stmt, index);
        }
    };
    auto toUtf8 = [](const std::optional<QString>& value) -> std::optional<QByteArray> {
        if (!value.has_value()) {
            return std::nullopt;
        }
        return value->toUtf8();
    };

    for (const ChunkInput& chunk : chunks) {
        const QByteArray contentUtf8 = chunk.content.toUtf8();
        const QByteArray shortUtf8 = chunk.shortText.toUtf8();

        int64_t chunkRowId = 0;
        {
            sqlite3_stmt* stmt = nullptr;
            if (sqlite3_prepare_v2(m_db, chunkSql, -1, &stmt, nullptr) != SQLITE_OK) {
                LOG_ERROR(qrIndex, "chunk insert prepare: %s", sqlite3_errmsg(m_db));
                rollback();
                return std::nullopt;
            }
            sqlite3_bind_int64(stmt, 1, documentId);
            sqlite3_bind_int(stmt, 2, chunk.chunkIndex);
            sqlite3_bind_text(stmt, 3, contentUtf8.constData(), -1, SQLITE_STATIC);
            bindOptional(stmt, 4, toUtf8(chunk.text));
            bindOptional(stmt, 5, toUtf8(chunk.bm25Text));
            bindOptional(stmt, 6, toUtf8(chunk.embeddingText));
            sqlite3_bind_text(stmt, 7, shortUtf8.constData(), -1, SQLITE_STATIC);
            if (chunk.embedding.empty()) {
                sqlite3_bind_null(stmt, 8);
            } else {
                sqlite3_bind_blob(stmt, 8, chunk.embedding.data(),
                                  static_cast<int>(chunk.embedding.size() * sizeof(float)),
                                  SQLITE_STATIC);
            }
            const int rc = sqlite3_step(stmt);
            sqlite3_finalize(stmt);
            if (rc != SQLITE_DONE) {
                LOG_ERROR(qrIndex, "chunk insert failed: %s", sqlite3_errmsg(m_db));
                rollback();
                return std::nullopt;
            }
            chunkRowId = sqlite3_last_insert_rowid(m_db);
        }

        {
            sqlite3_stmt* stmt = nullptr;
            if (sqlite3_prepare_v2(m_db, ftsSql, -1, &stmt, nullptr) != SQLITE_OK) {
                LOG_ERROR(qrIndex, "FTS5 insert prepare: %s", sqlite3_errmsg(m_db));
                rollback();
                return std::nullopt;
            }
            sqlite3_bind_int64(stmt, 1, chunkRowId);
            sqlite3_bind_text(stmt, 2, pathUtf8.constData(), -1, SQLITE_STATIC);
            sqlite3_bind_text(stmt, 3, titleUtf8.constData(), -1, SQLITE_STATIC);
            sqlite3_bind_text(stmt, 4, shortUtf8.constData(), -1, SQLITE_STATIC);
            sqlite3_bind_text(stmt, 5, contentUtf8.constData(), -1, SQLITE_STATIC);
            const int rc = sqlite3_step(stmt);
            sqlite3_finalize(stmt);
            if (rc != SQLITE_DONE) {
                LOG_ERROR(qrIndex, "FTS5 insert failed: %s", sqlite3_errmsg(m_db));
                rollback();
                return std::nullopt;
            }
        }
    }

    if (!execSql("RELEASE SAVEPOINT add_document")) {
        return std::nullopt;
    }
    LOG_DEBUG(qrIndex, "Stored %s with %d chunk(s)",
              qUtf8Printable(filePath), static_cast<int>(chunks.size()));
    return documentId;
}

bool SqliteChunkStore::deleteDocument(const QString& filePath)
{
    const QByteArray pathUtf8 = filePath.toUtf8();

    // FTS rows first; virtual tables do not cascade.
    const char* ftsSql = R"(
        DELETE FROM chunk_search WHERE rowid IN (
            SELECT c.id FROM chunks c JOIN documents d ON d.id = c.document_id
            WHERE d.file_path = ?1)
    )";
    const char* docSql = "DELETE FROM documents WHERE file_path = ?1";

    for (const char* sql : {ftsSql, docSql}) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(qrIndex, "deleteDocument prepare: %s", sqlite3_errmsg(m_db));
            return false;
        }
        sqlite3_bind_text(stmt, 1, pathUtf8.constData(), -1, SQLITE_STATIC);
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            LOG_ERROR(qrIndex, "deleteDocument failed: %s", sqlite3_errmsg(m_db));
            return false;
        }
    }
    return true;
}

int SqliteChunkStore::chunkCount() const
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT count(*) FROM chunks", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

// ── Queries ─────────────────────────────────────────────────

QStringList SqliteChunkStore::ftsTerms(const QString& text)
{
    static const QRegularExpression termRegex(QStringLiteral(R"([A-Za-z0-9_]+)"));
    constexpr int kMaxTerms = 16;

    QStringList terms;
    QSet<QString> seen;
    auto matchIt = termRegex.globalMatch(text.toLower());
    while (matchIt.hasNext() && terms.size() < kMaxTerms) {
        const QString term = matchIt.next().captured(0);
        if (term.size() < 2 || seen.contains(term)) {
            continue;
        }
        seen.insert(term);
        terms.append(QLatin1Char('"') + term + QLatin1Char('"'));
    }
    return terms;
}

QString SqliteChunkStore::buildFtsExpression(const QString& text)
{
    return ftsTerms(text).join(QStringLiteral(" OR "));
}

ChannelQueryResult SqliteChunkStore::query(const ChannelRequest& request)
{
    if (Clock::now() > request.deadline) {
        return failure(ChannelQueryResult::Status::Timeout,
                       QStringLiteral("deadline passed before %1 query")
                           .arg(channelToString(request.channel)));
    }

    ReadConnection connection;
    const int rc = sqlite3_open_v2(m_dbPath.toUtf8().constData(), &connection.db,
                                   SQLITE_OPEN_READONLY | SQLITE_OPEN_NOMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        const QString message = QStringLiteral("cannot open %1: %2")
            .arg(m_dbPath, QString::fromUtf8(sqlite3_errstr(rc)));
        LOG_WARN(qrIndex, "%s", qUtf8Printable(message));
        return failure(ChannelQueryResult::Status::Unavailable, message);
    }
    sqlite3_busy_timeout(connection.db, 1000);

    Clock::time_point deadline = request.deadline;
    sqlite3_progress_handler(connection.db, 1000, &deadlineProgressHandler, &deadline);

    ChannelQueryResult result = request.channel == Channel::Vector
        ? queryVector(connection.db, request)
        : queryFts(connection.db, request);

    sqlite3_progress_handler(connection.db, 0, nullptr, nullptr);
    return result;
}

ChannelQueryResult SqliteChunkStore::queryFts(sqlite3* db, const ChannelRequest& request)
{
    ChannelQueryResult result;
    const QStringList terms = ftsTerms(request.text);
    if (terms.isEmpty() || request.limit <= 0) {
        return result;
    }

    // Per-term column filter: col : "a" OR col : "b"
    const QString column = QString::fromLatin1(ftsColumnFor(request.channel));
    QStringList filtered;
    filtered.reserve(terms.size());
    for (const QString& term : terms) {
        filtered.append(column + QStringLiteral(" : ") + term);
    }
    const QString match = filtered.join(QStringLiteral(" OR "));

    const char* sql = R"(
        SELECT d.file_path, d.file_name, c.chunk_index, c.text, c.bm25_text,
               c.embedding_text, c.content, -bm25(chunk_search) AS score
        FROM chunk_search
        JOIN chunks c ON c.id = chunk_search.rowid
        JOIN documents d ON d.id = c.document_id
        WHERE chunk_search MATCH ?1
          AND length(c.content) >= ?2
          AND (?3 = '' OR d.file_path NOT LIKE ?3 || '%')
        ORDER BY score DESC, d.file_path ASC, c.chunk_index ASC
        LIMIT ?4
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        const QString message = QString::fromUtf8(sqlite3_errmsg(db));
        LOG_ERROR(qrIndex, "FTS5 %s query prepare: %s",
                  qUtf8Printable(channelToString(request.channel)), qUtf8Printable(message));
        return failure(ChannelQueryResult::Status::QueryFailed, message);
    }

    const QByteArray matchUtf8 = match.toUtf8();
    const QByteArray prefixUtf8 = m_filters.excludedPathPrefix.toUtf8();
    sqlite3_bind_text(stmt, 1, matchUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 2, m_filters.minChunkChars);
    sqlite3_bind_text(stmt, 3, prefixUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 4, request.limit);

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        ChunkRow row = readChunkRow(stmt);
        row.score = sqlite3_column_double(stmt, 7);
        result.rows.push_back(std::move(row));
    }
    sqlite3_finalize(stmt);

    if (rc == SQLITE_INTERRUPT) {
        LOG_WARN(qrIndex, "FTS5 %s query interrupted at deadline",
                 qUtf8Printable(channelToString(request.channel)));
        return failure(ChannelQueryResult::Status::Timeout,
                       QStringLiteral("%1 query timed out").arg(channelToString(request.channel)));
    }
    if (rc != SQLITE_DONE) {
        const QString message = QString::fromUtf8(sqlite3_errmsg(db));
        LOG_ERROR(qrIndex, "FTS5 %s query failed: %s",
                  qUtf8Printable(channelToString(request.channel)), qUtf8Printable(message));
        return failure(ChannelQueryResult::Status::QueryFailed, message);
    }

    LOG_DEBUG(qrIndex, "FTS5 %s query '%s' -> %d row(s)",
              qUtf8Printable(channelToString(request.channel)),
              matchUtf8.constData(), static_cast<int>(result.rows.size()));
    return result;
}

ChannelQueryResult SqliteChunkStore::queryVector(sqlite3* db, const ChannelRequest& request)
{
    ChannelQueryResult result;
    if (request.vector.empty() || request.limit <= 0) {
        return result;
    }

    const char* sql = R"(
        SELECT d.file_path, d.file_name, c.chunk_index, c.text, c.bm25_text,
               c.embedding_text, c.content, c.embedding
        FROM chunks c
        JOIN documents d ON d.id = c.document_id
        WHERE c.embedding IS NOT NULL
          AND length(c.content) >= ?1
          AND (?2 = '' OR d.file_path NOT LIKE ?2 || '%')
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        const QString message = QString::fromUtf8(sqlite3_errmsg(db));
        LOG_ERROR(qrIndex, "vector query prepare: %s", qUtf8Printable(message));
        return failure(ChannelQueryResult::Status::QueryFailed, message);
    }

    const QByteArray prefixUtf8 = m_filters.excludedPathPrefix.toUtf8();
    sqlite3_bind_int(stmt, 1, m_filters.minChunkChars);
    sqlite3_bind_text(stmt, 2, prefixUtf8.constData(), -1, SQLITE_STATIC);

    const size_t dims = request.vector.size();
    std::vector<float> stored(dims);
    int scanned = 0;
    int rc = SQLITE_ROW;
    bool timedOut = false;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        if ((++scanned % 256) == 0 && Clock::now() > request.deadline) {
            timedOut = true;
            break;
        }

        const int blobBytes = sqlite3_column_bytes(stmt, 7);
        if (blobBytes != static_cast<int>(dims * sizeof(float))) {
            continue;
        }
        std::memcpy(stored.data(), sqlite3_column_blob(stmt, 7), dims * sizeof(float));

        const double similarity = cosineSimilarity(request.vector, stored.data(), dims);
        if (similarity <= 0.0) {
            continue;
        }
        ChunkRow row = readChunkRow(stmt);
        row.score = similarity;
        result.rows.push_back(std::move(row));
    }
    sqlite3_finalize(stmt);

    if (timedOut || rc == SQLITE_INTERRUPT) {
        LOG_WARN(qrIndex, "vector query interrupted at deadline after %d row(s)", scanned);
        return failure(ChannelQueryResult::Status::Timeout, QStringLiteral("vector query timed out"));
    }
    if (rc != SQLITE_DONE) {
        const QString message = QString::fromUtf8(sqlite3_errmsg(db));
        LOG_ERROR(qrIndex, "vector query failed: %s", qUtf8Printable(message));
        return failure(ChannelQueryResult::Status::QueryFailed, message);
    }

    sortRows(result.rows);
    if (static_cast<int>(result.rows.size()) > request.limit) {
        result.rows.resize(static_cast<size_t>(request.limit));
    }
    return result;
}

ChannelQueryResult SqliteChunkStore::fetchDocumentChunks(const QString& slug, int limit)
{
    ChannelQueryResult result;
    const QString normalizedSlug = slug.trimmed().toLower();
    if (normalizedSlug.isEmpty() || limit <= 0) {
        return result;
    }

    ReadConnection connection;
    const int rc = sqlite3_open_v2(m_dbPath.toUtf8().constData(), &connection.db,
                                   SQLITE_OPEN_READONLY | SQLITE_OPEN_NOMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        return failure(ChannelQueryResult::Status::Unavailable,
                       QStringLiteral("cannot open %1: %2")
                           .arg(m_dbPath, QString::fromUtf8(sqlite3_errstr(rc))));
    }

    const char* sql = R"(
        SELECT d.file_path, d.file_name, c.chunk_index, c.text, c.bm25_text,
               c.embedding_text, c.content
        FROM chunks c
        JOIN documents d ON d.id = c.document_id
        WHERE lower(d.file_name) = ?1
           OR lower(d.file_name) LIKE ?1 || '.%'
           OR lower(d.file_path) LIKE '%' || ?1 || '%'
        ORDER BY d.file_path ASC, c.chunk_index ASC
        LIMIT ?2
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(connection.db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return failure(ChannelQueryResult::Status::QueryFailed,
                       QString::fromUtf8(sqlite3_errmsg(connection.db)));
    }

    const QByteArray slugUtf8 = normalizedSlug.toUtf8();
    sqlite3_bind_text(stmt, 1, slugUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 2, limit);

    int stepRc = SQLITE_ROW;
    while ((stepRc = sqlite3_step(stmt)) == SQLITE_ROW) {
        ChunkRow row = readChunkRow(stmt);
        row.score = 100.0;
        result.rows.push_back(std::move(row));
    }
    sqlite3_finalize(stmt);

    if (stepRc != SQLITE_DONE) {
        return failure(ChannelQueryResult::Status::QueryFailed,
                       QString::fromUtf8(sqlite3_errmsg(connection.db)));
    }
    return result;
}

} // namespace qr
