#pragma once

namespace qr {

// Per-connection pragmas -- no write lock required, safe on every open.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 30000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
PRAGMA cache_size = -32768;
)";

// Database-level pragmas -- run once when creating the DB.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x515259;
PRAGMA user_version = 1;
)";

constexpr int kCurrentSchemaVersion = 1;

constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS documents (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    file_path TEXT NOT NULL UNIQUE,
    file_name TEXT NOT NULL,
    title TEXT NOT NULL DEFAULT '',
    added_at REAL NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_documents_file_name ON documents(file_name);

CREATE TABLE IF NOT EXISTS chunks (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    document_id INTEGER NOT NULL REFERENCES documents(id) ON DELETE CASCADE,
    chunk_index INTEGER NOT NULL,
    content TEXT NOT NULL,
    text TEXT,
    bm25_text TEXT,
    embedding_text TEXT,
    short_text TEXT NOT NULL DEFAULT '',
    embedding BLOB,
    UNIQUE(document_id, chunk_index)
);

CREATE INDEX IF NOT EXISTS idx_chunks_document_id ON chunks(document_id);

CREATE VIRTUAL TABLE IF NOT EXISTS chunk_search USING fts5(
    file_path,
    title,
    short_text,
    content,
    tokenize = 'porter unicode61 remove_diacritics 2'
);
)";

} // namespace qr
