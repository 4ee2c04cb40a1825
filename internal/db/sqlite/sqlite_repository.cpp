#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace flowstore::db::sqlite {

using flowstore::db::ErrorCode;
using flowstore::db::Result;

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Statement PrepareOrNull(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
        sqlite3_finalize(st);
        st = nullptr;
    }
    return Statement(st, &sqlite3_finalize);
}

// Reads have no Result channel; a failing read is a storage fault.
[[noreturn]] void FailRead(sqlite3* db, const std::string& what) {
    throw util::StorageError(what + ": " + sqlite3_errmsg(db));
}

Statement PrepareRead(sqlite3* db, const std::string& sql, const char* what) {
    auto st = PrepareOrNull(db, sql);
    if (!st) FailRead(db, what);
    return st;
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* p = sqlite3_column_blob(st, col);
    const int   n = sqlite3_column_bytes(st, col);
    return p ? std::string(static_cast<const char*>(p), static_cast<std::size_t>(n)) : std::string();
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

// columns: id,mid,kind,seq,data,method
model::ChunkRecord ReadChunk(sqlite3_stmt* st) {
    model::ChunkRecord r;
    r.id = ColU64(st, 0);
    r.mid = ColText(st, 1);
    r.kind = ColText(st, 2);
    r.seq = ColU64(st, 3);
    r.payload = ColBlob(st, 4);
    r.method = ColText(st, 5);
    return r;
}

std::vector<model::ChunkRecord> ReadChunks(sqlite3* db, sqlite3_stmt* st) {
    std::vector<model::ChunkRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadChunk(st));
    }
    if (rc != SQLITE_DONE) FailRead(db, "read chunks");
    return out;
}

std::string EscapeLike(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '%' || c == '_' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db, std::shared_ptr<SqliteReaderPool> readers)
    : db_(std::move(db)), readers_(std::move(readers)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(TxMode mode) {
    if (mode == TxMode::kRead && readers_) {
        return std::make_unique<SqliteTransaction>(readers_->Acquire(), mode);
    }
    return std::make_unique<SqliteTransaction>(db_, mode);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Sequencing
// ------------------------------------------------------------------

uint64_t SqliteRepository::LastSeq(Transaction& t, const std::string& mid) {
    auto* db = TX(t).Handle();

    auto st = PrepareRead(db, sql::SELECT_LAST_SEQ, "last seq");
    BindText(st.get(), 1, mid);

    if (sqlite3_step(st.get()) != SQLITE_ROW) FailRead(db, "last seq");
    return ColU64(st.get(), 0);
}

Result SqliteRepository::RecordSeq(Transaction& t, const std::string& mid, uint64_t seq) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrNull(db, sql::UPSERT_SEQ);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, mid);
    BindU64(st.get(), 2, seq);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    // the upsert's WHERE suppressed the update: seq is not above the mark
    if (sqlite3_changes(db) == 0) {
        return Result::Err(ErrorCode::Conflict, "seq " + std::to_string(seq) + " for mid " + mid + " is not above the high-water mark");
    }
    return Result::Ok();
}

// ------------------------------------------------------------------
// Chunks
// ------------------------------------------------------------------

Result SqliteRepository::InsertChunk(Transaction& t, model::ChunkRecord& r) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrNull(db, sql::INSERT_CHUNK);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.mid);
    BindText(st.get(), 2, r.kind);
    BindU64(st.get(), 3, r.seq);
    BindBlob(st.get(), 4, r.payload);
    BindText(st.get(), 5, r.method);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::optional<model::ChunkRecord>
SqliteRepository::GetChunk(Transaction& t, uint64_t id) {
    auto* db = TX(t).Handle();

    auto st = PrepareRead(db, sql::SELECT_CHUNK, "get chunk");
    BindU64(st.get(), 1, id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) FailRead(db, "get chunk");
    return ReadChunk(st.get());
}

std::optional<model::ChunkRecord>
SqliteRepository::FindChunk(Transaction& t, const std::string& mid, const std::string& kind) {
    auto* db = TX(t).Handle();

    auto st = PrepareRead(db, sql::SELECT_CHUNK_BY_MID_KIND, "find chunk");
    BindText(st.get(), 1, mid);
    BindText(st.get(), 2, kind);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) FailRead(db, "find chunk");
    return ReadChunk(st.get());
}

std::vector<model::ChunkRecord>
SqliteRepository::ListChunksByMid(Transaction& t, const std::string& mid) {
    auto* db = TX(t).Handle();

    auto st = PrepareRead(db, sql::SELECT_CHUNKS_BY_MID, "list chunks by mid");
    BindText(st.get(), 1, mid);
    return ReadChunks(db, st.get());
}

std::vector<model::ChunkRecord>
SqliteRepository::ListChunksByKind(Transaction& t, const std::string& kind, const Page& page) {
    auto* db = TX(t).Handle();

    auto st = PrepareRead(db, sql::SELECT_CHUNKS_BY_KIND, "list chunks by kind");
    BindText(st.get(), 1, kind);
    // LIMIT -1 is unlimited in sqlite
    BindI64(st.get(), 2, page.limit == 0 ? -1 : static_cast<int64_t>(page.limit));
    BindU64(st.get(), 3, page.offset);
    return ReadChunks(db, st.get());
}

Result SqliteRepository::UpdateChunkPayload(Transaction& t, uint64_t id, const std::string& payload, const std::string& method) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrNull(db, sql::UPDATE_CHUNK_PAYLOAD);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindBlob(st.get(), 1, payload);
    BindText(st.get(), 2, method);
    BindU64(st.get(), 3, id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "chunk " + std::to_string(id));
    return Result::Ok();
}

Result SqliteRepository::DeleteChunk(Transaction& t, uint64_t id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrNull(db, sql::DELETE_CHUNK);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st.get(), 1, id);
    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "chunk " + std::to_string(id));
    return Result::Ok();
}

Result SqliteRepository::DeleteChunksByMid(Transaction& t, const std::string& mid, uint64_t* deleted) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrNull(db, sql::DELETE_CHUNKS_BY_MID);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, mid);
    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (deleted) *deleted = static_cast<uint64_t>(sqlite3_changes(db));
    return Result::Ok();
}

uint64_t SqliteRepository::CountChunks(Transaction& t) {
    auto* db = TX(t).Handle();

    auto st = PrepareRead(db, sql::COUNT_CHUNKS, "count chunks");
    if (sqlite3_step(st.get()) != SQLITE_ROW) FailRead(db, "count chunks");
    return ColU64(st.get(), 0);
}

// ------------------------------------------------------------------
// Derived lookups
// ------------------------------------------------------------------

std::vector<uint64_t> SqliteRepository::FindFlowIdsByMethod(Transaction& t, const std::string& method) {
    auto* db = TX(t).Handle();

    auto st = PrepareRead(db, sql::SELECT_FLOW_IDS_BY_METHOD, "find flows by method");
    BindText(st.get(), 1, method);

    std::vector<uint64_t> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ColU64(st.get(), 0));
    }
    if (rc != SQLITE_DONE) FailRead(db, "find flows by method");
    return out;
}

std::unordered_map<std::string, ContentSize>
SqliteRepository::ContentSizes(Transaction& t, const std::vector<std::string>& kinds) {
    std::unordered_map<std::string, ContentSize> out;
    if (kinds.empty()) return out;

    auto* db = TX(t).Handle();

    std::string sql = "SELECT mid,COALESCE(SUM(length(data)),0),COUNT(*) FROM chunk WHERE kind IN (";
    for (std::size_t i = 0; i < kinds.size(); ++i) {
        sql += i ? ",?" : "?";
    }
    sql += ") GROUP BY mid;";

    auto st = PrepareRead(db, sql, "content sizes");
    for (std::size_t i = 0; i < kinds.size(); ++i) {
        BindText(st.get(), static_cast<int>(i + 1), kinds[i]);
    }

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out[ColText(st.get(), 0)] = ContentSize{.bytes = ColU64(st.get(), 1), .chunks = ColU64(st.get(), 2)};
    }
    if (rc != SQLITE_DONE) FailRead(db, "content sizes");
    return out;
}

// ------------------------------------------------------------------
// Materialized headers
// ------------------------------------------------------------------

Result SqliteRepository::ReplaceHeaders(Transaction& t, uint64_t chunk_id, const std::vector<model::HeaderRecord>& rows) {
    auto* db = TX(t).Handle();

    // a failed replace leaves the previous rows in place
    int rc = sqlite3_exec(db, "SAVEPOINT replace_headers;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) return Translate(db, rc);

    auto result = WriteHeaders(db, chunk_id, rows);
    if (!result) {
        sqlite3_exec(db, "ROLLBACK TO replace_headers;", nullptr, nullptr, nullptr);
    }
    rc = sqlite3_exec(db, "RELEASE replace_headers;", nullptr, nullptr, nullptr);
    if (result && rc != SQLITE_OK) return Translate(db, rc);
    return result;
}

Result SqliteRepository::WriteHeaders(sqlite3* db, uint64_t chunk_id, const std::vector<model::HeaderRecord>& rows) {
    auto del = PrepareOrNull(db, sql::DELETE_HEADERS);
    if (!del) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindU64(del.get(), 1, chunk_id);
    int rc = sqlite3_step(del.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (rows.empty()) return Result::Ok();

    auto ins = PrepareOrNull(db, sql::INSERT_HEADER);
    if (!ins) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (const auto& h : rows) {
        sqlite3_reset(ins.get());
        sqlite3_clear_bindings(ins.get());

        BindU64(ins.get(), 1, chunk_id);
        BindText(ins.get(), 2, h.mid);
        sqlite3_bind_int(ins.get(), 3, static_cast<int>(h.direction));
        BindU64(ins.get(), 4, h.position);
        BindText(ins.get(), 5, h.key);
        BindText(ins.get(), 6, h.value);
        BindText(ins.get(), 7, h.kv);

        rc = sqlite3_step(ins.get());
        if (rc != SQLITE_DONE) return Translate(db, rc);
    }
    return Result::Ok();
}

std::vector<model::HeaderRecord> SqliteRepository::ListHeaders(Transaction& t, const HeaderQuery& query) {
    auto* db = TX(t).Handle();

    std::string sql = sql::SELECT_HEADERS;
    std::string where;
    auto add = [&where](const char* clause) {
        where += where.empty() ? " WHERE " : " AND ";
        where += clause;
    };
    if (query.mid) add("mid=?");
    if (query.direction) add("direction=?");
    if (query.kv_contains) add("kvstr LIKE ? ESCAPE '\\'");
    if (query.kv_regex) add("search(?, kvstr)");
    sql += where + " ORDER BY chunk_id ASC, direction ASC, position ASC;";

    auto st = PrepareRead(db, sql, "list headers");

    int bind_idx = 1;
    if (query.mid) BindText(st.get(), bind_idx++, *query.mid);
    if (query.direction) sqlite3_bind_int(st.get(), bind_idx++, static_cast<int>(*query.direction));
    if (query.kv_contains) BindText(st.get(), bind_idx++, "%" + EscapeLike(*query.kv_contains) + "%");
    if (query.kv_regex) BindText(st.get(), bind_idx++, *query.kv_regex);

    std::vector<model::HeaderRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        model::HeaderRecord h;
        h.chunk_id = ColU64(st.get(), 0);
        h.mid = ColText(st.get(), 1);
        h.direction = static_cast<model::HeaderDirection>(ColI32(st.get(), 2));
        h.position = static_cast<uint32_t>(ColU64(st.get(), 3));
        h.key = ColText(st.get(), 4);
        h.value = ColText(st.get(), 5);
        h.kv = ColText(st.get(), 6);
        out.push_back(std::move(h));
    }
    if (rc != SQLITE_DONE) FailRead(db, "list headers");
    return out;
}

}
