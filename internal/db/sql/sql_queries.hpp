#pragma once

namespace flowstore::db::sql {

/*
  Canonical SQL for the chunk store.

  "method" is a plain column filled by the store on every payload write;
  it replaces a generated column so the value is computed in one place.
*/

// chunk

static constexpr const char* INSERT_CHUNK =
    "INSERT INTO chunk(mid,kind,seq,data,method)"
    " VALUES(?,?,?,?,?);";

static constexpr const char* SELECT_CHUNK =
    "SELECT id,mid,kind,seq,data,method"
    " FROM chunk WHERE id=?;";

static constexpr const char* SELECT_CHUNK_BY_MID_KIND =
    "SELECT id,mid,kind,seq,data,method"
    " FROM chunk WHERE mid=? AND kind=? ORDER BY id ASC LIMIT 1;";

static constexpr const char* SELECT_CHUNKS_BY_MID =
    "SELECT id,mid,kind,seq,data,method"
    " FROM chunk WHERE mid=? ORDER BY id ASC;";

static constexpr const char* SELECT_CHUNKS_BY_KIND =
    "SELECT id,mid,kind,seq,data,method"
    " FROM chunk WHERE kind=? ORDER BY id ASC LIMIT ? OFFSET ?;";

static constexpr const char* UPDATE_CHUNK_PAYLOAD =
    "UPDATE chunk SET data=?,method=? WHERE id=?;";

static constexpr const char* DELETE_CHUNK =
    "DELETE FROM chunk WHERE id=?;";

static constexpr const char* DELETE_CHUNKS_BY_MID =
    "DELETE FROM chunk WHERE mid=?;";

static constexpr const char* COUNT_CHUNKS =
    "SELECT COUNT(*) FROM chunk;";

// sequencing

static constexpr const char* SELECT_LAST_SEQ =
    "SELECT MAX(COALESCE((SELECT last_seq FROM chunk_seq WHERE mid=?1),0),"
    " COALESCE((SELECT MAX(seq) FROM chunk WHERE mid=?1),0));";

static constexpr const char* UPSERT_SEQ =
    "INSERT INTO chunk_seq(mid,last_seq) VALUES(?1,?2)"
    " ON CONFLICT(mid) DO UPDATE SET last_seq=excluded.last_seq"
    " WHERE excluded.last_seq > chunk_seq.last_seq;";

// derived lookups

// matches idx_method so the lookup never scans the table
static constexpr const char* SELECT_FLOW_IDS_BY_METHOD =
    "SELECT id FROM chunk"
    " WHERE kind='http_flow' AND UPPER(method)=UPPER(?) ORDER BY id ASC;";

// headers

static constexpr const char* DELETE_HEADERS =
    "DELETE FROM header WHERE chunk_id=?;";

static constexpr const char* INSERT_HEADER =
    "INSERT INTO header(chunk_id,mid,direction,position,k,v,kvstr)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* SELECT_HEADERS =
    "SELECT chunk_id,mid,direction,position,k,v,kvstr FROM header";

}
