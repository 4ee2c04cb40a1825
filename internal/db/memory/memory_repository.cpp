#include "memory_repository.hpp"

#include <algorithm>
#include <cctype>
#include <functional>

#include <re2/re2.h>

#include "internal/util/errors.hpp"
#include "memory_tx.hpp"

namespace flowstore::db::memory {

namespace {

std::string Upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

// ASCII case-insensitive substring, same as LIKE '%needle%'
bool ContainsNoCase(const std::string& haystack, const std::string& needle) {
  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(), [](unsigned char a, unsigned char b) {
    return std::tolower(a) == std::tolower(b);
  });
  return it != haystack.end();
}

std::size_t MidShardOf(const std::string& mid, std::size_t shards) {
  return std::hash<std::string>{}(mid) % shards;
}

} // namespace

MemoryRepository::MemoryRepository(std::vector<std::string> multi_valued_kinds)
    : multi_valued_kinds_(multi_valued_kinds.begin(), multi_valued_kinds.end()), committed_(std::make_shared<const State>()) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin(TxMode mode) {
  return std::make_unique<MemoryTransaction>(*this, mode);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Snapshot nodes
// ------------------------------------------------------------------

template <typename T>
T& MemoryRepository::Own(std::shared_ptr<Node<T>>& node, uint64_t generation) {
  if (!node) {
    node             = std::make_shared<Node<T>>();
    node->generation = generation;
  } else if (node->generation != generation) {
    node = std::make_shared<Node<T>>(Node<T>{generation, node->value});
  }
  return node->value;
}

const MemoryRepository::ChunkSlot* MemoryRepository::FindSlot(const State& s, uint64_t id) {
  if (id == 0) return nullptr;
  const auto page = (id - 1) / kPageSize;
  if (page >= s.pages.size() || !s.pages[page]) return nullptr;
  const auto& slot = s.pages[page]->value[(id - 1) % kPageSize];
  return slot.chunk ? &slot : nullptr;
}

MemoryRepository::ChunkSlot* MemoryRepository::MutableSlot(State& s, uint64_t id) {
  if (!FindSlot(s, id)) return nullptr;
  const auto page = (id - 1) / kPageSize;
  return &Own(s.pages[page], s.generation)[(id - 1) % kPageSize];
}

const MemoryRepository::MidEntry* MemoryRepository::FindMid(const State& s, const std::string& mid) {
  const auto& shard = s.mids[MidShardOf(mid, kMidShards)];
  if (!shard) return nullptr;
  auto it = shard->value.find(mid);
  return it == shard->value.end() ? nullptr : &it->second;
}

MemoryRepository::MidEntry& MemoryRepository::MutableMid(State& s, const std::string& mid) {
  return Own(s.mids[MidShardOf(mid, kMidShards)], s.generation)[mid];
}

template <typename Fn>
void MemoryRepository::ForEachChunk(const State& s, Fn&& fn) {
  for (const auto& page : s.pages) {
    if (!page) continue;
    for (const auto& slot : page->value) {
      if (slot.chunk) fn(slot);
    }
  }
}

// ------------------------------------------------------------------
// Sequencing
// ------------------------------------------------------------------

uint64_t MemoryRepository::LastSeq(Transaction& t, const std::string& mid) {
  const auto& s     = TX(t).View();
  const auto* entry = FindMid(s, mid);
  if (!entry) return 0;

  uint64_t last = entry->seq_mark;
  for (auto id : entry->ids) {
    last = std::max(last, FindSlot(s, id)->chunk->seq);
  }
  return last;
}

Result MemoryRepository::RecordSeq(Transaction& t, const std::string& mid, uint64_t seq) {
  auto& s = TX(t).Mutable();
  if (const auto* entry = FindMid(s, mid); entry && seq <= entry->seq_mark) {
    return Result::Err(ErrorCode::Conflict, "seq " + std::to_string(seq) + " for mid " + mid + " is not above the high-water mark");
  }
  MutableMid(s, mid).seq_mark = seq;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Chunks
// ------------------------------------------------------------------

Result MemoryRepository::InsertChunk(Transaction& t, model::ChunkRecord& r) {
  auto& s = TX(t).Mutable();

  if (!multi_valued_kinds_.contains(r.kind)) {
    if (const auto* entry = FindMid(s, r.mid)) {
      for (auto id : entry->ids) {
        if (FindSlot(s, id)->chunk->kind == r.kind) {
          return Result::Err(ErrorCode::ConstraintViolation, "UNIQUE constraint failed: chunk.mid, chunk.kind");
        }
      }
    }
  }

  r.id            = s.next_id++;
  const auto page = (r.id - 1) / kPageSize;
  if (page >= s.pages.size()) s.pages.resize(page + 1);
  Own(s.pages[page], s.generation)[(r.id - 1) % kPageSize] = ChunkSlot{std::make_shared<const model::ChunkRecord>(r), nullptr};

  MutableMid(s, r.mid).ids.push_back(r.id);
  s.chunk_count++;
  return Result::Ok();
}

std::optional<model::ChunkRecord> MemoryRepository::GetChunk(Transaction& t, uint64_t id) {
  const auto* slot = FindSlot(TX(t).View(), id);
  if (!slot) return std::nullopt;
  return *slot->chunk;
}

std::optional<model::ChunkRecord> MemoryRepository::FindChunk(Transaction& t, const std::string& mid, const std::string& kind) {
  const auto& s     = TX(t).View();
  const auto* entry = FindMid(s, mid);
  if (!entry) return std::nullopt;
  for (auto id : entry->ids) {
    const auto& c = *FindSlot(s, id)->chunk;
    if (c.kind == kind) return c;
  }
  return std::nullopt;
}

std::vector<model::ChunkRecord> MemoryRepository::ListChunksByMid(Transaction& t, const std::string& mid) {
  const auto&                     s = TX(t).View();
  std::vector<model::ChunkRecord> out;
  if (const auto* entry = FindMid(s, mid)) {
    out.reserve(entry->ids.size());
    for (auto id : entry->ids) out.push_back(*FindSlot(s, id)->chunk);
  }
  return out;
}

std::vector<model::ChunkRecord> MemoryRepository::ListChunksByKind(Transaction& t, const std::string& kind, const Page& page) {
  std::vector<model::ChunkRecord> out;
  std::size_t                     skipped = 0;
  for (const auto& p : TX(t).View().pages) {
    if (!p) continue;
    for (const auto& slot : p->value) {
      if (!slot.chunk || slot.chunk->kind != kind) continue;
      if (skipped < page.offset) {
        ++skipped;
        continue;
      }
      if (page.limit != 0 && out.size() >= page.limit) return out;
      out.push_back(*slot.chunk);
    }
  }
  return out;
}

Result MemoryRepository::UpdateChunkPayload(Transaction& t, uint64_t id, const std::string& payload, const std::string& method) {
  auto* slot = MutableSlot(TX(t).Mutable(), id);
  if (!slot) return Result::Err(ErrorCode::NotFound, "chunk " + std::to_string(id));

  auto updated     = std::make_shared<model::ChunkRecord>();
  updated->id      = slot->chunk->id;
  updated->mid     = slot->chunk->mid;
  updated->kind    = slot->chunk->kind;
  updated->seq     = slot->chunk->seq;
  updated->payload = payload;
  updated->method  = method;
  slot->chunk      = std::move(updated);
  return Result::Ok();
}

Result MemoryRepository::DeleteChunk(Transaction& t, uint64_t id) {
  auto& s    = TX(t).Mutable();
  auto* slot = MutableSlot(s, id);
  if (!slot) return Result::Err(ErrorCode::NotFound, "chunk " + std::to_string(id));

  auto& ids = MutableMid(s, slot->chunk->mid).ids;
  ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
  *slot = ChunkSlot{};
  s.chunk_count--;
  return Result::Ok();
}

Result MemoryRepository::DeleteChunksByMid(Transaction& t, const std::string& mid, uint64_t* deleted) {
  auto&    s = TX(t).Mutable();
  uint64_t n = 0;
  if (FindMid(s, mid)) {
    auto& entry = MutableMid(s, mid);
    for (auto id : entry.ids) {
      *MutableSlot(s, id) = ChunkSlot{};
      ++n;
    }
    entry.ids.clear();
    s.chunk_count -= n;
  }
  if (deleted) *deleted = n;
  return Result::Ok();
}

uint64_t MemoryRepository::CountChunks(Transaction& t) {
  return TX(t).View().chunk_count;
}

// ------------------------------------------------------------------
// Derived lookups
// ------------------------------------------------------------------

std::vector<uint64_t> MemoryRepository::FindFlowIdsByMethod(Transaction& t, const std::string& method) {
  const auto            wanted = Upper(method);
  std::vector<uint64_t> out;
  ForEachChunk(TX(t).View(), [&](const ChunkSlot& slot) {
    const auto& c = *slot.chunk;
    if (c.kind == "http_flow" && Upper(c.method) == wanted) out.push_back(c.id);
  });
  return out;
}

std::unordered_map<std::string, ContentSize> MemoryRepository::ContentSizes(Transaction& t, const std::vector<std::string>& kinds) {
  std::unordered_map<std::string, ContentSize> out;
  ForEachChunk(TX(t).View(), [&](const ChunkSlot& slot) {
    const auto& c = *slot.chunk;
    if (std::find(kinds.begin(), kinds.end(), c.kind) == kinds.end()) return;
    auto& size = out[c.mid];
    size.bytes += c.payload.size();
    size.chunks++;
  });
  return out;
}

// ------------------------------------------------------------------
// Materialized headers
// ------------------------------------------------------------------

Result MemoryRepository::ReplaceHeaders(Transaction& t, uint64_t chunk_id, const std::vector<model::HeaderRecord>& rows) {
  auto& s = TX(t).Mutable();
  if (!FindSlot(s, chunk_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "FOREIGN KEY constraint failed: chunk " + std::to_string(chunk_id));
  }

  auto sorted = rows;
  for (auto& h : sorted) h.chunk_id = chunk_id;
  std::sort(sorted.begin(), sorted.end(), [](const model::HeaderRecord& a, const model::HeaderRecord& b) {
    if (a.direction != b.direction) return a.direction < b.direction;
    return a.position < b.position;
  });
  for (std::size_t i = 1; i < sorted.size(); ++i) {
    if (sorted[i].direction == sorted[i - 1].direction && sorted[i].position == sorted[i - 1].position) {
      return Result::Err(ErrorCode::ConstraintViolation, "UNIQUE constraint failed: header.chunk_id, header.direction, header.position");
    }
  }

  auto* slot    = MutableSlot(s, chunk_id);
  slot->headers = sorted.empty() ? nullptr : std::make_shared<const std::vector<model::HeaderRecord>>(std::move(sorted));
  return Result::Ok();
}

std::vector<model::HeaderRecord> MemoryRepository::ListHeaders(Transaction& t, const HeaderQuery& query) {
  std::unique_ptr<RE2> re;
  if (query.kv_regex) {
    re = std::make_unique<RE2>(*query.kv_regex, RE2::Quiet);
    if (!re->ok()) {
      throw util::InvalidArgument("invalid regex '" + *query.kv_regex + "': " + re->error());
    }
  }

  std::vector<model::HeaderRecord> out;
  auto                             collect = [&](const ChunkSlot& slot) {
    if (!slot.headers) return;
    for (const auto& h : *slot.headers) {
      if (query.direction && h.direction != *query.direction) continue;
      if (query.kv_contains && !ContainsNoCase(h.kv, *query.kv_contains)) continue;
      if (re && !RE2::PartialMatch(h.kv, *re)) continue;
      out.push_back(h);
    }
  };

  const auto& s = TX(t).View();
  if (query.mid) {
    if (const auto* entry = FindMid(s, *query.mid)) {
      for (auto id : entry->ids) collect(*FindSlot(s, id));
    }
  } else {
    ForEachChunk(s, collect);
  }
  return out;
}

} // namespace flowstore::db::memory
