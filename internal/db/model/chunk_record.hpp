#pragma once

#include <cstdint>
#include <string>

namespace flowstore::db::model {

/*
  Persistent chunk row.

  IMPORTANT:
  - id is assigned by the repository on insert and never reused.
  - seq is assigned by the sequencer in the same transaction as the insert.
  - method is derived from (kind, payload) by the store; callers never set it.
*/

struct ChunkRecord {
  uint64_t id = 0;

  std::string mid;
  std::string kind;

  // Per-mid sequence number, starts at 1
  uint64_t seq = 0;

  // opaque serialized payload (JSON for http_flow, raw bytes for content)
  std::string payload;

  std::string method;
};

}
