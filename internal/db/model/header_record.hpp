#pragma once

#include <cstdint>
#include <string>

namespace flowstore::db::model {

enum class HeaderDirection : int {
  kRequest  = 0,
  kResponse = 1,
};

/*
  One header entry of an http_flow chunk.

  kv ("key=value") is computed once on write so that pattern searches
  scan a single column per header.
*/

struct HeaderRecord {
  uint64_t        chunk_id = 0;
  std::string     mid;
  HeaderDirection direction = HeaderDirection::kRequest;
  uint32_t        position  = 0;
  std::string     key;
  std::string     value;
  std::string     kv;
};

}
