#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace flowstore::projection {

/*
  One row of the flow table: display fields of an http_flow chunk.

  Absent values (no response yet, malformed payload) are nullopt.
*/
struct FlowRow {
  uint64_t    chunk_id = 0;
  std::string mid;

  std::optional<double>      created_at;
  std::optional<std::string> method;
  std::optional<std::string> host;
  std::optional<std::string> path;
  std::optional<int64_t>     status_code;
  std::optional<std::string> content_type;
  std::optional<double>      duration;
  // bytes over request_content and response_content chunks; nullopt when
  // the mid has none
  std::optional<uint64_t> size;
};

} // namespace flowstore::projection
