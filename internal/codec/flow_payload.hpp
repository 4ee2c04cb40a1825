#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "internal/db/model/chunk_record.hpp"
#include "internal/db/model/header_record.hpp"

namespace flowstore::codec {

// [[name, value], ...] in wire order
using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
  std::optional<std::string> method;
  std::optional<std::string> host;
  std::optional<std::string> path;
  HeaderList                 headers;
  std::optional<double>      timestamp_start;
  std::optional<double>      timestamp_end;
};

struct HttpResponse {
  std::optional<int64_t> status_code;
  HeaderList             headers;
  std::optional<double>  timestamp_start;
  std::optional<double>  timestamp_end;
};

/*
  Typed view of an http_flow payload.

  Capture data may be incomplete: every field is optional and a field of
  the wrong JSON type decodes as absent. Only a payload that is not a JSON
  object is rejected.
*/
struct HttpFlowPayload {
  std::optional<double>       timestamp_created;
  std::optional<HttpRequest>  request;
  std::optional<HttpResponse> response;
  // "" when unmarked, otherwise the marker text
  std::string marked;
};

// request_content / response_content: raw body bytes
struct ContentPayload {
  std::string bytes;
};

// every other kind
struct OpaquePayload {
  std::string bytes;
};

using Payload = std::variant<HttpFlowPayload, ContentPayload, OpaquePayload>;

// Throws util::MalformedPayload when an http_flow payload is not a JSON object.
Payload DecodePayload(const std::string& kind, const std::string& bytes);

HttpFlowPayload DecodeHttpFlow(const std::string& bytes);

// Request method of an http_flow chunk, "" for other kinds and for
// payloads that do not decode. Never throws.
std::string DeriveMethod(const std::string& kind, const std::string& payload);

// First response header named content-type (case-insensitive), cut at the
// first ';'. No trimming.
std::optional<std::string> ContentType(const HttpFlowPayload& flow);

// response.timestamp_end - response.timestamp_start, when both are present
std::optional<double> Duration(const HttpFlowPayload& flow);

// Header rows of an http_flow chunk: request headers, then response
// headers, each numbered by list position. Throws util::MalformedPayload.
std::vector<db::model::HeaderRecord> HeaderRows(const db::model::ChunkRecord& chunk);

std::string HeaderComposite(const std::string& key, const std::string& value);

} // namespace flowstore::codec
