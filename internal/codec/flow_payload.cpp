#include "internal/codec/flow_payload.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

#include "internal/codec/kinds.hpp"
#include "internal/util/errors.hpp"

namespace flowstore::codec {

using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

const Value* Field(const Struct& s, const char* name) {
  auto it = s.fields().find(name);
  if (it == s.fields().end()) return nullptr;
  return &it->second;
}

const Struct* ObjectField(const Struct& s, const char* name) {
  const Value* v = Field(s, name);
  if (!v || v->kind_case() != Value::kStructValue) return nullptr;
  return &v->struct_value();
}

std::optional<std::string> StringField(const Struct& s, const char* name) {
  const Value* v = Field(s, name);
  if (!v || v->kind_case() != Value::kStringValue) return std::nullopt;
  return v->string_value();
}

std::optional<double> NumberField(const Struct& s, const char* name) {
  const Value* v = Field(s, name);
  if (!v || v->kind_case() != Value::kNumberValue) return std::nullopt;
  return v->number_value();
}

// Numbers are truncated, numeric strings are accepted (SQL CAST AS INTEGER).
std::optional<int64_t> IntegerField(const Struct& s, const char* name) {
  const Value* v = Field(s, name);
  if (!v) return std::nullopt;
  if (v->kind_case() == Value::kNumberValue) {
    // [-2^63, 2^63); anything outside does not fit and is treated as absent
    const double d = v->number_value();
    if (!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0) return std::nullopt;
    return static_cast<int64_t>(d);
  }
  if (v->kind_case() == Value::kStringValue && !v->string_value().empty()) {
    const auto& str = v->string_value();
    char*       end = nullptr;
    errno           = 0;
    long long n     = std::strtoll(str.c_str(), &end, 10);
    if (errno == ERANGE) return std::nullopt;
    if (end && *end == '\0') return static_cast<int64_t>(n);
  }
  return std::nullopt;
}

// Entries that are not [string, string, ...] lists are skipped.
HeaderList Headers(const Struct& s) {
  HeaderList   out;
  const Value* v = Field(s, "headers");
  if (!v || v->kind_case() != Value::kListValue) return out;

  for (const auto& entry : v->list_value().values()) {
    if (entry.kind_case() != Value::kListValue) continue;
    const auto& pair = entry.list_value();
    if (pair.values_size() < 2) continue;
    if (pair.values(0).kind_case() != Value::kStringValue || pair.values(1).kind_case() != Value::kStringValue) continue;
    out.emplace_back(pair.values(0).string_value(), pair.values(1).string_value());
  }
  return out;
}

std::string Lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

void AppendRows(std::vector<db::model::HeaderRecord>& out, const db::model::ChunkRecord& chunk, db::model::HeaderDirection direction,
                const HeaderList& headers) {
  uint32_t position = 0;
  for (const auto& [key, value] : headers) {
    db::model::HeaderRecord h;
    h.chunk_id  = chunk.id;
    h.mid       = chunk.mid;
    h.direction = direction;
    h.position  = position++;
    h.key       = key;
    h.value     = value;
    h.kv        = HeaderComposite(key, value);
    out.push_back(std::move(h));
  }
}

} // namespace

HttpFlowPayload DecodeHttpFlow(const std::string& bytes) {
  Struct root;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(bytes, &root, options);
  if (!status.ok()) {
    throw util::MalformedPayload("http_flow payload is not a JSON object: " + std::string(status.message()));
  }

  HttpFlowPayload flow;
  flow.timestamp_created = NumberField(root, "timestamp_created");
  flow.marked            = StringField(root, "marked").value_or("");

  if (const Struct* req = ObjectField(root, "request")) {
    HttpRequest r;
    r.method          = StringField(*req, "method");
    r.host            = StringField(*req, "host");
    r.path            = StringField(*req, "path");
    r.headers         = Headers(*req);
    r.timestamp_start = NumberField(*req, "timestamp_start");
    r.timestamp_end   = NumberField(*req, "timestamp_end");
    flow.request      = std::move(r);
  }

  if (const Struct* resp = ObjectField(root, "response")) {
    HttpResponse r;
    r.status_code     = IntegerField(*resp, "status_code");
    r.headers         = Headers(*resp);
    r.timestamp_start = NumberField(*resp, "timestamp_start");
    r.timestamp_end   = NumberField(*resp, "timestamp_end");
    flow.response     = std::move(r);
  }

  return flow;
}

Payload DecodePayload(const std::string& kind, const std::string& bytes) {
  if (kind == kHttpFlow) {
    return DecodeHttpFlow(bytes);
  }
  if (kind == kRequestContent || kind == kResponseContent) {
    return ContentPayload{bytes};
  }
  return OpaquePayload{bytes};
}

std::string DeriveMethod(const std::string& kind, const std::string& payload) {
  if (kind != kHttpFlow) return {};
  try {
    auto flow = DecodeHttpFlow(payload);
    if (!flow.request || !flow.request->method) return {};
    return *flow.request->method;
  } catch (const util::MalformedPayload&) {
    return {};
  }
}

std::optional<std::string> ContentType(const HttpFlowPayload& flow) {
  if (!flow.response) return std::nullopt;
  for (const auto& [key, value] : flow.response->headers) {
    if (Lower(key) != "content-type") continue;
    auto pos = value.find(';');
    return pos == std::string::npos ? value : value.substr(0, pos);
  }
  return std::nullopt;
}

std::optional<double> Duration(const HttpFlowPayload& flow) {
  if (!flow.response || !flow.response->timestamp_start || !flow.response->timestamp_end) return std::nullopt;
  return *flow.response->timestamp_end - *flow.response->timestamp_start;
}

std::vector<db::model::HeaderRecord> HeaderRows(const db::model::ChunkRecord& chunk) {
  std::vector<db::model::HeaderRecord> out;
  if (chunk.kind != kHttpFlow) return out;

  auto flow = DecodeHttpFlow(chunk.payload);
  if (flow.request) AppendRows(out, chunk, db::model::HeaderDirection::kRequest, flow.request->headers);
  if (flow.response) AppendRows(out, chunk, db::model::HeaderDirection::kResponse, flow.response->headers);
  return out;
}

std::string HeaderComposite(const std::string& key, const std::string& value) {
  return key + "=" + value;
}

} // namespace flowstore::codec
