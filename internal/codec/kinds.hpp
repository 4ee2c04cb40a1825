#pragma once

namespace flowstore::codec {

// Chunk kinds the store derives values from. Any other kind is opaque.
inline constexpr const char* kHttpFlow        = "http_flow";
inline constexpr const char* kRequestContent  = "request_content";
inline constexpr const char* kResponseContent = "response_content";
inline constexpr const char* kClientConn      = "client_conn";
inline constexpr const char* kServerConn      = "server_conn";

} // namespace flowstore::codec
