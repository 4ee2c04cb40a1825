#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"

namespace flowstore::service {

// Runs fn, logging latency at debug level and failures at error level.
// Exceptions are rethrown unchanged.
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_us = [&] {
    return static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      FLOWSTORE_LOG_DEBUG("RPC done", {observability::StringField("route", route), observability::IntField("latency_us", elapsed_us())});
      return;
    } else {
      auto result = fn();
      FLOWSTORE_LOG_DEBUG("RPC done", {observability::StringField("route", route), observability::IntField("latency_us", elapsed_us())});
      return result;
    }
  } catch (const std::exception& ex) {
    FLOWSTORE_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                       observability::IntField("latency_us", elapsed_us())});
    throw;
  }
}

} // namespace flowstore::service
