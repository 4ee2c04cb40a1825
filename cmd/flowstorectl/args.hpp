#pragma once

#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "flowstore/store/v1.hpp"

namespace flowstore::ctl {

// Decimal u64. Prints an error and returns nullopt for anything else.
inline std::optional<uint64_t> ParseU64(const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    std::cerr << "not a number: " << value << "\n";
    return std::nullopt;
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    std::cerr << "not a number: " << value << "\n";
    return std::nullopt;
  }
}

inline std::optional<flowstore::store::v1::FlowOrder> ParseOrder(const std::string& value) {
  using namespace flowstore::store::v1;
  if (value == "insertion") return FLOW_ORDER_INSERTION;
  if (value == "created") return FLOW_ORDER_CREATED;
  if (value == "method") return FLOW_ORDER_METHOD;
  if (value == "host") return FLOW_ORDER_HOST;
  if (value == "size") return FLOW_ORDER_SIZE;
  if (value == "status") return FLOW_ORDER_STATUS;
  if (value == "duration") return FLOW_ORDER_DURATION;
  return std::nullopt;
}

} // namespace flowstore::ctl
