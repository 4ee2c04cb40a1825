#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/codec/flow_payload.hpp"
#include "internal/projection/flow_row.hpp"

namespace flowstore::filter {

/*
  Flow filter expressions.

    ~c <code>        response status code
    ~m <method>      request method
    ~d <regex>       host
    ~u <regex>       host + path; a bare word means the same
    ~t <regex>       response content type
    ~h <regex>       any header as "key=value"
    ~hq <regex>      request headers
    ~hs <regex>      response headers
    ~marked          flow carries a marker
    ~marker <regex>  marker text
    ~all             every flow

  Operators by precedence: ! (not), & (and, also plain juxtaposition),
  | (or). Parentheses group. Arguments may be quoted with ' or ", with \
  escaping the quote. Regexes are RE2 syntax, case-insensitive, searched
  anywhere in the field. A regex against an absent field does not match.

  ~m with a standard method name (GET, POST, ...) is an exact,
  case-insensitive comparison answered from the method index. Any other
  ~m argument is a regex like the rest: "~m PO" matches POST but not PUT.

  Nesting of ( and ! is limited to 256 levels.
*/
class FlowFilter {
 public:
  struct Node;

  // Empty or blank expression matches everything. Throws util::InvalidArgument.
  static FlowFilter Parse(const std::string& expression);

  // payload may be null when the chunk did not decode
  bool Matches(const projection::FlowRow& row, const codec::HttpFlowPayload* payload) const;

  bool MatchesAll() const {
    return root_ == nullptr;
  }

  // Method every match must have, if the expression requires one through
  // ~m at top level or inside a top-level conjunction.
  std::optional<std::string> IndexableMethod() const;

  const std::string& Expression() const {
    return expression_;
  }

 private:
  std::string                 expression_;
  std::shared_ptr<const Node> root_;
};

} // namespace flowstore::filter
