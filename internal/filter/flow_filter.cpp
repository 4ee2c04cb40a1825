#include "internal/filter/flow_filter.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <vector>

#include <re2/re2.h>

#include "internal/util/errors.hpp"

namespace flowstore::filter {

struct FlowFilter::Node {
  enum class Op {
    kAll,
    kAnd,
    kOr,
    kNot,
    kStatus,
    kMethod,
    kMethodPattern,
    kHost,
    kUrl,
    kContentType,
    kHeader,
    kRequestHeader,
    kResponseHeader,
    kMarked,
    kMarker,
  };

  Op                                       op = Op::kAll;
  std::vector<std::shared_ptr<const Node>> children;
  std::string                              text;
  std::unique_ptr<RE2>                     re;
  int64_t                                  status = 0;
};

namespace {

using Node    = FlowFilter::Node;
using NodePtr = std::shared_ptr<const Node>;

// ------------------------------------------------------------------
// Lexer
// ------------------------------------------------------------------

enum class TokenType { kLParen, kRParen, kNot, kAnd, kOr, kCode, kWord, kEnd };

struct Token {
  TokenType   type = TokenType::kEnd;
  std::string text;
  std::size_t pos = 0;
};

bool IsWordBreak(char c) {
  return std::isspace(static_cast<unsigned char>(c)) || c == '(' || c == ')' || c == '~' || c == '\'' || c == '"';
}

// nesting bound for ( and !
constexpr int kMaxDepth = 256;

// request methods answered from the method index
bool IsStandardMethod(const std::string& text) {
  static const char* const kMethods[] = {"GET", "HEAD", "POST", "PUT", "DELETE", "CONNECT", "OPTIONS", "TRACE", "PATCH"};
  return std::any_of(std::begin(kMethods), std::end(kMethods), [&](const char* m) {
    const std::string method(m);
    return text.size() == method.size() && std::equal(text.begin(), text.end(), method.begin(), [](unsigned char a, unsigned char b) {
             return std::toupper(a) == b;
           });
  });
}

[[noreturn]] void Fail(const std::string& expression, std::size_t pos, const std::string& what) {
  throw util::InvalidArgument("invalid filter '" + expression + "' at " + std::to_string(pos) + ": " + what);
}

std::vector<Token> Tokenize(const std::string& s) {
  std::vector<Token> out;
  std::size_t        i = 0;

  while (i < s.size()) {
    const char c = s[i];
    if (std::isspace(static_cast<unsigned char>(c))) {
      ++i;
      continue;
    }

    const std::size_t start = i;
    switch (c) {
      case '(':
        out.push_back({TokenType::kLParen, "(", start});
        ++i;
        continue;
      case ')':
        out.push_back({TokenType::kRParen, ")", start});
        ++i;
        continue;
      case '!':
        out.push_back({TokenType::kNot, "!", start});
        ++i;
        continue;
      case '&':
        out.push_back({TokenType::kAnd, "&", start});
        ++i;
        continue;
      case '|':
        out.push_back({TokenType::kOr, "|", start});
        ++i;
        continue;
      default:
        break;
    }

    if (c == '~') {
      ++i;
      while (i < s.size() && std::isalpha(static_cast<unsigned char>(s[i]))) ++i;
      if (i == start + 1) Fail(s, start, "expected filter code after '~'");
      out.push_back({TokenType::kCode, s.substr(start + 1, i - start - 1), start});
      continue;
    }

    if (c == '\'' || c == '"') {
      // \<quote> is the quote itself; other backslashes are kept for the regex
      std::string text;
      ++i;
      bool closed = false;
      while (i < s.size()) {
        if (s[i] == '\\' && i + 1 < s.size() && s[i + 1] == c) {
          text.push_back(c);
          i += 2;
          continue;
        }
        if (s[i] == c) {
          closed = true;
          ++i;
          break;
        }
        text.push_back(s[i++]);
      }
      if (!closed) Fail(s, start, "unterminated quoted string");
      out.push_back({TokenType::kWord, std::move(text), start});
      continue;
    }

    while (i < s.size() && !IsWordBreak(s[i])) ++i;
    out.push_back({TokenType::kWord, s.substr(start, i - start), start});
  }

  out.push_back({TokenType::kEnd, "", s.size()});
  return out;
}

// ------------------------------------------------------------------
// Parser
// ------------------------------------------------------------------

class Parser {
 public:
  explicit Parser(const std::string& expression) : expression_(expression), tokens_(Tokenize(expression)) {
  }

  NodePtr Parse() {
    auto root = ParseOr();
    if (Peek().type != TokenType::kEnd) {
      Fail(expression_, Peek().pos, "unexpected '" + Peek().text + "'");
    }
    return root;
  }

 private:
  const Token& Peek() const {
    return tokens_[pos_];
  }

  Token Next() {
    return tokens_[pos_++];
  }

  static bool StartsOperand(TokenType t) {
    return t == TokenType::kNot || t == TokenType::kLParen || t == TokenType::kCode || t == TokenType::kWord;
  }

  static NodePtr Join(Node::Op op, NodePtr lhs, NodePtr rhs) {
    auto node = std::make_shared<Node>();
    node->op  = op;
    for (auto side : {std::move(lhs), std::move(rhs)}) {
      if (side->op == op) {
        node->children.insert(node->children.end(), side->children.begin(), side->children.end());
      } else {
        node->children.push_back(std::move(side));
      }
    }
    return node;
  }

  NodePtr ParseOr() {
    auto lhs = ParseAnd();
    while (Peek().type == TokenType::kOr) {
      Next();
      lhs = Join(Node::Op::kOr, lhs, ParseAnd());
    }
    return lhs;
  }

  NodePtr ParseAnd() {
    auto lhs = ParseNot();
    for (;;) {
      if (Peek().type == TokenType::kAnd) {
        Next();
      } else if (!StartsOperand(Peek().type)) {
        break;
      }
      lhs = Join(Node::Op::kAnd, lhs, ParseNot());
    }
    return lhs;
  }

  class DepthGuard {
   public:
    DepthGuard(Parser& parser, std::size_t pos) : parser_(parser) {
      if (++parser_.depth_ > kMaxDepth) {
        Fail(parser_.expression_, pos, "nested deeper than " + std::to_string(kMaxDepth));
      }
    }
    ~DepthGuard() {
      --parser_.depth_;
    }

   private:
    Parser& parser_;
  };

  NodePtr ParseNot() {
    if (Peek().type == TokenType::kNot) {
      DepthGuard guard(*this, Next().pos);
      auto       node = std::make_shared<Node>();
      node->op        = Node::Op::kNot;
      node->children.push_back(ParseNot());
      return node;
    }
    return ParseAtom();
  }

  NodePtr ParseAtom() {
    const Token tok = Next();
    switch (tok.type) {
      case TokenType::kLParen: {
        DepthGuard guard(*this, tok.pos);
        auto       inner = ParseOr();
        if (Peek().type != TokenType::kRParen) Fail(expression_, Peek().pos, "expected ')'");
        Next();
        return inner;
      }
      case TokenType::kCode:
        return ParseCode(tok);
      case TokenType::kWord:
        return RegexNode(Node::Op::kUrl, tok);
      case TokenType::kEnd:
        Fail(expression_, tok.pos, "unexpected end of expression");
      default:
        Fail(expression_, tok.pos, "unexpected '" + tok.text + "'");
    }
  }

  Token Argument(const Token& code) {
    if (Peek().type != TokenType::kWord) {
      Fail(expression_, Peek().pos, "~" + code.text + " expects an argument");
    }
    return Next();
  }

  NodePtr RegexNode(Node::Op op, const Token& arg) {
    auto node  = std::make_shared<Node>();
    node->op   = op;
    node->text = arg.text;

    RE2::Options options;
    options.set_case_sensitive(false);
    options.set_log_errors(false);
    node->re = std::make_unique<RE2>(arg.text, options);
    if (!node->re->ok()) {
      Fail(expression_, arg.pos, "bad regex '" + arg.text + "': " + node->re->error());
    }
    return node;
  }

  NodePtr ParseCode(const Token& code) {
    const auto& c = code.text;

    if (c == "all" || c == "marked") {
      auto node = std::make_shared<Node>();
      node->op  = c == "all" ? Node::Op::kAll : Node::Op::kMarked;
      return node;
    }
    if (c == "c") {
      auto arg = Argument(code);
      if (arg.text.empty() || arg.text.size() > 9 ||
          !std::all_of(arg.text.begin(), arg.text.end(), [](unsigned char ch) { return std::isdigit(ch); })) {
        Fail(expression_, arg.pos, "~c expects a status code");
      }
      auto node    = std::make_shared<Node>();
      node->op     = Node::Op::kStatus;
      node->status = std::stoll(arg.text);
      return node;
    }
    if (c == "m") {
      auto arg = Argument(code);
      if (!IsStandardMethod(arg.text)) return RegexNode(Node::Op::kMethodPattern, arg);
      auto node  = std::make_shared<Node>();
      node->op   = Node::Op::kMethod;
      node->text = arg.text;
      return node;
    }
    if (c == "d") return RegexNode(Node::Op::kHost, Argument(code));
    if (c == "u") return RegexNode(Node::Op::kUrl, Argument(code));
    if (c == "t") return RegexNode(Node::Op::kContentType, Argument(code));
    if (c == "h") return RegexNode(Node::Op::kHeader, Argument(code));
    if (c == "hq") return RegexNode(Node::Op::kRequestHeader, Argument(code));
    if (c == "hs") return RegexNode(Node::Op::kResponseHeader, Argument(code));
    if (c == "marker") return RegexNode(Node::Op::kMarker, Argument(code));

    Fail(expression_, code.pos, "unknown filter ~" + c);
  }

  const std::string& expression_;
  std::vector<Token> tokens_;
  std::size_t        pos_   = 0;
  int                depth_ = 0;
};

// ------------------------------------------------------------------
// Evaluation
// ------------------------------------------------------------------

bool EqualsNoCase(const std::string& a, const std::string& b) {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
           return std::toupper(x) == std::toupper(y);
         });
}

bool Search(const std::optional<std::string>& field, const RE2& re) {
  return field && RE2::PartialMatch(*field, re);
}

bool AnyHeader(const codec::HeaderList& headers, const RE2& re) {
  for (const auto& [key, value] : headers) {
    if (RE2::PartialMatch(codec::HeaderComposite(key, value), re)) return true;
  }
  return false;
}

bool Eval(const Node& n, const projection::FlowRow& row, const codec::HttpFlowPayload* payload) {
  switch (n.op) {
    case Node::Op::kAll:
      return true;
    case Node::Op::kAnd:
      return std::all_of(n.children.begin(), n.children.end(), [&](const NodePtr& c) { return Eval(*c, row, payload); });
    case Node::Op::kOr:
      return std::any_of(n.children.begin(), n.children.end(), [&](const NodePtr& c) { return Eval(*c, row, payload); });
    case Node::Op::kNot:
      return !Eval(*n.children.front(), row, payload);
    case Node::Op::kStatus:
      return row.status_code && *row.status_code == n.status;
    case Node::Op::kMethod:
      return row.method && EqualsNoCase(*row.method, n.text);
    case Node::Op::kMethodPattern:
      return Search(row.method, *n.re);
    case Node::Op::kHost:
      return Search(row.host, *n.re);
    case Node::Op::kUrl:
      if (!row.host && !row.path) return false;
      return RE2::PartialMatch(row.host.value_or("") + row.path.value_or(""), *n.re);
    case Node::Op::kContentType:
      return Search(row.content_type, *n.re);
    case Node::Op::kHeader:
      return payload && ((payload->request && AnyHeader(payload->request->headers, *n.re)) ||
                         (payload->response && AnyHeader(payload->response->headers, *n.re)));
    case Node::Op::kRequestHeader:
      return payload && payload->request && AnyHeader(payload->request->headers, *n.re);
    case Node::Op::kResponseHeader:
      return payload && payload->response && AnyHeader(payload->response->headers, *n.re);
    case Node::Op::kMarked:
      return payload && !payload->marked.empty();
    case Node::Op::kMarker:
      return payload && RE2::PartialMatch(payload->marked, *n.re);
  }
  return false;
}

} // namespace

FlowFilter FlowFilter::Parse(const std::string& expression) {
  FlowFilter filter;
  filter.expression_ = expression;

  const bool blank = std::all_of(expression.begin(), expression.end(), [](unsigned char c) { return std::isspace(c); });
  if (!blank) {
    filter.root_ = Parser(expression).Parse();
  }
  return filter;
}

bool FlowFilter::Matches(const projection::FlowRow& row, const codec::HttpFlowPayload* payload) const {
  return !root_ || Eval(*root_, row, payload);
}

std::optional<std::string> FlowFilter::IndexableMethod() const {
  if (!root_) return std::nullopt;
  if (root_->op == Node::Op::kMethod) return root_->text;
  if (root_->op == Node::Op::kAnd) {
    for (const auto& child : root_->children) {
      if (child->op == Node::Op::kMethod) return child->text;
    }
  }
  return std::nullopt;
}

} // namespace flowstore::filter
