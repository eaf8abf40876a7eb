#include "flowcore/executor/predicate_evaluator.hpp"

#include "flowcore/util/log.hpp"

#include <boost/algorithm/string/trim.hpp>

#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace flowcore {

namespace {

enum class TokenKind : std::uint8_t {
  Number,
  String,
  Path,
  True,
  False,
  Null,
  Compare,
  And,
  Or,
  Not,
  End,
};

struct Token {
  TokenKind kind{TokenKind::End};
  std::string text;
  double number{0.0};
};

[[nodiscard]] auto is_path_char(char c) noexcept -> bool {
  const auto uc = static_cast<unsigned char>(c);
  return std::isalnum(uc) != 0 || c == '_' || c == '.' || c == '[' ||
         c == ']' || c == '-';
}

[[nodiscard]] auto tokenize(std::string_view in) -> Result<std::vector<Token>> {
  std::vector<Token> out;
  std::size_t i = 0;
  while (i < in.size()) {
    const char c = in[i];
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      ++i;
      continue;
    }
    if (c == '\'' || c == '"') {
      auto close = in.find(c, i + 1);
      if (close == std::string_view::npos) {
        return fail(Error::ParseError);
      }
      out.push_back(Token{.kind = TokenKind::String,
                          .text = std::string(in.substr(i + 1, close - i - 1))});
      i = close + 1;
      continue;
    }
    if (in.substr(i, 2) == "&&") {
      out.push_back(Token{.kind = TokenKind::And});
      i += 2;
      continue;
    }
    if (in.substr(i, 2) == "||") {
      out.push_back(Token{.kind = TokenKind::Or});
      i += 2;
      continue;
    }
    if (c == '=' || c == '!' || c == '<' || c == '>') {
      const bool two = i + 1 < in.size() && in[i + 1] == '=';
      if (c == '!' && !two) {
        out.push_back(Token{.kind = TokenKind::Not});
        ++i;
        continue;
      }
      if (c == '=' && !two) {
        return fail(Error::ParseError);
      }
      out.push_back(Token{.kind = TokenKind::Compare,
                          .text = std::string(in.substr(i, two ? 2 : 1))});
      i += two ? 2 : 1;
      continue;
    }
    const bool signed_number =
        (c == '-' || c == '+') && i + 1 < in.size() &&
        std::isdigit(static_cast<unsigned char>(in[i + 1])) != 0;
    if (std::isdigit(static_cast<unsigned char>(c)) != 0 || signed_number) {
      const char *begin = in.data() + i + (c == '+' ? 1 : 0);
      double value{};
      auto [ptr, ec] = std::from_chars(begin, in.data() + in.size(), value);
      if (ec != std::errc{}) {
        return fail(Error::ParseError);
      }
      out.push_back(Token{.kind = TokenKind::Number, .number = value});
      i = static_cast<std::size_t>(ptr - in.data());
      continue;
    }
    if (is_path_char(c)) {
      auto start = i;
      while (i < in.size() && is_path_char(in[i])) {
        ++i;
      }
      auto word = in.substr(start, i - start);
      if (word == "true") {
        out.push_back(Token{.kind = TokenKind::True});
      } else if (word == "false") {
        out.push_back(Token{.kind = TokenKind::False});
      } else if (word == "null") {
        out.push_back(Token{.kind = TokenKind::Null});
      } else {
        out.push_back(Token{.kind = TokenKind::Path, .text = std::string(word)});
      }
      continue;
    }
    return fail(Error::ParseError);
  }
  out.push_back(Token{.kind = TokenKind::End});
  return ok(std::move(out));
}

// Operand after path resolution. Objects and arrays keep a pointer into the
// context so they can be tested for truthiness or equality.
using Operand =
    std::variant<std::monostate, bool, double, std::string, const JsonValue *>;

[[nodiscard]] auto operand_from_json(const JsonValue *value) -> Operand {
  if (value == nullptr || value->is_null()) {
    return std::monostate{};
  }
  if (value->is_boolean()) {
    return value->get<bool>();
  }
  if (auto n = json::as_number(*value)) {
    return *n;
  }
  if (value->is_string()) {
    return value->get<std::string>();
  }
  return value;
}

[[nodiscard]] auto truthy(const Operand &op) -> bool {
  return std::visit(
      [](const auto &v) -> bool {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return false;
        } else if constexpr (std::is_same_v<T, bool>) {
          return v;
        } else if constexpr (std::is_same_v<T, double>) {
          return v != 0.0;
        } else if constexpr (std::is_same_v<T, std::string>) {
          return !v.empty();
        } else {
          return json::truthy(*v);
        }
      },
      op);
}

template <typename T>
[[nodiscard]] auto apply_order(std::string_view op, const T &lhs,
                               const T &rhs) -> bool {
  if (op == "==") {
    return lhs == rhs;
  }
  if (op == "!=") {
    return lhs != rhs;
  }
  if (op == ">") {
    return lhs > rhs;
  }
  if (op == ">=") {
    return lhs >= rhs;
  }
  if (op == "<") {
    return lhs < rhs;
  }
  return lhs <= rhs;
}

[[nodiscard]] auto compare(std::string_view op, const Operand &lhs,
                           const Operand &rhs) -> Result<bool> {
  if (const auto *l = std::get_if<double>(&lhs)) {
    if (const auto *r = std::get_if<double>(&rhs)) {
      return ok(apply_order(op, *l, *r));
    }
  }
  if (const auto *l = std::get_if<std::string>(&lhs)) {
    if (const auto *r = std::get_if<std::string>(&rhs)) {
      return ok(apply_order(op, *l, *r));
    }
  }
  const bool equality = op == "==" || op == "!=";
  if (equality) {
    bool same = false;
    if (lhs.index() == rhs.index()) {
      if (const auto *l = std::get_if<const JsonValue *>(&lhs)) {
        same = dump_json(**l) ==
               dump_json(*std::get<const JsonValue *>(rhs));
      } else if (const auto *lb = std::get_if<bool>(&lhs)) {
        same = *lb == std::get<bool>(rhs);
      } else {
        same = true; // both null
      }
    }
    return ok(op == "==" ? same : !same);
  }
  // Ordering against a missing value is simply not satisfied.
  if (std::holds_alternative<std::monostate>(lhs) ||
      std::holds_alternative<std::monostate>(rhs)) {
    return ok(false);
  }
  return fail(Error::InvalidArgument);
}

class Parser {
public:
  Parser(const std::vector<Token> &tokens, const JsonValue &context)
      : tokens_(tokens), context_(context) {}

  [[nodiscard]] auto parse() -> Result<bool> {
    auto value = parse_or();
    if (!value) {
      return value;
    }
    if (peek().kind != TokenKind::End) {
      return fail(Error::ParseError);
    }
    return value;
  }

private:
  [[nodiscard]] auto peek() const -> const Token & { return tokens_[pos_]; }
  auto advance() -> const Token & { return tokens_[pos_++]; }

  // Both sides are always parsed so syntax errors surface even when the
  // result is already decided.
  [[nodiscard]] auto parse_or() -> Result<bool> {
    auto lhs = parse_and();
    if (!lhs) {
      return lhs;
    }
    bool result = *lhs;
    while (peek().kind == TokenKind::Or) {
      advance();
      auto rhs = parse_and();
      if (!rhs) {
        return rhs;
      }
      result = result || *rhs;
    }
    return ok(result);
  }

  [[nodiscard]] auto parse_and() -> Result<bool> {
    auto lhs = parse_unary();
    if (!lhs) {
      return lhs;
    }
    bool result = *lhs;
    while (peek().kind == TokenKind::And) {
      advance();
      auto rhs = parse_unary();
      if (!rhs) {
        return rhs;
      }
      result = result && *rhs;
    }
    return ok(result);
  }

  [[nodiscard]] auto parse_unary() -> Result<bool> {
    if (peek().kind == TokenKind::Not) {
      advance();
      auto inner = parse_unary();
      if (!inner) {
        return inner;
      }
      return ok(!*inner);
    }
    return parse_compare();
  }

  [[nodiscard]] auto parse_compare() -> Result<bool> {
    auto lhs = parse_operand();
    if (!lhs) {
      return fail(lhs.error());
    }
    if (peek().kind != TokenKind::Compare) {
      return ok(truthy(*lhs));
    }
    const std::string op = advance().text;
    auto rhs = parse_operand();
    if (!rhs) {
      return fail(rhs.error());
    }
    return compare(op, *lhs, *rhs);
  }

  [[nodiscard]] auto parse_operand() -> Result<Operand> {
    const auto &tok = advance();
    switch (tok.kind) {
    case TokenKind::Number:
      return ok(Operand{tok.number});
    case TokenKind::String:
      return ok(Operand{tok.text});
    case TokenKind::True:
      return ok(Operand{true});
    case TokenKind::False:
      return ok(Operand{false});
    case TokenKind::Null:
      return ok(Operand{std::monostate{}});
    case TokenKind::Path:
      return ok(operand_from_json(json::find_path(context_, tok.text)));
    default:
      return fail(Error::ParseError);
    }
  }

  const std::vector<Token> &tokens_;
  const JsonValue &context_;
  std::size_t pos_{0};
};

} // namespace

auto ComparisonPredicateEvaluator::evaluate(std::string_view expression,
                                            const JsonValue &context) const
    -> Result<bool> {
  const auto trimmed = boost::algorithm::trim_copy(std::string(expression));
  if (trimmed.empty()) {
    return fail(Error::InvalidArgument);
  }
  auto tokens = tokenize(trimmed);
  if (!tokens) {
    log::warn("predicate '{}' failed to tokenize", trimmed);
    return fail(tokens.error());
  }
  auto result = Parser(*tokens, context).parse();
  if (!result) {
    log::warn("predicate '{}' failed: {}", trimmed, result.error().message());
  }
  return result;
}

} // namespace flowcore
