#pragma once

#include "flowcore/core/error.hpp"
#include "flowcore/util/json.hpp"

#include <string_view>

namespace flowcore {

// Evaluates condition, loop and wait expressions against a JSON context.
// The expression language is owned by the implementation.
class PredicateEvaluator {
public:
  virtual ~PredicateEvaluator() = default;
  [[nodiscard]] virtual auto evaluate(std::string_view expression,
                                      const JsonValue &context) const
      -> Result<bool> = 0;
};

// Small comparison language:
//   expr    := or
//   or      := and ("||" and)*
//   and     := unary ("&&" unary)*
//   unary   := "!" path | compare
//   compare := operand (op operand)?        op: == != > >= < <=
//   operand := number | 'str' | "str" | true | false | null | path
// A lone operand is tested for truthiness. Paths are dotted lookups into the
// context ("steps.fetch.rows[0]"); a missing path evaluates to null.
class ComparisonPredicateEvaluator final : public PredicateEvaluator {
public:
  [[nodiscard]] auto evaluate(std::string_view expression,
                              const JsonValue &context) const
      -> Result<bool> override;
};

} // namespace flowcore
