#pragma once

#include <limits>
#include <string_view>
#include <variant>
#include <vector>

#include <calcexpr/error.hpp>
#include <calcexpr/token.hpp>

namespace calcexpr {

using Result = std::variant<double, Error>;

/// Evaluate a postfix token stream on a numeric stack.
/// Throws EvalError on arity mismatch, division by zero, sqrt of a
/// negative operand or a non-finite result.
double eval_rpn(const std::vector<Token>& rpn);

/// Full pipeline with the failure kept as a value.
/// A blank expression evaluates to 0.
Result try_evaluate(std::string_view expression);

/// Full pipeline; every failure collapses to the NaN sentinel.
double evaluate(std::string_view expression);

inline double error_sentinel() noexcept { return std::numeric_limits<double>::quiet_NaN(); }
bool is_error(double value) noexcept;

/// Parenthesis balance: never negative at any prefix, zero at the end.
bool is_balanced(std::string_view expression) noexcept;
inline bool is_valid_expression(std::string_view expression) noexcept { return is_balanced(expression); }

} // namespace calcexpr
