#include <calcexpr/expr.hpp>
#include <calcexpr/log.hpp>
#include <calcexpr/parser.hpp>

#include <cctype>
#include <cmath>
#include <utility>

#include <fmt/format.h>

namespace calcexpr {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::MalformedToken:        return "MalformedToken";
        case ErrorKind::UnbalancedParentheses: return "UnbalancedParentheses";
        case ErrorKind::InvalidExpression:     return "InvalidExpression";
        case ErrorKind::DivisionByZero:        return "DivisionByZero";
        case ErrorKind::NegativeSquareRoot:    return "NegativeSquareRoot";
        case ErrorKind::NonFiniteResult:       return "NonFiniteResult";
    }
    return "Unknown";
}

// -----------------------------
// evaluation
// -----------------------------
static double apply_binary(const Token& op, double a, double b) {
    switch (op.kind) {
        case TokKind::Plus:  return a + b;
        case TokKind::Minus: return a - b;
        case TokKind::Star:  return a * b;
        case TokKind::Slash:
            if (b == 0.0) throw EvalError(ErrorKind::DivisionByZero, "Division by zero");
            return a / b;
        case TokKind::Caret: return std::pow(a, b);
        default: break;
    }
    throw EvalError(ErrorKind::InvalidExpression, fmt::format("Unsupported operator '{}'", op.text));
}

static double apply_function(const Token& fn, double x) {
    if (fn.text == "sqrt") {
        if (x < 0.0) throw EvalError(ErrorKind::NegativeSquareRoot, fmt::format("Square root of negative number {}", x));
        return std::sqrt(x);
    }
    throw EvalError(ErrorKind::InvalidExpression, "Unknown function: " + fn.text);
}

static double finite(double v) {
    if (!std::isfinite(v)) throw EvalError(ErrorKind::NonFiniteResult, fmt::format("Result {} is not a finite number", v));
    return v;
}

double eval_rpn(const std::vector<Token>& rpn) {
    std::vector<double> st;
    st.reserve(rpn.size());

    auto pop = [&]() {
        double v = st.back();
        st.pop_back();
        return v;
    };

    for (const auto& t : rpn) {
        switch (t.kind) {
            case TokKind::Number:
                st.push_back(t.number);
                break;

            case TokKind::Neg: {
                if (st.empty()) throw EvalError(ErrorKind::InvalidExpression, "Unary '-' without an operand");
                st.push_back(-pop());
                break;
            }

            case TokKind::Plus:
            case TokKind::Minus:
            case TokKind::Star:
            case TokKind::Slash:
            case TokKind::Caret: {
                if (st.size() < 2) {
                    throw EvalError(ErrorKind::InvalidExpression,
                                    fmt::format("Operator '{}' needs two operands", t.text));
                }
                double b = pop();
                double a = pop();
                st.push_back(finite(apply_binary(t, a, b)));
                break;
            }

            case TokKind::Func: {
                if (st.empty()) {
                    throw EvalError(ErrorKind::InvalidExpression, fmt::format("Function '{}' without an argument", t.text));
                }
                st.push_back(finite(apply_function(t, pop())));
                break;
            }

            default:
                throw EvalError(ErrorKind::InvalidExpression, "Unexpected token during evaluation");
        }
    }

    if (st.size() != 1) {
        throw EvalError(ErrorKind::InvalidExpression,
                        fmt::format("Expression left {} values on the stack", st.size()));
    }
    return st.back();
}

// -----------------------------
// boundary
// -----------------------------
static bool is_blank(std::string_view s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

Result try_evaluate(std::string_view expression) {
    if (is_blank(expression)) return 0.0;
    try {
        return eval_rpn(compile(expression));
    } catch (const CalcError& e) {
        return Error{e.kind(), e.what()};
    }
}

double evaluate(std::string_view expression) {
    Result r = try_evaluate(expression);
    if (const auto* err = std::get_if<Error>(&r)) {
        CALCEXPR_LOG(Debug, "'{}' failed: {} ({})", expression, to_string(err->kind), err->message);
        return error_sentinel();
    }
    return std::get<double>(r);
}

bool is_error(double value) noexcept {
    return std::isnan(value);
}

bool is_balanced(std::string_view expression) noexcept {
    int depth = 0;
    for (char c : expression) {
        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            if (--depth < 0) return false;
        }
    }
    return depth == 0;
}

} // namespace calcexpr
