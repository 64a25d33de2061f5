#pragma once

#include <stdexcept>
#include <string>

namespace calcexpr {

enum class ErrorKind {
    MalformedToken,
    UnbalancedParentheses,
    InvalidExpression,   // stack arity mismatch
    DivisionByZero,
    NegativeSquareRoot,
    NonFiniteResult,
};

const char* to_string(ErrorKind kind) noexcept;

struct CalcError : std::runtime_error {
    CalcError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

struct ParseError : CalcError { using CalcError::CalcError; };
struct EvalError  : CalcError { using CalcError::CalcError; };

/// Value-type form of a failed evaluation.
struct Error {
    ErrorKind kind{ErrorKind::InvalidExpression};
    std::string message{};
};

} // namespace calcexpr
