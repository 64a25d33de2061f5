#pragma once
#include <string>
#include <vector>

namespace calcexpr {

enum class TokKind {
    Number,

    Plus, Minus, Star, Slash, Caret,
    LParen, RParen,
    Func,  // function keyword (sqrt)
    End,

    // internal
    Neg,   // unary -
};

struct Token {
    TokKind kind{TokKind::End};
    std::string text{};  // Number literal / Func name / operator symbol
    double number{0.0};  // Number
};

/// Space-joined rendering of a token sequence, e.g. "2 3 4 * +".
/// Unary minus renders as "neg".
std::string to_string(const std::vector<Token>& tokens);

} // namespace calcexpr
