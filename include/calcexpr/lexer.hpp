#pragma once
#include <string_view>
#include <vector>
#include "calcexpr/error.hpp"
#include "calcexpr/token.hpp"

namespace calcexpr {

class Lexer {
public:
    explicit Lexer(std::string_view s) : s_(s) {}
    Token next();

private:
    void skip_ws();
    bool is_end() const { return i_ >= s_.size(); }
    Token number();

    std::string_view s_;
    std::size_t i_{0};
};

/// Strip whitespace and split a canonical expression into tokens.
/// Throws ParseError (MalformedToken) on anything that is not a number,
/// an operator, "sqrt" or a parenthesis.
std::vector<Token> tokenize(std::string_view expr);

} // namespace calcexpr
