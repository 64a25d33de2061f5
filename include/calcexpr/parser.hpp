#pragma once
#include <string_view>
#include <vector>
#include "calcexpr/token.hpp"

namespace calcexpr {

// Shunting-yard: infix tokens -> postfix (RPN).
// Throws ParseError (UnbalancedParentheses) on a stray ')' or an unclosed '('.
std::vector<Token> to_postfix(const std::vector<Token>& tokens);

// preprocess + tokenize + to_postfix
std::vector<Token> compile(std::string_view expression);

} // namespace calcexpr
