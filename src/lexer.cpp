#include "calcexpr/lexer.hpp"
#include <cctype>
#include <cmath>
#include <locale>
#include <sstream>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace calcexpr {

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

void Lexer::skip_ws() {
    while (!is_end() && std::isspace(static_cast<unsigned char>(s_[i_]))) ++i_;
}

// Longest run of digits with at most one '.'.
Token Lexer::number() {
    std::size_t start = i_;
    bool seen_point = false;
    while (!is_end()) {
        char c = s_[i_];
        if (is_digit(c)) {
            ++i_;
        } else if (c == '.' && !seen_point) {
            seen_point = true;
            ++i_;
        } else {
            break;
        }
    }

    Token t{TokKind::Number};
    t.text = std::string(s_.substr(start, i_ - start));
    if (t.text == ".") throw ParseError(ErrorKind::MalformedToken, fmt::format("Lone '.' at position {}", start));

    // '.' is the decimal point whatever LC_NUMERIC the host has set
    std::istringstream in(t.text);
    in.imbue(std::locale::classic());
    in >> t.number;
    if (in.fail() || in.peek() != std::char_traits<char>::eof() || !std::isfinite(t.number)) {
        throw ParseError(ErrorKind::MalformedToken, fmt::format("Invalid number '{}'", t.text));
    }
    return t;
}

Token Lexer::next() {
    skip_ws();
    if (is_end()) return {TokKind::End};

    char c = s_[i_];

    switch (c) {
        case '+': ++i_; return {TokKind::Plus, "+"};
        case '-': ++i_; return {TokKind::Minus, "-"};
        case '*': ++i_; return {TokKind::Star, "*"};
        case '/': ++i_; return {TokKind::Slash, "/"};
        case '^': ++i_; return {TokKind::Caret, "^"};
        case '(': ++i_; return {TokKind::LParen, "("};
        case ')': ++i_; return {TokKind::RParen, ")"};
        default: break;
    }

    if (s_.substr(i_, 4) == "sqrt") {
        i_ += 4;
        return {TokKind::Func, "sqrt"};
    }

    if (is_digit(c) || c == '.') return number();

    throw ParseError(ErrorKind::MalformedToken,
                     fmt::format("Unexpected character '{}' at position {}", c, i_));
}

std::vector<Token> tokenize(std::string_view expr) {
    std::string compact;
    compact.reserve(expr.size());
    for (char c : expr) {
        if (!std::isspace(static_cast<unsigned char>(c))) compact.push_back(c);
    }

    Lexer lex(compact);
    std::vector<Token> tokens;
    for (Token t = lex.next(); t.kind != TokKind::End; t = lex.next()) {
        tokens.push_back(std::move(t));
    }
    return tokens;
}

} // namespace calcexpr
