#include "calcexpr/parser.hpp"
#include "calcexpr/error.hpp"
#include "calcexpr/lexer.hpp"
#include "calcexpr/preprocess.hpp"
#include <utility>

namespace calcexpr {

static int precedence(TokKind k) {
    switch (k) {
        case TokKind::Caret: return 3;
        case TokKind::Neg:
        case TokKind::Star:
        case TokKind::Slash: return 2;
        case TokKind::Plus:
        case TokKind::Minus: return 1;
        default:             return 0;
    }
}

static bool is_binary_op(TokKind k) {
    return k == TokKind::Plus || k == TokKind::Minus || k == TokKind::Star || k == TokKind::Slash ||
           k == TokKind::Caret;
}

static bool is_op(TokKind k) {
    return is_binary_op(k) || k == TokKind::Neg;
}

// Should the operator-stack top be emitted before pushing `incoming`?
// A function binds to the single operand that follows it, so it always goes.
static bool pops_before(TokKind top, TokKind incoming) {
    if (top == TokKind::Func) return true;
    return is_op(top) && precedence(top) >= precedence(incoming);
}

std::vector<Token> to_postfix(const std::vector<Token>& tokens) {
    std::vector<Token> output;
    std::vector<Token> opstack;
    output.reserve(tokens.size());

    // '-' is unary at the start, after '(', after an operator and after a function.
    bool expect_operand = true;

    for (Token t : tokens) {
        if (t.kind == TokKind::End) break;

        if (t.kind == TokKind::Number) {
            output.push_back(std::move(t));
            expect_operand = false;
            continue;
        }

        if (t.kind == TokKind::Func || t.kind == TokKind::LParen) {
            opstack.push_back(std::move(t));
            expect_operand = true;
            continue;
        }

        if (t.kind == TokKind::RParen) {
            while (!opstack.empty() && opstack.back().kind != TokKind::LParen) {
                output.push_back(std::move(opstack.back()));
                opstack.pop_back();
            }
            if (opstack.empty()) throw ParseError(ErrorKind::UnbalancedParentheses, "Mismatched ')'");
            opstack.pop_back(); // pop '('

            if (!opstack.empty() && opstack.back().kind == TokKind::Func) {
                output.push_back(std::move(opstack.back()));
                opstack.pop_back();
            }
            expect_operand = false;
            continue;
        }

        if (t.kind == TokKind::Minus && expect_operand) t.kind = TokKind::Neg;

        if (t.kind == TokKind::Neg) {
            // prefix: nothing to its left can be popped yet
            opstack.push_back(std::move(t));
            expect_operand = true;
            continue;
        }

        // binary operator
        while (!opstack.empty() && pops_before(opstack.back().kind, t.kind)) {
            output.push_back(std::move(opstack.back()));
            opstack.pop_back();
        }
        opstack.push_back(std::move(t));
        expect_operand = true;
    }

    while (!opstack.empty()) {
        if (opstack.back().kind == TokKind::LParen) throw ParseError(ErrorKind::UnbalancedParentheses, "Mismatched '('");
        output.push_back(std::move(opstack.back()));
        opstack.pop_back();
    }
    return output;
}

std::vector<Token> compile(std::string_view expression) {
    return to_postfix(tokenize(preprocess(expression)));
}

} // namespace calcexpr
