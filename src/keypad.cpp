#include <calcexpr/keypad.hpp>
#include <calcexpr/expr.hpp>
#include <calcexpr/format.hpp>
#include <calcexpr/log.hpp>
#include <calcexpr/preprocess.hpp>

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <string_view>
#include <utility>

namespace calcexpr {

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

static bool ends_with(const std::string& text, std::string_view suffix) {
    return text.size() >= suffix.size() &&
           std::string_view(text).substr(text.size() - suffix.size()) == suffix;
}

static std::string_view symbol(KeypadOp op) {
    switch (op) {
        case KeypadOp::Add:      return "+";
        case KeypadOp::Subtract: return kMinus;
        case KeypadOp::Multiply: return kTimes;
        case KeypadOp::Divide:   return kDivide;
    }
    return "+";
}

// Byte length of the display operator at the end of text, 0 if none.
static std::size_t trailing_operator(const std::string& text) {
    for (std::string_view op : {std::string_view("+"), kMinus, kTimes, kDivide}) {
        if (ends_with(text, op)) return op.size();
    }
    return 0;
}

// Trailing run of digits and '.', i.e. the number being typed.
static std::string_view trailing_number(const std::string& text) {
    std::size_t n = 0;
    while (n < text.size()) {
        char c = text[text.size() - 1 - n];
        if (!is_digit(c) && c != '.') break;
        ++n;
    }
    return std::string_view(text).substr(text.size() - n);
}

// True when the next thing typed starts a new operand.
static bool expects_operand(const std::string& text) {
    return text.empty() || trailing_operator(text) != 0 || ends_with(text, "(") || ends_with(text, kSquareRoot);
}

// ')' '%' '²' close an operand; a digit after them gets an explicit '×'.
static bool ends_with_closer(const std::string& text) {
    return ends_with(text, ")") || ends_with(text, "%") || ends_with(text, kSquared);
}

static KeypadState error_state(std::string message) {
    KeypadState s;
    s.text.clear();
    s.awaiting_new_expression = false;
    s.error = true;
    s.error_message = std::move(message);
    return s;
}

KeypadState press_digit(const KeypadState& state, char digit) {
    if (!is_digit(digit)) return state;

    KeypadState s = state.error ? KeypadState{} : state;

    if (s.awaiting_new_expression) {
        s.text.clear();
        s.awaiting_new_expression = false;
    }

    if (trailing_number(s.text) == "0") {
        if (digit != '0') s.text.back() = digit;
        return s;
    }
    if (ends_with_closer(s.text)) s.text.append(kTimes);
    s.text.push_back(digit);
    return s;
}

KeypadState press_operator(const KeypadState& state, KeypadOp op) {
    if (state.error) return state;

    KeypadState s = state;
    s.awaiting_new_expression = false; // the previous result becomes the left operand
    if (s.text.empty()) s.text = "0";

    std::string_view sym = symbol(op);

    if (std::size_t len = trailing_operator(s.text)) {
        std::string replaced = s.text.substr(0, s.text.size() - len);
        // "(−" can only become another unary minus
        if (expects_operand(replaced) && !replaced.empty() && op != KeypadOp::Subtract) return s;
        s.text = std::move(replaced);
        s.text.append(sym);
        return s;
    }

    if (ends_with(s.text, "(") || ends_with(s.text, kSquareRoot)) {
        if (op == KeypadOp::Subtract) s.text.append(sym);
        return s;
    }

    s.text.append(sym);
    return s;
}

KeypadState press_decimal(const KeypadState& state) {
    if (state.error) return state;

    KeypadState s = state;
    if (s.awaiting_new_expression) {
        s.text = "0.";
        s.awaiting_new_expression = false;
        return s;
    }
    if (ends_with_closer(s.text)) return s;

    std::string_view run = trailing_number(s.text);
    if (run.find('.') != std::string_view::npos) return s;
    s.text += run.empty() ? "0." : ".";
    return s;
}

KeypadState press_percent(const KeypadState& state) {
    if (state.error) return state;

    KeypadState s = state;
    s.awaiting_new_expression = false;
    if (!s.text.empty() && is_digit(s.text.back())) s.text.push_back('%');
    return s;
}

KeypadState press_square(const KeypadState& state) {
    if (state.error) return state;

    KeypadState s = state;
    if (s.awaiting_new_expression) {
        // a negative result squares as a whole: "-3" -> "(-3)"
        if (!s.text.empty() && s.text.front() == '-') s.text = "(" + s.text + ")";
        s.awaiting_new_expression = false;
    }
    if (!s.text.empty() && (is_digit(s.text.back()) || s.text.back() == ')')) s.text.append(kSquared);
    return s;
}

KeypadState press_square_root(const KeypadState& state) {
    if (state.error) return state;

    KeypadState s = state;
    if (s.awaiting_new_expression) {
        s.text.clear();
        s.awaiting_new_expression = false;
    }
    if (!expects_operand(s.text)) s.text.append(kTimes);
    s.text.append(kSquareRoot);
    return s;
}

KeypadState press_parentheses(const KeypadState& state) {
    if (state.error) return state;

    KeypadState s = state;
    if (s.awaiting_new_expression) {
        s.text.clear();
        s.awaiting_new_expression = false;
    }

    auto open = std::count(s.text.begin(), s.text.end(), '(');
    auto close = std::count(s.text.begin(), s.text.end(), ')');

    if (open <= close) {
        if (!expects_operand(s.text)) s.text.append(kTimes);
        s.text.push_back('(');
    } else {
        s.text.push_back(')');
    }
    return s;
}

KeypadState press_delete(const KeypadState& state) {
    if (state.error) return KeypadState{};

    KeypadState s = state;
    if (s.text.empty()) return s;

    // drop one UTF-8 code point
    std::size_t n = s.text.size() - 1;
    while (n > 0 && (static_cast<unsigned char>(s.text[n]) & 0xC0) == 0x80) --n;
    s.text.erase(n);

    if (s.text.empty()) {
        s.text = "0";
        s.awaiting_new_expression = true;
    }
    return s;
}

KeypadState press_clear(const KeypadState&) {
    return KeypadState{};
}

KeypadState press_equals(const KeypadState& state) {
    if (state.error || state.text.empty()) return state;

    if (!is_valid_expression(state.text)) return error_state("Invalid expression");

    double value = evaluate(state.text);
    if (is_error(value)) return error_state(FormatOptions{}.error_marker);

    KeypadState s;
    s.text = format(value);
    s.awaiting_new_expression = true;
    CALCEXPR_LOG(Debug, "'{}' = {}", state.text, s.text);
    return s;
}

KeypadState press_key(const KeypadState& state, char key) {
    if (is_digit(key)) return press_digit(state, key);

    switch (key) {
        case '+': return press_operator(state, KeypadOp::Add);
        case '-': return press_operator(state, KeypadOp::Subtract);
        case '*': return press_operator(state, KeypadOp::Multiply);
        case '/': return press_operator(state, KeypadOp::Divide);
        case '.': return press_decimal(state);
        case '%': return press_percent(state);
        case '(':
        case ')': return press_parentheses(state);
        case 's': return press_square(state);
        case 'r': return press_square_root(state);
        case '<': return press_delete(state);
        case 'C':
        case 'c': return press_clear(state);
        case '=': return press_equals(state);
        default: break;
    }
    CALCEXPR_LOG(Warning, "Ignoring unknown key '{}'", key);
    return state;
}

std::string display(const KeypadState& state) {
    if (state.error) return state.error_message;
    if (state.text.empty()) return "0";
    return state.text;
}

} // namespace calcexpr
