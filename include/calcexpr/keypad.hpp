#pragma once

#include <string>

namespace calcexpr {

enum class KeypadOp {
    Add,
    Subtract,
    Multiply,
    Divide,
};

/// Snapshot of the calculator's input line. Every press_* returns a new
/// snapshot; none of them mutate their argument.
struct KeypadState {
    std::string text{"0"};              // display symbols: × ÷ − √ ² %
    bool awaiting_new_expression{true}; // text holds "0" or the last result
    bool error{false};
    std::string error_message{};
};

KeypadState press_digit(const KeypadState& state, char digit);
KeypadState press_operator(const KeypadState& state, KeypadOp op);
KeypadState press_decimal(const KeypadState& state);
KeypadState press_percent(const KeypadState& state);
KeypadState press_square(const KeypadState& state);
KeypadState press_square_root(const KeypadState& state);
KeypadState press_parentheses(const KeypadState& state);
KeypadState press_delete(const KeypadState& state);
KeypadState press_clear(const KeypadState& state);
KeypadState press_equals(const KeypadState& state);

/// ASCII key map:
///   0-9  + - * /  .  %  ( or ) (toggle)  s (x²)  r (√)  < (delete)  C/c  =
/// Unknown keys leave the state unchanged.
KeypadState press_key(const KeypadState& state, char key);

/// What the display shows for this state.
std::string display(const KeypadState& state);

} // namespace calcexpr
