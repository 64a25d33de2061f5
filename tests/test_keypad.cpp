#include <gtest/gtest.h>
#include <calcexpr/keypad.hpp>

#include <string>

namespace {

calcexpr::KeypadState feed(const std::string& keys, calcexpr::KeypadState state = {}) {
    for (char k : keys) state = calcexpr::press_key(state, k);
    return state;
}

std::string shown(const std::string& keys) {
    return calcexpr::display(feed(keys));
}

TEST(Keypad, StartsAtZero) {
    calcexpr::KeypadState s;
    EXPECT_EQ(calcexpr::display(s), "0");
    EXPECT_TRUE(s.awaiting_new_expression);
    EXPECT_FALSE(s.error);
}

TEST(Keypad, NoLeadingDoubleZero) {
    EXPECT_EQ(shown("00"), "0");
    EXPECT_EQ(shown("05"), "5");
    EXPECT_EQ(shown("1+00"), "1+0");
    EXPECT_EQ(shown("1+07"), "1+7");
    EXPECT_EQ(shown("100"), "100");
}

TEST(Keypad, OperatorReplacesOperator) {
    EXPECT_EQ(shown("5+*"), "5×");
    EXPECT_EQ(shown("5-/"), "5÷");
    EXPECT_EQ(shown("+"), "0+");
}

TEST(Keypad, OneDecimalPointPerNumber) {
    EXPECT_EQ(shown("1.2."), "1.2");
    EXPECT_EQ(shown("1.2+3.4"), "1.2+3.4");
    EXPECT_EQ(shown("5+."), "5+0.");
    EXPECT_EQ(shown("."), "0.");
}

TEST(Keypad, ImplicitMultiplication) {
    EXPECT_EQ(shown("5("), "5×(");
    EXPECT_EQ(shown("5r"), "5×√");
    EXPECT_EQ(shown("5+("), "5+(");
    EXPECT_EQ(shown("5+r"), "5+√");
    EXPECT_EQ(shown("2s3"), "2²×3");
}

TEST(Keypad, ParenthesesToggle) {
    EXPECT_EQ(shown("(2+3)"), "(2+3)");
    EXPECT_EQ(shown("(2+3)("), "(2+3)×(");
}

TEST(Keypad, UnaryMinusAfterOpenParen) {
    EXPECT_EQ(shown("(-"), "(−");
    EXPECT_EQ(shown("(*"), "(");
    EXPECT_EQ(shown("(-*"), "(−");
    EXPECT_EQ(shown("(-4)s="), "16");
}

TEST(Keypad, EqualsShowsResultAndChains) {
    auto s = feed("2+3=");
    EXPECT_EQ(calcexpr::display(s), "5");
    EXPECT_TRUE(s.awaiting_new_expression);

    s = feed("*2=", s);
    EXPECT_EQ(calcexpr::display(s), "10");

    s = feed("7", s);
    EXPECT_EQ(calcexpr::display(s), "7");
}

TEST(Keypad, Decorations) {
    EXPECT_EQ(shown("3s="), "9");
    EXPECT_EQ(shown("r9="), "3");
    EXPECT_EQ(shown("100+50%="), "100.5");
    EXPECT_EQ(shown("2s3="), "12");
    EXPECT_EQ(shown("7/2="), "3.5");
}

TEST(Keypad, SquareOfNegativeResult) {
    auto s = feed("0-3=");
    EXPECT_EQ(calcexpr::display(s), "-3");

    s = feed("s", s);
    EXPECT_EQ(calcexpr::display(s), "(-3)²");

    s = feed("=", s);
    EXPECT_EQ(calcexpr::display(s), "9");
}

TEST(Keypad, PercentOnlyAfterDigit) {
    EXPECT_EQ(shown("5+%"), "5+");
    EXPECT_EQ(shown("(5)%"), "(5)");
}

TEST(Keypad, ErrorIsTerminalUntilReset) {
    auto s = feed("5/0=");
    EXPECT_TRUE(s.error);
    EXPECT_EQ(calcexpr::display(s), "Error");

    s = feed("+.s%r(=", s);
    EXPECT_TRUE(s.error);
    EXPECT_EQ(calcexpr::display(s), "Error");

    s = feed("3", s);
    EXPECT_FALSE(s.error);
    EXPECT_EQ(calcexpr::display(s), "3");
}

TEST(Keypad, UnbalancedIsInvalidExpression) {
    auto s = feed("(2+3=");
    EXPECT_TRUE(s.error);
    EXPECT_EQ(calcexpr::display(s), "Invalid expression");

    s = feed("C", s);
    EXPECT_FALSE(s.error);
    EXPECT_EQ(calcexpr::display(s), "0");
}

TEST(Keypad, DeleteRemovesOneSymbol) {
    EXPECT_EQ(shown("12<"), "1");
    EXPECT_EQ(shown("5*<"), "5");
    EXPECT_EQ(shown("r<"), "0");

    auto s = feed("12<<");
    EXPECT_EQ(calcexpr::display(s), "0");
    EXPECT_TRUE(s.awaiting_new_expression);

    s = feed("5/0=<");
    EXPECT_FALSE(s.error);
    EXPECT_EQ(calcexpr::display(s), "0");
}

TEST(Keypad, TransitionsDoNotMutateInput) {
    calcexpr::KeypadState before = feed("12+");
    calcexpr::KeypadState after = calcexpr::press_digit(before, '4');
    EXPECT_EQ(before.text, "12+");
    EXPECT_EQ(after.text, "12+4");
}

TEST(Keypad, NonDigitKeepsErrorState) {
    auto s = feed("5/0=");
    auto t = calcexpr::press_digit(s, 'x');
    EXPECT_TRUE(t.error);
    EXPECT_EQ(calcexpr::display(t), "Error");
}

TEST(Keypad, UnknownKeyIsIgnored) {
    auto s = feed("12");
    auto t = calcexpr::press_key(s, 'x');
    EXPECT_EQ(t.text, s.text);
    EXPECT_EQ(t.awaiting_new_expression, s.awaiting_new_expression);
}

} // namespace
