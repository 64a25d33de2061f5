#pragma once
#include <string>
#include <string_view>

namespace calcexpr {

// Display symbols as typed by the keypad (UTF-8).
inline constexpr std::string_view kTimes      = "\xC3\x97";     // ×
inline constexpr std::string_view kDivide     = "\xC3\xB7";     // ÷
inline constexpr std::string_view kMinus      = "\xE2\x88\x92"; // −
inline constexpr std::string_view kSquareRoot = "\xE2\x88\x9A"; // √
inline constexpr std::string_view kSquared    = "\xC2\xB2";     // ²

/// Rewrite display symbols into calculation symbols and expand
/// percentages ("50%" -> "(50/100)"). Never fails; a stray '%' is kept
/// and rejected later by the lexer.
std::string preprocess(std::string_view raw);

} // namespace calcexpr
