#include <calcexpr/token.hpp>

namespace calcexpr {

std::string to_string(const std::vector<Token>& tokens) {
    std::string out;
    for (const auto& t : tokens) {
        if (!out.empty()) out += ' ';
        if (t.kind == TokKind::Neg) out += "neg";
        else out += t.text;
    }
    return out;
}

} // namespace calcexpr
