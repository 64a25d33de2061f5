#include <calcexpr/preprocess.hpp>

#include <cctype>

namespace calcexpr {

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// -----------------------------
// Symbol substitution
// -----------------------------
struct Substitution {
    std::string_view from;
    std::string_view to;
};

static const Substitution kSubstitutions[] = {
    {kTimes, "*"},
    {kDivide, "/"},
    {kMinus, "-"},
    {kSquareRoot, "sqrt"},
    {kSquared, "^2"},
};

static std::string substitute_symbols(std::string_view raw) {
    std::string out;
    out.reserve(raw.size() + 8);

    std::size_t i = 0;
    while (i < raw.size()) {
        bool replaced = false;
        for (const auto& sub : kSubstitutions) {
            if (raw.substr(i, sub.from.size()) == sub.from) {
                out.append(sub.to);
                i += sub.from.size();
                replaced = true;
                break;
            }
        }
        if (!replaced) out.push_back(raw[i++]);
    }
    return out;
}

// -----------------------------
// Percentages
// -----------------------------

// Length of the numeric run (digits, at most one '.') ending at out.end(),
// or 0 when there is no usable run.
static std::size_t trailing_number_run(const std::string& out) {
    std::size_t n = 0;
    bool seen_point = false;
    bool seen_digit = false;
    while (n < out.size()) {
        char c = out[out.size() - 1 - n];
        if (is_digit(c)) {
            seen_digit = true;
        } else if (c == '.' && !seen_point) {
            seen_point = true;
        } else {
            break;
        }
        ++n;
    }
    if (!seen_digit || out.back() == '.') return 0;
    return n;
}

static std::string expand_percentages(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);

    for (char c : s) {
        if (c != '%') {
            out.push_back(c);
            continue;
        }
        std::size_t run = trailing_number_run(out);
        if (run == 0) {
            out.push_back(c); // left for the lexer to reject
            continue;
        }
        std::string number = out.substr(out.size() - run);
        out.resize(out.size() - run);
        out += "(" + number + "/100)";
    }
    return out;
}

std::string preprocess(std::string_view raw) {
    return expand_percentages(substitute_symbols(raw));
}

} // namespace calcexpr
