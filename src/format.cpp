#include <calcexpr/format.hpp>

#include <cmath>

#include <fmt/format.h>

namespace calcexpr {

// Anything at or beyond 2^63 no longer fits a long long.
static constexpr double kIntegralLimit = 9223372036854775808.0;

std::string format(double value, const FormatOptions& options) {
    if (!std::isfinite(value)) return options.error_marker;

    if (std::trunc(value) == value && std::fabs(value) < kIntegralLimit) {
        return fmt::format("{}", static_cast<long long>(value));
    }

    std::string out = fmt::format("{:.{}f}", value, options.decimal_places < 0 ? 0 : options.decimal_places);
    if (out.find('.') != std::string::npos) {
        out.erase(out.find_last_not_of('0') + 1);
        if (out.back() == '.') out.pop_back();
    }
    if (out == "-0") out = "0";
    return out;
}

std::string format(const Result& result, const FormatOptions& options) {
    if (std::holds_alternative<Error>(result)) return options.error_marker;
    return format(std::get<double>(result), options);
}

} // namespace calcexpr
