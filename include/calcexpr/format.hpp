#pragma once

#include <string>

#include <calcexpr/expr.hpp>

namespace calcexpr {

struct FormatOptions {
    int decimal_places{10};
    std::string error_marker{"Error"};
};

/// Display string for a result: integers without a decimal point,
/// fractions trimmed of trailing zeros, non-finite values as the marker.
std::string format(double value, const FormatOptions& options = {});
std::string format(const Result& result, const FormatOptions& options = {});

} // namespace calcexpr
