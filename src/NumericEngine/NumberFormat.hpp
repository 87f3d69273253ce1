#pragma once

#include <string>

namespace minibasic {

// Decomposed shortest round-trip decimal form of a finite, nonzero magnitude:
// value == 0.d1d2...dn * 10^(exponent + 1), i.e. d1.d2...dn * 10^exponent
struct DecimalDigits {
    std::string digits; // no leading or trailing zeros, at least one digit
    int exponent{0};
};

/**
 * NumberFormat
 *
 * Renders doubles the way PRINT and assignment echoes show them:
 * always with a decimal point ("14.0"), plain notation for magnitudes in
 * [1e-3, 1e7), computerized scientific notation otherwise ("1.0E7",
 * "2.5E-4"), and "NaN", "Infinity", "-Infinity" for IEEE specials.
 */
class NumberFormat {
public:
    static constexpr double PLAIN_LOWER = 1e-3;
    static constexpr double PLAIN_UPPER = 1e7;

    static std::string format(double value);

    // Shortest digit string that parses back to exactly `magnitude`.
    // Requires a finite, positive argument.
    static DecimalDigits shortestDigits(double magnitude);

private:
    // "d.ddde+XX" with the given number of significant digits
    static std::string scientificText(double magnitude, int significantDigits);
    static std::string plainNotation(const DecimalDigits& d);
    static std::string scientificNotation(const DecimalDigits& d);
};

} // namespace minibasic
