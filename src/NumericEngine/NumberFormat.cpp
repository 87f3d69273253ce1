#include "NumberFormat.hpp"

#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace minibasic {

constexpr double NumberFormat::PLAIN_LOWER;
constexpr double NumberFormat::PLAIN_UPPER;

std::string NumberFormat::format(double value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";
    if (value == 0.0) return std::signbit(value) ? "-0.0" : "0.0";

    std::string out;
    if (std::signbit(value)) out.push_back('-');

    double magnitude = std::fabs(value);
    DecimalDigits d = shortestDigits(magnitude);
    if (magnitude >= PLAIN_LOWER && magnitude < PLAIN_UPPER) {
        out += plainNotation(d);
    } else {
        out += scientificNotation(d);
    }
    return out;
}

std::string NumberFormat::scientificText(double magnitude, int significantDigits) {
    std::ostringstream oss;
    oss << std::scientific << std::setprecision(significantDigits - 1) << magnitude;
    return oss.str();
}

DecimalDigits NumberFormat::shortestDigits(double magnitude) {
    // 17 significant digits always round-trip an IEEE double
    std::string text;
    int precision = 1;
    for (; precision <= 17; ++precision) {
        text = scientificText(magnitude, precision);
        if (std::strtod(text.c_str(), nullptr) == magnitude) break;
    }

    // A nonzero second digit that also round-trips wins over a lone digit:
    // the smallest subnormal prints as "4.9E-324", not "5.0E-324"
    if (precision == 1) {
        std::string two = scientificText(magnitude, 2);
        if (two[2] != '0' && std::strtod(two.c_str(), nullptr) == magnitude) text = two;
    }

    // text looks like "d.ddde+XX" or "de-XX"
    DecimalDigits d;
    size_t ePos = text.find_first_of("eE");
    std::string mantissa = text.substr(0, ePos);
    for (char c : mantissa) {
        if (c >= '0' && c <= '9') d.digits.push_back(c);
    }
    d.exponent = ePos == std::string::npos ? 0 : std::atoi(text.c_str() + ePos + 1);

    while (d.digits.size() > 1 && d.digits.back() == '0') d.digits.pop_back();
    return d;
}

std::string NumberFormat::plainNotation(const DecimalDigits& d) {
    std::string out;
    if (d.exponent >= 0) {
        size_t intLen = static_cast<size_t>(d.exponent) + 1;
        if (d.digits.size() <= intLen) {
            out = d.digits + std::string(intLen - d.digits.size(), '0') + ".0";
        } else {
            out = d.digits.substr(0, intLen) + "." + d.digits.substr(intLen);
        }
    } else {
        out = "0." + std::string(static_cast<size_t>(-d.exponent - 1), '0') + d.digits;
    }
    return out;
}

std::string NumberFormat::scientificNotation(const DecimalDigits& d) {
    std::string out;
    out.push_back(d.digits[0]);
    out.push_back('.');
    out += d.digits.size() > 1 ? d.digits.substr(1) : std::string("0");
    out += "E" + std::to_string(d.exponent);
    return out;
}

} // namespace minibasic
