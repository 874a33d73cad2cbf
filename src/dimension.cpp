#include "scicalc/dimension.hpp"

#include <cmath>
#include <vector>

namespace scicalc {

namespace {
// Допуск при проверке целочисленности показателя
constexpr double kExponentTolerance = 1e-9;

// Обозначения базовых единиц СИ в порядке вывода (масса первой: kg*m/s^2)
struct BaseSymbol {
    BaseDimension base;
    const char* symbol;
};

constexpr std::array<BaseSymbol, kBaseDimensionCount> kDisplayOrder = {{
    {BaseDimension::Mass, "kg"},
    {BaseDimension::Length, "m"},
    {BaseDimension::Time, "s"},
    {BaseDimension::Temperature, "K"},
    {BaseDimension::Current, "A"},
}};

std::string joinFactors(const std::vector<std::string>& factors) {
    std::string result;
    for (std::size_t i = 0; i < factors.size(); ++i) {
        if (i > 0) {
            result += '*';
        }
        result += factors[i];
    }
    return result;
}
}

Dimension Dimension::of(BaseDimension base, int power) {
    Dimension result;
    result.exponents[static_cast<std::size_t>(base)] = power;
    return result;
}

bool Dimension::isDimensionless() const {
    for (int value : exponents) {
        if (value != 0) {
            return false;
        }
    }
    return true;
}

Dimension Dimension::operator*(const Dimension& other) const {
    Dimension result;
    for (std::size_t i = 0; i < kBaseDimensionCount; ++i) {
        result.exponents[i] = exponents[i] + other.exponents[i];
    }
    return result;
}

Dimension Dimension::operator/(const Dimension& other) const {
    Dimension result;
    for (std::size_t i = 0; i < kBaseDimensionCount; ++i) {
        result.exponents[i] = exponents[i] - other.exponents[i];
    }
    return result;
}

std::optional<Dimension> Dimension::raisedTo(double power) const {
    Dimension result;
    for (std::size_t i = 0; i < kBaseDimensionCount; ++i) {
        double scaled = exponents[i] * power;
        double rounded = std::round(scaled);
        if (std::abs(scaled - rounded) > kExponentTolerance) {
            return std::nullopt;
        }
        result.exponents[i] = static_cast<int>(rounded);
    }
    return result;
}

std::string Dimension::toString() const {
    std::vector<std::string> numerator;
    std::vector<std::string> denominator;
    for (const auto& [base, symbol] : kDisplayOrder) {
        int power = exponent(base);
        if (power == 0) {
            continue;
        }
        std::string factor = symbol;
        int magnitude = power > 0 ? power : -power;
        if (magnitude != 1) {
            factor += "^" + std::to_string(magnitude);
        }
        (power > 0 ? numerator : denominator).push_back(factor);
    }

    if (numerator.empty() && denominator.empty()) {
        return "";
    }
    std::string result = numerator.empty() ? "1" : joinFactors(numerator);
    if (!denominator.empty()) {
        result += "/" + joinFactors(denominator);
    }
    return result;
}

} // namespace scicalc
