#include "scicalc/function_registry.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <numbers>
#include <numeric>

namespace scicalc {

namespace {
// Точность сравнения вещественных чисел с нулём
constexpr double kEpsilon = 1e-12;

constexpr double kDegreesPerRadian = 180.0 / std::numbers::pi;

double toRadians(double degrees) {
    return degrees / kDegreesPerRadian;
}

double toDegrees(double radians) {
    return radians * kDegreesPerRadian;
}

std::string toLower(std::string_view text) {
    std::string result(text);
    for (char& ch : result) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return result;
}

// Типовые ограничения
const ParameterDomain kPositive{"x > 0", [](double x) { return x > 0.0; }};
const ParameterDomain kNonNegative{"x >= 0", [](double x) { return x >= 0.0; }};
const ParameterDomain kUnitInterval{"-1 <= x <= 1", [](double x) { return x >= -1.0 && x <= 1.0; }};
const ParameterDomain kLogBase{"base > 0 and base != 1", [](double b) { return b > 0.0 && b != 1.0; }};
const ArgumentsDomain kTwoSamples{"at least two values",
                                  [](const std::vector<double>& values) { return values.size() >= 2; }};

double mean(const std::vector<double>& values) {
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double median(std::vector<double> values) {
    std::sort(values.begin(), values.end());
    std::size_t middle = values.size() / 2;
    if (values.size() % 2 == 0) {
        return (values[middle - 1] + values[middle]) / 2.0;
    }
    return values[middle];
}

// Наиболее частое значение; при равенстве частот: встретившееся первым
double mode(const std::vector<double>& values) {
    double best = values.front();
    std::size_t bestCount = 0;
    for (std::size_t i = 0; i < values.size(); ++i) {
        auto count = static_cast<std::size_t>(std::count(values.begin(), values.end(), values[i]));
        if (count > bestCount) {
            best = values[i];
            bestCount = count;
        }
    }
    return best;
}

// Выборочная дисперсия (делитель n - 1)
double variance(const std::vector<double>& values) {
    double average = mean(values);
    double sum = 0.0;
    for (double value : values) {
        sum += (value - average) * (value - average);
    }
    return sum / static_cast<double>(values.size() - 1);
}
}

std::string Arity::describe() const {
    if (max == kUnbounded) {
        return "at least " + std::to_string(min);
    }
    if (min == max) {
        return std::to_string(min);
    }
    return std::to_string(min) + " to " + std::to_string(max);
}

const ParameterDomain* ScientificFunction::parameterDomain(std::size_t index) const {
    if (parameters.empty()) {
        return nullptr;
    }
    if (index < parameters.size()) {
        return &parameters[index];
    }
    return arity.max == Arity::kUnbounded ? &parameters.back() : nullptr;
}

FunctionRegistry::FunctionRegistry() {
    registerTrigonometric();
    registerLogarithmic();
    registerExponential();
    registerStatistical();
}

void FunctionRegistry::add(ScientificFunction function) {
    index.emplace(function.name, functions.size());
    functions.push_back(std::move(function));
}

// Тригонометрические функции работают в градусах
void FunctionRegistry::registerTrigonometric() {
    add({"sin", "trigonometric", "Sine (argument in degrees)", Arity::exactly(1), {}, {},
         [](const std::vector<double>& a) { return std::sin(toRadians(a[0])); }});
    add({"cos", "trigonometric", "Cosine (argument in degrees)", Arity::exactly(1), {}, {},
         [](const std::vector<double>& a) { return std::cos(toRadians(a[0])); }});

    // Тангенс не определён там, где косинус обращается в ноль
    ParameterDomain notOddRightAngle{"x is not an odd multiple of 90 degrees",
                                     [](double x) { return std::abs(std::cos(toRadians(x))) >= kEpsilon; }};
    add({"tan", "trigonometric", "Tangent (argument in degrees)", Arity::exactly(1), {notOddRightAngle}, {},
         [](const std::vector<double>& a) { return std::tan(toRadians(a[0])); }});

    add({"asin", "trigonometric", "Arcsine in degrees (domain: [-1, 1])", Arity::exactly(1), {kUnitInterval}, {},
         [](const std::vector<double>& a) { return toDegrees(std::asin(a[0])); }});
    add({"acos", "trigonometric", "Arccosine in degrees (domain: [-1, 1])", Arity::exactly(1), {kUnitInterval}, {},
         [](const std::vector<double>& a) { return toDegrees(std::acos(a[0])); }});
    add({"atan", "trigonometric", "Arctangent in degrees", Arity::exactly(1), {}, {},
         [](const std::vector<double>& a) { return toDegrees(std::atan(a[0])); }});
}

void FunctionRegistry::registerLogarithmic() {
    // log(x) десятичный, log(x, base) по произвольному основанию
    add({"log", "logarithmic", "Base-10 logarithm, or log(x, base) (domain: x > 0)", Arity::between(1, 2),
         {kPositive, kLogBase}, {},
         [](const std::vector<double>& a) {
             return a.size() == 1 ? std::log10(a[0]) : std::log(a[0]) / std::log(a[1]);
         }});
    add({"log10", "logarithmic", "Base-10 logarithm (domain: x > 0)", Arity::exactly(1), {kPositive}, {},
         [](const std::vector<double>& a) { return std::log10(a[0]); }});
    add({"log2", "logarithmic", "Base-2 logarithm (domain: x > 0)", Arity::exactly(1), {kPositive}, {},
         [](const std::vector<double>& a) { return std::log2(a[0]); }});
    add({"ln", "logarithmic", "Natural logarithm (domain: x > 0)", Arity::exactly(1), {kPositive}, {},
         [](const std::vector<double>& a) { return std::log(a[0]); }});
}

void FunctionRegistry::registerExponential() {
    add({"exp", "exponential", "Exponential function (e^x)", Arity::exactly(1), {}, {},
         [](const std::vector<double>& a) { return std::exp(a[0]); }});
    add({"sqrt", "exponential", "Square root (domain: x >= 0)", Arity::exactly(1), {kNonNegative}, {},
         [](const std::vector<double>& a) { return std::sqrt(a[0]); }});

    ArgumentsDomain nonZeroBase{"base != 0 when exponent < 0", [](const std::vector<double>& a) {
                                    return !(a[0] == 0.0 && a[1] < 0.0);
                                }};
    ArgumentsDomain integralExponent{"integer exponent when base < 0", [](const std::vector<double>& a) {
                                         return !(a[0] < 0.0 && a[1] != std::floor(a[1]));
                                     }};
    add({"pow", "exponential", "Power function (x^y)", Arity::exactly(2), {}, {nonZeroBase, integralExponent},
         [](const std::vector<double>& a) { return std::pow(a[0], a[1]); }});
}

// Статистические функции принимают список значений переменной длины
void FunctionRegistry::registerStatistical() {
    add({"mean", "statistical", "Arithmetic mean of values", Arity::atLeast(1), {}, {},
         [](const std::vector<double>& a) { return mean(a); }});
    add({"median", "statistical", "Median of values", Arity::atLeast(1), {}, {},
         [](const std::vector<double>& a) { return median(a); }});
    add({"mode", "statistical", "Most frequent value", Arity::atLeast(1), {}, {},
         [](const std::vector<double>& a) { return mode(a); }});
    add({"stdev", "statistical", "Sample standard deviation (at least two values)", Arity::atLeast(1), {},
         {kTwoSamples}, [](const std::vector<double>& a) { return std::sqrt(variance(a)); }});
    add({"variance", "statistical", "Sample variance (at least two values)", Arity::atLeast(1), {},
         {kTwoSamples}, [](const std::vector<double>& a) { return variance(a); }});
}

const ScientificFunction* FunctionRegistry::get(std::string_view name) const {
    auto it = index.find(toLower(name));
    return it == index.end() ? nullptr : &functions[it->second];
}

FunctionCatalog FunctionRegistry::listByCategory() const {
    FunctionCatalog catalog;
    for (const auto& function : functions) {
        catalog[function.category].push_back(function.name);
    }
    return catalog;
}

std::map<std::string, std::string> FunctionRegistry::describeAll() const {
    std::map<std::string, std::string> descriptions;
    for (const auto& function : functions) {
        descriptions.emplace(function.name, function.description);
    }
    return descriptions;
}

} // namespace scicalc
