#include "scicalc/expression_generator.hpp"

#include <array>
#include <cstdio>
#include <vector>

namespace {
// Группы совместимых единиц: сложение внутри группы корректно
const std::vector<std::vector<std::string>> kUnitGroups = {
    {"m", "km", "cm", "mi", "ft"},
    {"kg", "g", "lb", "oz"},
    {"s", "min", "h"},
    {"degC", "degF", "K"},
    {"L", "mL", "gal"},
};

constexpr std::array<char, 6> kOperators = {'+', '-', '*', '/', '^', '%'};

// Одноаргументные функции, которым подходит любое число
constexpr std::array<const char*, 4> kTotalFunctions = {"sin", "cos", "atan", "exp"};
}

ExpressionGenerator::ExpressionGenerator() : engine(std::random_device{}()) {}

ExpressionGenerator::ExpressionGenerator(unsigned seed) : engine(seed) {}

double ExpressionGenerator::chance() {
    return std::uniform_real_distribution<double>(0.0, 1.0)(engine);
}

std::size_t ExpressionGenerator::pick(std::size_t count) {
    return std::uniform_int_distribution<std::size_t>(0, count - 1)(engine);
}

std::string ExpressionGenerator::generateNumber(double low, double high) {
    double value = std::uniform_real_distribution<double>(low, high)(engine);
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f", value);
    return buffer;
}

std::string ExpressionGenerator::generate(int depth) {
    double roll = chance();
    if (roll < 0.2) {
        return introduceError(generateQuantity());
    }
    if (roll < 0.4) {
        return introduceError(generateFunctionCall(depth));
    }
    return introduceError(generateArithmetic(depth));
}

// Бинарное дерево операций над числами и вызовами функций
std::string ExpressionGenerator::generateArithmetic(int depth) {
    if (depth <= 0) {
        return generateNumber(-10.0, 10.0);
    }
    if (depth == 1 && chance() < 0.3) {
        return generateFunctionCall(0);
    }

    char op = kOperators[pick(kOperators.size())];
    std::string left = generateArithmetic(depth - 1);
    std::string right;
    switch (op) {
    case '^':
        // Небольшой целый показатель, чтобы не получить переполнение
        right = std::to_string(pick(4));
        break;
    case '/':
    case '%':
        // Изредка деление на ноль
        right = chance() < kErrorProbability * 0.3 ? "0" : generateNumber(1.0, 10.0);
        break;
    default:
        right = generateArithmetic(depth - 1);
        break;
    }
    return "(" + left + " " + op + " " + right + ")";
}

std::string ExpressionGenerator::generateFunctionCall(int depth) {
    switch (pick(6)) {
    case 0:
        return std::string(kTotalFunctions[pick(kTotalFunctions.size())]) + "(" + generateArithmetic(depth - 1) + ")";
    case 1:
        return std::string(chance() < 0.5 ? "asin" : "acos") + "(" + generateNumber(-0.99, 0.99) + ")";
    case 2:
        return std::string(chance() < 0.5 ? "sqrt" : "ln") + "(" + generateNumber(0.01, 100.0) + ")";
    case 3:
        return "log(" + generateNumber(1.0, 1000.0) + ", " + std::to_string(2 + pick(9)) + ")";
    case 4: {
        static const std::array<const char*, 5> statistics = {"mean", "median", "mode", "stdev", "variance"};
        std::string call = std::string(statistics[pick(statistics.size())]) + "([";
        std::size_t count = 2 + pick(5);
        for (std::size_t i = 0; i < count; ++i) {
            call += (i > 0 ? ", " : "") + generateNumber(-50.0, 50.0);
        }
        return call + "])";
    }
    default:
        return "pow(" + generateNumber(0.5, 5.0) + ", " + std::to_string(pick(5)) + ")";
    }
}

// Сумма двух совместимых величин, иногда с пересчётом: "2.50 km + 300.00 m to mi"
std::string ExpressionGenerator::generateQuantity() {
    const auto& group = kUnitGroups[pick(kUnitGroups.size())];
    std::string expression = generateNumber(0.0, 100.0) + " " + group[pick(group.size())] + " + " +
                             generateNumber(0.0, 100.0) + " " + group[pick(group.size())];
    if (chance() < 0.5) {
        expression += " to " + group[pick(group.size())];
    }
    return expression;
}

std::string ExpressionGenerator::introduceError(std::string expression) {
    if (chance() >= kErrorProbability) {
        return expression;
    }

    switch (pick(4)) {
    case 0: {
        // Незакрытая скобка: убираем последнюю закрывающую
        std::size_t position = expression.find_last_of(')');
        if (position != std::string::npos) {
            expression.erase(position, 1);
        }
        return expression;
    }
    case 1:
        // Недопустимый символ посередине
        expression.insert(expression.size() / 2, 1, "#$&@"[pick(4)]);
        return expression;
    case 2:
        // Лишняя открывающая скобка
        return "(" + expression;
    default:
        // Несовместимые размерности
        return "(" + expression + ") + 1 s * 1 kg";
    }
}
