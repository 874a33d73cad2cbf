#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "scicalc/errors.hpp"
#include "scicalc/evaluator.hpp"
#include "scicalc/function_registry.hpp"
#include "scicalc/unit_registry.hpp"

namespace scicalc {

// Описание ошибки в ответе калькулятора
struct ErrorInfo {
    ErrorKind kind;
    std::string message;
    CalcError::Context context;
    std::string hint;
};

// Результат операции: либо значение с единицей, либо ошибка
struct CalculationResult {
    std::optional<double> value;
    std::string unit; // Пусто для безразмерного результата
    std::optional<ErrorInfo> error;

    bool ok() const { return !error.has_value(); }

    static CalculationResult success(double value, std::string unit = {});
    static CalculationResult failure(const CalcError& error);
};

// Внешний интерфейс вычислителя.
// Владеет реестрами единиц и функций. Все методы константные, поэтому
// один экземпляр разделяется между потоками без блокировок.
// Ошибки вычислителя возвращаются в CalculationResult, исключения других
// типов (например, нехватка памяти) пробрасываются дальше.
class Calculator {
public:
    Calculator();

    Calculator(const Calculator&) = delete;
    Calculator& operator=(const Calculator&) = delete;

    // Вычисление выражения: "sin(30) * 2 + 5", "5 km to mi"
    CalculationResult evaluate(const std::string& expression) const;

    // Прямой пересчёт значения между единицами
    CalculationResult convert(double value, const std::string& fromUnit, const std::string& toUnit) const;

    // Каталоги для справки
    UnitCatalog listUnits() const;
    FunctionCatalog listFunctions() const;

    // Применение одной функции к числовым аргументам: ("log", {8, 2}) -> 3
    CalculationResult evaluateFunction(const std::string& name, const std::vector<double>& arguments) const;

    const UnitRegistry& units() const { return unitRegistry; }
    const FunctionRegistry& functions() const { return functionRegistry; }

private:
    UnitRegistry unitRegistry;
    FunctionRegistry functionRegistry;
    ExpressionEvaluator evaluator;
};

} // namespace scicalc
