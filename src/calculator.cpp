#include "scicalc/calculator.hpp"

#include "scicalc/ast.hpp"

#include <cmath>
#include <memory>

namespace scicalc {

CalculationResult CalculationResult::success(double value, std::string unit) {
    CalculationResult result;
    result.value = value;
    result.unit = std::move(unit);
    return result;
}

CalculationResult CalculationResult::failure(const CalcError& error) {
    CalculationResult result;
    result.error = ErrorInfo{error.kind(), error.message(), error.context(), error.hint()};
    return result;
}

Calculator::Calculator() : evaluator(unitRegistry, functionRegistry) {}

CalculationResult Calculator::evaluate(const std::string& expression) const {
    try {
        Value value = evaluator.evaluate(expression);
        return CalculationResult::success(value.magnitude(), value.unitLabel());
    }
    catch (const CalcError& e) {
        return CalculationResult::failure(e);
    }
}

CalculationResult Calculator::convert(double value, const std::string& fromUnit, const std::string& toUnit) const {
    try {
        if (!std::isfinite(value)) {
            throw EvaluationError("value must be a finite number", {{"value", formatNumber(value)}});
        }
        double converted = unitRegistry.convert(value, fromUnit, toUnit);
        return CalculationResult::success(converted, unitRegistry.lookup(toUnit)->symbol);
    }
    catch (const CalcError& e) {
        return CalculationResult::failure(e);
    }
}

UnitCatalog Calculator::listUnits() const {
    return unitRegistry.listByCategory();
}

FunctionCatalog Calculator::listFunctions() const {
    return functionRegistry.listByCategory();
}

// Вызов строится как дерево из одного узла функции с числовыми
// аргументами, поэтому проверки совпадают с вычислением выражения.
CalculationResult Calculator::evaluateFunction(const std::string& name, const std::vector<double>& arguments) const {
    std::vector<AstNodePtr> nodes;
    nodes.reserve(arguments.size());
    for (double argument : arguments) {
        nodes.push_back(std::make_unique<NumberNode>(argument, 0));
    }
    CallNode call(name, std::move(nodes), 0);

    try {
        Value value = evaluator.evaluate(call);
        return CalculationResult::success(value.magnitude());
    }
    catch (const CalcError& e) {
        return CalculationResult::failure(e);
    }
}

} // namespace scicalc
