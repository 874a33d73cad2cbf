#include "scicalc/ast.hpp"

#include "scicalc/errors.hpp"
#include "scicalc/evaluator.hpp"

#include <cmath>
#include <numbers>
#include <vector>

namespace scicalc {

namespace {
// Именованные математические константы
struct Constant {
    const char* name;
    double value;
};

constexpr Constant kConstants[] = {
    {"pi", std::numbers::pi},
    {"e", std::numbers::e},
    {"tau", 2.0 * std::numbers::pi},
};

std::string operatorName(char op) {
    return std::string(1, op);
}

// Любой бесконечный или NaN результат арифметики считается переполнением
double finite(double value, char op) {
    if (!std::isfinite(value)) {
        throw EvaluationError("numeric overflow", {{"operator", operatorName(op)}});
    }
    return value;
}

// Описание операнда для контекста ошибок: "5 m" или "5"
std::string describeOperand(const Value& value) {
    return value.toString();
}

std::string describeDimension(const Dimension& dimension) {
    std::string text = dimension.toString();
    return text.empty() ? "dimensionless" : text;
}

bool isIntegral(double value) {
    return std::floor(value) == value;
}

[[noreturn]] void divisionByZero(const Value& left, const Value& right, char op) {
    throw EvaluationError("division by zero", {{"left", describeOperand(left)},
                                               {"right", describeOperand(right)},
                                               {"operator", operatorName(op)}});
}

// Сложение и вычитание: размерности обязаны совпадать
Value addOrSubtract(char op, const Value& left, const Value& right, const UnitRegistry& units) {
    if (left.dimension() != right.dimension()) {
        throw DimensionalityError(
            "cannot " + std::string(op == '+' ? "add" : "subtract") + " quantities of different dimensions",
            {{"left", describeOperand(left)},
             {"right", describeOperand(right)},
             {"left_dimension", describeDimension(left.dimension())},
             {"right_dimension", describeDimension(right.dimension())},
             {"operator", operatorName(op)}},
            "convert both operands to compatible units");
    }
    auto combine = [op](double a, double b) { return finite(op == '+' ? a + b : a - b, op); };

    if (left.isScalar()) {
        return Value::scalar(combine(left.magnitude(), right.magnitude()));
    }

    // Результат выражается в именованной единице левого операнда
    if (const Unit* target = left.unit()) {
        double rightInTarget = right.unit() != nullptr ? units.convert(right.magnitude(), *right.unit(), *target)
                                                       : target->fromBase(right.baseMagnitude());
        return Value::quantity(combine(left.magnitude(), rightInTarget), *target);
    }
    return Value::fromBase(combine(left.baseMagnitude(), right.baseMagnitude()), left.dimension(), units);
}

// Умножение и деление
Value multiplyOrDivide(char op, const Value& left, const Value& right, const UnitRegistry& units) {
    bool divide = op == '/';
    if (divide && right.magnitude() == 0.0) {
        divisionByZero(left, right, op);
    }
    auto combine = [op, divide](double a, double b) { return finite(divide ? a / b : a * b, op); };

    if (left.isScalar() && right.isScalar()) {
        return Value::scalar(combine(left.magnitude(), right.magnitude()));
    }
    // Безразмерный множитель сохраняет именованную единицу: 2 * 3 km = 6 km
    if (right.isScalar() && left.unit() != nullptr) {
        return Value::quantity(combine(left.magnitude(), right.magnitude()), *left.unit());
    }
    if (!divide && left.isScalar() && right.unit() != nullptr) {
        return Value::quantity(combine(left.magnitude(), right.magnitude()), *right.unit());
    }

    Dimension dimension = divide ? left.dimension() / right.dimension() : left.dimension() * right.dimension();
    return Value::fromBase(combine(left.baseMagnitude(), right.baseMagnitude()), dimension, units);
}

// Возведение в степень: показатель безразмерный, размерность остаётся целой
Value power(const Value& base, const Value& exponent, const UnitRegistry& units) {
    if (!exponent.isScalar()) {
        throw DimensionalityError("exponent must be dimensionless",
                                  {{"exponent", describeOperand(exponent)}, {"operator", "^"}});
    }
    double e = exponent.magnitude();
    std::optional<Dimension> dimension = base.dimension().raisedTo(e);
    if (!dimension) {
        throw DimensionalityError("non-integral power of a dimensioned quantity",
                                  {{"base", describeOperand(base)}, {"exponent", formatNumber(e)}, {"operator", "^"}});
    }

    double b = base.isScalar() ? base.magnitude() : base.baseMagnitude();
    if (b == 0.0 && e < 0.0) {
        divisionByZero(base, exponent, '^');
    }
    if (b < 0.0 && !isIntegral(e)) {
        throw DomainError("negative base with a non-integral exponent",
                          {{"base", formatNumber(b)}, {"exponent", formatNumber(e)}, {"operator", "^"}},
                          "complex results are not supported");
    }
    return Value::fromBase(finite(std::pow(b, e), '^'), *dimension, units);
}

// Остаток от деления с округлением вниз: знак результата совпадает со знаком делителя
Value modulo(const Value& left, const Value& right) {
    if (!left.isScalar() || !right.isScalar()) {
        throw DimensionalityError("modulo requires dimensionless operands",
                                  {{"left", describeOperand(left)}, {"right", describeOperand(right)},
                                   {"operator", "%"}});
    }
    double divisor = right.magnitude();
    if (divisor == 0.0) {
        divisionByZero(left, right, '%');
    }
    double remainder = std::fmod(left.magnitude(), divisor);
    if (remainder != 0.0 && ((remainder < 0.0) != (divisor < 0.0))) {
        remainder += divisor;
    }
    return Value::scalar(finite(remainder, '%'));
}
}

// Вычисление числовой константы
Value NumberNode::evaluate(EvaluationContext& context) const {
    auto guard = context.enter(position());
    return Value::scalar(value);
}

std::string NumberNode::toString() const {
    return formatNumber(value);
}

// Имя разрешается сначала как константа, затем как единица измерения
Value IdentifierNode::evaluate(EvaluationContext& context) const {
    auto guard = context.enter(position());
    for (const auto& constant : kConstants) {
        if (name == constant.name) {
            return Value::scalar(constant.value);
        }
    }
    if (const Unit* unit = context.units().lookup(name)) {
        return Value::quantity(1.0, *unit);
    }
    throw EvaluationError("unknown identifier '" + name + "'",
                          {{"identifier", name}, {"position", std::to_string(position())}},
                          "use a constant (pi, e, tau) or a unit from the unit list");
}

// Вычисление унарной операции
Value UnaryNode::evaluate(EvaluationContext& context) const {
    auto guard = context.enter(position());
    Value operandValue = child->evaluate(context);
    if (op == '+') {
        return operandValue; // Унарный плюс ничего не меняет
    }

    // Унарный минус инвертирует знак и сохраняет единицу
    if (operandValue.isScalar()) {
        return Value::scalar(-operandValue.magnitude());
    }
    if (const Unit* unit = operandValue.unit()) {
        return Value::quantity(-operandValue.magnitude(), *unit);
    }
    return Value::fromBase(-operandValue.magnitude(), operandValue.dimension(), context.units());
}

std::string UnaryNode::toString() const {
    return "(" + operatorName(op) + " " + child->toString() + ")";
}

// Вычисление бинарной операции.
// Левая ветвь цепочки "1 + 2 + 3 + ..." обходится циклом: плоское выражение
// любой длины занимает один уровень глубины, рекурсия идёт только в правые
// операнды.
Value BinaryNode::evaluate(EvaluationContext& context) const {
    auto guard = context.enter(position());

    std::vector<const BinaryNode*> chain{this};
    const AstNode* leftmost = left.get();
    while (leftmost->kind() == NodeKind::Binary) {
        const auto* node = static_cast<const BinaryNode*>(leftmost);
        chain.push_back(node);
        leftmost = node->left.get();
    }

    Value accumulated = leftmost->evaluate(context);
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        Value rightValue = (*it)->right->evaluate(context);
        accumulated = (*it)->apply(accumulated, rightValue, context);
    }
    return accumulated;
}

Value BinaryNode::apply(const Value& leftValue, const Value& rightValue, EvaluationContext& context) const {
    switch (op) {
    case '+':
    case '-':
        return addOrSubtract(op, leftValue, rightValue, context.units());
    case '*':
    case '/':
        return multiplyOrDivide(op, leftValue, rightValue, context.units());
    case '^':
        return power(leftValue, rightValue, context.units());
    case '%':
        return modulo(leftValue, rightValue);
    default:
        throw EvaluationError("unknown binary operator", {{"operator", operatorName(op)}});
    }
}

std::string BinaryNode::toString() const {
    return "(" + operatorName(op) + " " + left->toString() + " " + right->toString() + ")";
}

// Вызов функции из белого списка.
// Порядок проверок: имя, число аргументов, затем каждый аргумент по очереди
// и, наконец, ограничения на весь список.
Value CallNode::evaluate(EvaluationContext& context) const {
    auto guard = context.enter(position());

    const ScientificFunction* target = context.functions().get(name);
    if (target == nullptr) {
        throw EvaluationError("unknown function '" + name + "'",
                              {{"function", name}, {"position", std::to_string(position())}},
                              "see the function list for supported names");
    }
    if (!target->arity.accepts(arguments.size())) {
        throw EvaluationError("function '" + target->name + "' expects " + target->arity.describe() +
                                  " argument(s), got " + std::to_string(arguments.size()),
                              {{"function", target->name}, {"arguments", std::to_string(arguments.size())}});
    }

    std::vector<double> values;
    values.reserve(arguments.size());
    for (std::size_t i = 0; i < arguments.size(); ++i) {
        Value argument = arguments[i]->evaluate(context);
        if (!argument.isScalar()) {
            throw DomainError("function '" + target->name + "' requires dimensionless arguments",
                              {{"function", target->name},
                               {"argument", std::to_string(i + 1)},
                               {"value", argument.toString()}},
                              "convert the argument to a plain number first");
        }
        double x = argument.magnitude();
        const ParameterDomain* domain = target->parameterDomain(i);
        if (domain != nullptr && !domain->holds(x)) {
            throw DomainError(target->name + " is undefined for " + formatNumber(x) + ": requires " +
                                  domain->constraint,
                              {{"function", target->name},
                               {"argument", std::to_string(i + 1)},
                               {"value", formatNumber(x)},
                               {"constraint", domain->constraint}});
        }
        values.push_back(x);
    }

    for (const auto& rule : target->argumentRules) {
        if (!rule.holds(values)) {
            throw DomainError(target->name + " requires " + rule.constraint,
                              {{"function", target->name},
                               {"arguments", std::to_string(values.size())},
                               {"constraint", rule.constraint}});
        }
    }

    double result = target->implementation(values);
    if (!std::isfinite(result)) {
        throw EvaluationError("numeric overflow", {{"function", target->name}});
    }
    return Value::scalar(result);
}

std::string CallNode::toString() const {
    std::string result = name + "(";
    for (std::size_t i = 0; i < arguments.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += arguments[i]->toString();
    }
    return result + ")";
}

// Пересчёт значения в указанную единицу
Value ConversionNode::evaluate(EvaluationContext& context) const {
    auto guard = context.enter(position());
    Value sourceValue = source->evaluate(context);

    const Unit* target = context.units().lookup(unit);
    if (target == nullptr) {
        throw EvaluationError("unknown unit '" + unit + "'", {{"unit", unit}},
                              "see the unit list for supported symbols");
    }
    if (sourceValue.isScalar()) {
        throw DimensionalityError("cannot convert a dimensionless value to '" + target->symbol + "'",
                                  {{"value", sourceValue.toString()}, {"to_unit", target->symbol}},
                                  "attach a unit to the value, e.g. 5 km to mi");
    }
    if (sourceValue.dimension() != target->dimension) {
        throw DimensionalityError("cannot convert between incompatible units",
                                  {{"from_unit", sourceValue.unitLabel()},
                                   {"to_unit", target->symbol},
                                   {"from_dimension", describeDimension(sourceValue.dimension())},
                                   {"to_dimension", describeDimension(target->dimension)}});
    }

    double converted = sourceValue.unit() != nullptr
                           ? context.units().convert(sourceValue.magnitude(), *sourceValue.unit(), *target)
                           : target->fromBase(sourceValue.baseMagnitude());
    if (!std::isfinite(converted)) {
        throw EvaluationError("numeric overflow", {{"operator", "to"}, {"to_unit", target->symbol}});
    }
    return Value::quantity(converted, *target);
}

std::string ConversionNode::toString() const {
    return "(to " + source->toString() + " " + unit + ")";
}

} // namespace scicalc
