#include "scicalc/evaluator.hpp"

#include "scicalc/errors.hpp"
#include "scicalc/parser.hpp"

namespace scicalc {

EvaluationContext::EvaluationContext(const UnitRegistry& units, const FunctionRegistry& functions,
                                     std::size_t maxDepth)
    : unitRegistry(units), functionRegistry(functions), maxDepth(maxDepth) {}

EvaluationContext::DepthGuard EvaluationContext::enter(std::size_t position) {
    if (currentDepth >= maxDepth) {
        throw EvaluationError("maximum nesting depth exceeded",
                              {{"limit", std::to_string(maxDepth)}, {"position", std::to_string(position)}},
                              "simplify the expression");
    }
    return DepthGuard(*this);
}

// Полный цикл обработки выражения:
// 1. Токенизация и парсинг (parse) -> построение AST
// 2. Вычисление (evaluate) -> получение значения
Value ExpressionEvaluator::evaluate(const std::string& expression) const {
    auto ast = parse(expression);
    return evaluate(*ast);
}

Value ExpressionEvaluator::evaluate(const AstNode& root) const {
    EvaluationContext context(units, functions);
    return root.evaluate(context);
}

} // namespace scicalc
