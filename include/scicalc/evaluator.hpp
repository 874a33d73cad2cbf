#pragma once

#include <cstddef>
#include <string>

#include "scicalc/ast.hpp"
#include "scicalc/function_registry.hpp"
#include "scicalc/unit_registry.hpp"
#include "scicalc/value.hpp"

namespace scicalc {

// Максимальная длина входного выражения в символах
constexpr std::size_t kMaxExpressionLength = 1000;

// Максимальная глубина вложенности узлов при вычислении
constexpr std::size_t kMaxEvaluationDepth = 50;

// Контекст одного вычисления: ссылки на реестры и счётчик глубины.
// Создаётся на каждый запрос, между потоками не разделяется.
class EvaluationContext {
public:
    // Увеличивает глубину на время жизни объекта
    class DepthGuard {
    public:
        explicit DepthGuard(EvaluationContext& context) : context(context) { ++context.currentDepth; }
        ~DepthGuard() { --context.currentDepth; }

        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        EvaluationContext& context;
    };

    EvaluationContext(const UnitRegistry& units, const FunctionRegistry& functions,
                      std::size_t maxDepth = kMaxEvaluationDepth);

    const UnitRegistry& units() const { return unitRegistry; }
    const FunctionRegistry& functions() const { return functionRegistry; }

    std::size_t depth() const { return currentDepth; }

    // Вход в узел. Выбрасывает EvaluationError при превышении предела.
    [[nodiscard]] DepthGuard enter(std::size_t position);

private:
    const UnitRegistry& unitRegistry;
    const FunctionRegistry& functionRegistry;
    std::size_t maxDepth;
    std::size_t currentDepth = 0;
};

// Класс-фасад для вычисления математических выражений.
// Объединяет этапы токенизации, парсинга и вычисления AST.
// Не владеет реестрами; сам по себе не хранит изменяемого состояния,
// поэтому один экземпляр можно вызывать из нескольких потоков.
class ExpressionEvaluator {
public:
    ExpressionEvaluator(const UnitRegistry& units, const FunctionRegistry& functions)
        : units(units), functions(functions) {}

    // Вычисляет значение выражения, заданного строкой.
    // Пример: "2 + 2 * 2" -> 6.0
    // Выбрасывает исключения CalcError в случае ошибок синтаксиса или вычисления.
    Value evaluate(const std::string& expression) const;

    // Вычисляет уже построенное дерево
    Value evaluate(const AstNode& root) const;

private:
    const UnitRegistry& units;
    const FunctionRegistry& functions;
};

} // namespace scicalc
