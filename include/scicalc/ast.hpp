#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "scicalc/value.hpp"

namespace scicalc {

class EvaluationContext;

// Закрытый набор видов узлов дерева
enum class NodeKind { Number, Identifier, Unary, Binary, Call, Conversion };

// Базовый класс для узла абстрактного синтаксического дерева (AST).
// Каждый узел единолично владеет своими потомками, дерево ацикличное.
class AstNode {
public:
    explicit AstNode(std::size_t position) : sourcePosition(position) {}
    virtual ~AstNode() = default;

    AstNode(const AstNode&) = delete;
    AstNode& operator=(const AstNode&) = delete;

    virtual NodeKind kind() const = 0;

    // Рекурсивно вычисляет значение поддерева.
    // Имена разрешаются через реестры контекста только на этом этапе.
    virtual Value evaluate(EvaluationContext& context) const = 0;

    // S-выражение для диагностики: "(+ 2 (* 3 4))"
    virtual std::string toString() const = 0;

    // Позиция начала узла во входной строке
    std::size_t position() const { return sourcePosition; }

private:
    std::size_t sourcePosition;
};

using AstNodePtr = std::unique_ptr<AstNode>;

// Узел, представляющий числовую константу (лист дерева)
class NumberNode final : public AstNode {
public:
    NumberNode(double value, std::size_t position) : AstNode(position), value(value) {}

    NodeKind kind() const override { return NodeKind::Number; }
    Value evaluate(EvaluationContext& context) const override;
    std::string toString() const override;

    double number() const { return value; }

private:
    double value;
};

// Имя константы (pi, e) или единицы измерения (meter, kg)
class IdentifierNode final : public AstNode {
public:
    IdentifierNode(std::string name, std::size_t position) : AstNode(position), name(std::move(name)) {}

    NodeKind kind() const override { return NodeKind::Identifier; }
    Value evaluate(EvaluationContext& context) const override;
    std::string toString() const override { return name; }

    const std::string& identifier() const { return name; }

private:
    std::string name;
};

// Узел унарной операции (унарный минус или плюс)
class UnaryNode final : public AstNode {
public:
    UnaryNode(char op, AstNodePtr child, std::size_t position)
        : AstNode(position), op(op), child(std::move(child)) {}

    NodeKind kind() const override { return NodeKind::Unary; }
    Value evaluate(EvaluationContext& context) const override;
    std::string toString() const override;

    char operation() const { return op; }
    const AstNode& operand() const { return *child; }

private:
    char op;
    AstNodePtr child;
};

// Узел бинарной арифметической операции (+, -, *, /, ^, %)
class BinaryNode final : public AstNode {
public:
    BinaryNode(char op, AstNodePtr left, AstNodePtr right, std::size_t position)
        : AstNode(position), op(op), left(std::move(left)), right(std::move(right)) {}

    NodeKind kind() const override { return NodeKind::Binary; }
    Value evaluate(EvaluationContext& context) const override;
    std::string toString() const override;

    char operation() const { return op; }
    const AstNode& lhs() const { return *left; }
    const AstNode& rhs() const { return *right; }

private:
    char op;         // Символ операции
    AstNodePtr left;  // Левый операнд
    AstNodePtr right; // Правый операнд

    // Применение операции к уже вычисленным операндам
    Value apply(const Value& leftValue, const Value& rightValue, EvaluationContext& context) const;
};

// Узел вызова научной функции (sin, log, mean и т.д.)
class CallNode final : public AstNode {
public:
    CallNode(std::string name, std::vector<AstNodePtr> arguments, std::size_t position)
        : AstNode(position), name(std::move(name)), arguments(std::move(arguments)) {}

    NodeKind kind() const override { return NodeKind::Call; }
    Value evaluate(EvaluationContext& context) const override;
    std::string toString() const override;

    const std::string& function() const { return name; }
    std::size_t argumentCount() const { return arguments.size(); }
    const AstNode& argument(std::size_t index) const { return *arguments.at(index); }

private:
    std::string name;                  // Имя функции
    std::vector<AstNodePtr> arguments; // Аргументы функции
};

// Пересчёт в единицу: "5 km to mile"
class ConversionNode final : public AstNode {
public:
    ConversionNode(AstNodePtr source, std::string unit, std::size_t position)
        : AstNode(position), source(std::move(source)), unit(std::move(unit)) {}

    NodeKind kind() const override { return NodeKind::Conversion; }
    Value evaluate(EvaluationContext& context) const override;
    std::string toString() const override;

    const AstNode& expression() const { return *source; }
    const std::string& targetUnit() const { return unit; }

private:
    AstNodePtr source;
    std::string unit;
};

} // namespace scicalc
