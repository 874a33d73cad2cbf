#pragma once

#include <memory>
#include <string>
#include <vector>

#include "scicalc/ast.hpp"
#include "scicalc/token.hpp"

namespace scicalc {

// Класс синтаксического анализатора (парсера)
// Строит Абстрактное Синтаксическое Дерево (AST) из списка токенов.
// Реализует алгоритм рекурсивного спуска. Имена функций, констант и
// единиц не проверяются: это делает вычислитель.
class Parser {
public:
    // Конструктор принимает список токенов от лексера
    explicit Parser(std::vector<Token> tokens);

    // Основной метод запуска парсинга
    // Возвращает указатель на корневой узел AST
    // Выбрасывает SyntaxError при синтаксических ошибках
    AstNodePtr parse();

private:
    const std::vector<Token> tokens; // Список токенов
    std::size_t current = 0;         // Индекс текущего токена

    // Возвращает текущий токен без продвижения
    const Token& peek() const;

    // Возвращает последний поглощённый токен
    const Token& previous() const;

    // Проверяет тип текущего токена без продвижения
    bool check(TokenType type) const;

    // Проверяет, соответствует ли текущий токен ожидаемому типу.
    // Если да: сдвигает указатель и возвращает true.
    bool match(TokenType type);

    // Ожидает токен определенного типа.
    // Если тип совпадает: возвращает токен и сдвигает указатель.
    // Если нет: выбрасывает SyntaxError с текстом errorMessage.
    const Token& consume(TokenType type, const std::string& errorMessage);

    // Проверка на конец списка токенов
    bool isAtEnd() const;

    // Ошибка в позиции текущего токена
    [[noreturn]] void fail(const std::string& message) const;

    // --- Методы рекурсивного спуска (от низкого приоритета к высокому) ---

    // Разбор выражения с необязательным пересчётом "to unit"
    AstNodePtr parseStatement();

    // Разбор выражения (сложение/вычитание)
    AstNodePtr parseExpression();

    // Разбор слагаемого (умножение/деление/остаток)
    AstNodePtr parseTerm();

    // Неявное умножение: "5 km", "2 pi r". Связывает сильнее "*" и "/"
    AstNodePtr parseImplicitProduct();

    // Разбор унарного оператора
    AstNodePtr parseUnary();

    // Разбор степени (правоассоциативно)
    AstNodePtr parsePower();

    // Разбор первичного выражения (числа, имена, скобки, вызовы функций)
    AstNodePtr parsePrimary();

    // Разбор вызова функции
    AstNodePtr parseFunctionCall(const Token& name);

    // Разбор аргумента функции; список в квадратных скобках разворачивается
    void parseArgument(std::vector<AstNodePtr>& arguments);
};

// Полный разбор строки: проверка длины, токенизация, построение AST.
// Выбрасывает SyntaxError.
AstNodePtr parse(const std::string& text);

} // namespace scicalc
