#pragma once

#include <string>
#include <vector>

#include "scicalc/token.hpp"

namespace scicalc {

// Класс лексического анализатора (лексера)
// Преобразует входную строку с выражением в последовательность токенов.
// Игнорирует пробельные символы.
class Tokenizer {
public:
    // Конструктор принимает исходную строку выражения
    explicit Tokenizer(std::string sourceText);

    // Основной метод запуска токенизации
    // Возвращает вектор токенов, заканчивающийся токеном End
    // Выбрасывает SyntaxError при недопустимых символах и некорректных числах
    std::vector<Token> tokenize();

private:
    const std::string source; // Исходная строка
    std::size_t index = 0;    // Текущая позиция чтения

    // Проверка достижения конца строки
    bool isAtEnd() const;

    // Возвращает символ со смещением offset без продвижения ('\0' за концом)
    char peek(std::size_t offset = 0) const;

    // Возвращает текущий символ и сдвигает указатель вперед
    char advance();

    // Пропускает пробелы, табуляции и переводы строк
    void skipWhitespace();

    // Односимвольный токен в текущей позиции
    Token makeSymbol(TokenType type);

    // Считывает число: целое, дробное, с экспонентой (1.5e-3)
    Token makeNumber();

    // Считывает идентификатор или ключевое слово "to"
    Token makeIdentifier();
};

} // namespace scicalc
