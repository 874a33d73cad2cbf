#pragma once

#include <cstddef>
#include <string>

namespace scicalc {

// Типы лексем
enum class TokenType {
    Number,     // Числовой литерал
    Identifier, // Имя функции, константы или единицы
    To,         // Ключевое слово пересчёта единиц "to"
    Plus,
    Minus,
    Star,
    Slash,
    Caret,
    Percent,
    LParen,
    RParen,
    LBracket,
    RBracket,
    Comma,
    End         // Конец входа
};

// Лексема с позицией начала во входной строке (с нуля)
struct Token {
    TokenType type;
    double numericValue; // Значение для Number
    std::string text;    // Исходный текст лексемы
    std::size_t position;
};

// Читаемое имя типа лексемы для сообщений об ошибках
const char* describe(TokenType type);

} // namespace scicalc
