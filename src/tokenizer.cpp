#include "scicalc/tokenizer.hpp"

#include "scicalc/errors.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace scicalc {

namespace {
bool isDigit(char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

bool isLetter(char ch) {
    return std::isalpha(static_cast<unsigned char>(ch)) != 0;
}
}

const char* describe(TokenType type) {
    switch (type) {
    case TokenType::Number:
        return "number";
    case TokenType::Identifier:
        return "identifier";
    case TokenType::To:
        return "'to'";
    case TokenType::Plus:
        return "'+'";
    case TokenType::Minus:
        return "'-'";
    case TokenType::Star:
        return "'*'";
    case TokenType::Slash:
        return "'/'";
    case TokenType::Caret:
        return "'^'";
    case TokenType::Percent:
        return "'%'";
    case TokenType::LParen:
        return "'('";
    case TokenType::RParen:
        return "')'";
    case TokenType::LBracket:
        return "'['";
    case TokenType::RBracket:
        return "']'";
    case TokenType::Comma:
        return "','";
    case TokenType::End:
        return "end of expression";
    }
    return "token";
}

Tokenizer::Tokenizer(std::string sourceText) : source(std::move(sourceText)) {}

// Основной цикл разбора: проходит по строке и выделяет токены
std::vector<Token> Tokenizer::tokenize() {
    std::vector<Token> tokens;
    while (!isAtEnd()) {
        skipWhitespace();
        if (isAtEnd()) {
            break;
        }

        char ch = peek();
        switch (ch) {
        // Односимвольные токены
        case '+':
            tokens.push_back(makeSymbol(TokenType::Plus));
            break;
        case '-':
            tokens.push_back(makeSymbol(TokenType::Minus));
            break;
        case '*':
            tokens.push_back(makeSymbol(TokenType::Star));
            break;
        case '/':
            tokens.push_back(makeSymbol(TokenType::Slash));
            break;
        case '^':
            tokens.push_back(makeSymbol(TokenType::Caret));
            break;
        case '%':
            tokens.push_back(makeSymbol(TokenType::Percent));
            break;
        case '(':
            tokens.push_back(makeSymbol(TokenType::LParen));
            break;
        case ')':
            tokens.push_back(makeSymbol(TokenType::RParen));
            break;
        case '[':
            tokens.push_back(makeSymbol(TokenType::LBracket));
            break;
        case ']':
            tokens.push_back(makeSymbol(TokenType::RBracket));
            break;
        case ',':
            tokens.push_back(makeSymbol(TokenType::Comma));
            break;
        case '.':
            // Число не может начинаться с точки (".5")
            throw SyntaxError("malformed number at position " + std::to_string(index), index,
                              {{"fragment", "."}}, "write a leading zero, e.g. 0.5");
        default:
            // Многосимвольные токены (числа и идентификаторы)
            if (isDigit(ch)) {
                tokens.push_back(makeNumber());
            } else if (isLetter(ch)) {
                tokens.push_back(makeIdentifier());
            } else {
                throw SyntaxError("invalid character '" + std::string(1, ch) + "' at position " +
                                      std::to_string(index),
                                  index, {{"fragment", std::string(1, ch)}});
            }
            break;
        }
    }

    tokens.push_back({TokenType::End, 0.0, "", index});
    return tokens;
}

bool Tokenizer::isAtEnd() const {
    return index >= source.size();
}

char Tokenizer::peek(std::size_t offset) const {
    std::size_t at = index + offset;
    return at < source.size() ? source[at] : '\0';
}

char Tokenizer::advance() {
    return source[index++];
}

// Пропуск всех незначащих символов
void Tokenizer::skipWhitespace() {
    while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
        advance();
    }
}

Token Tokenizer::makeSymbol(TokenType type) {
    std::size_t start = index;
    char ch = advance();
    return {type, 0.0, std::string(1, ch), start};
}

// Разбор числового литерала: digits [ '.' digits ] [ (e|E) [+|-] digits ]
Token Tokenizer::makeNumber() {
    std::size_t start = index;
    auto malformed = [this, start]() {
        std::size_t end = index;
        while (end < source.size() && (isDigit(source[end]) || source[end] == '.')) {
            ++end;
        }
        std::string fragment = source.substr(start, end - start);
        return SyntaxError("malformed number '" + fragment + "' at position " + std::to_string(start), start,
                           {{"fragment", fragment}});
    };

    while (isDigit(peek())) {
        advance();
    }
    if (peek() == '.') {
        advance();
        // После точки обязательна хотя бы одна цифра ("5." недопустимо)
        if (!isDigit(peek())) {
            throw malformed();
        }
        while (isDigit(peek())) {
            advance();
        }
    }

    // Экспонента поглощается, только если за ней следуют цифры: "2e": это 2 * e
    if (peek() == 'e' || peek() == 'E') {
        bool signedExponent = (peek(1) == '+' || peek(1) == '-') && isDigit(peek(2));
        if (isDigit(peek(1)) || signedExponent) {
            advance();
            if (signedExponent) {
                advance();
            }
            while (isDigit(peek())) {
                advance();
            }
        }
    }

    // Вторая точка подряд ("1.2.3")
    if (peek() == '.') {
        throw malformed();
    }

    std::string text = source.substr(start, index - start);
    // Переполнение (1e999) отклоняется, исчезающе малые значения (1e-310) допустимы
    errno = 0;
    double value = std::strtod(text.c_str(), nullptr);
    if (errno == ERANGE && std::isinf(value)) {
        throw SyntaxError("number '" + text + "' is out of range at position " + std::to_string(start), start,
                          {{"fragment", text}});
    }
    return {TokenType::Number, value, text, start};
}

// Разбор идентификатора: буква, затем буквы и цифры (log10, degC).
// Регистр сохраняется: обозначения единиц к нему чувствительны (T и t).
Token Tokenizer::makeIdentifier() {
    std::size_t start = index;
    while (!isAtEnd() && (isLetter(peek()) || isDigit(peek()))) {
        advance();
    }

    std::string identifier = source.substr(start, index - start);
    if (identifier == "to" || identifier == "TO" || identifier == "To") {
        return {TokenType::To, 0.0, identifier, start};
    }
    return {TokenType::Identifier, 0.0, identifier, start};
}

} // namespace scicalc
