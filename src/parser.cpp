#include "scicalc/parser.hpp"

#include "scicalc/errors.hpp"
#include "scicalc/evaluator.hpp"
#include "scicalc/tokenizer.hpp"

#include <algorithm>
#include <cctype>

namespace scicalc {

Parser::Parser(std::vector<Token> tokens) : tokens(std::move(tokens)) {}

// Запуск процесса парсинга
// Ожидает, что всё выражение будет полностью разобрано
AstNodePtr Parser::parse() {
    auto statement = parseStatement();
    if (!isAtEnd()) {
        fail("unexpected " + std::string(describe(peek().type)));
    }
    return statement;
}

const Token& Parser::peek() const {
    return tokens[current];
}

const Token& Parser::previous() const {
    return tokens[current - 1];
}

bool Parser::check(TokenType type) const {
    return peek().type == type;
}

bool Parser::match(TokenType type) {
    if (!isAtEnd() && check(type)) {
        ++current;
        return true;
    }
    return false;
}

const Token& Parser::consume(TokenType type, const std::string& errorMessage) {
    if (match(type)) {
        return previous();
    }
    fail(errorMessage);
}

bool Parser::isAtEnd() const {
    return check(TokenType::End);
}

void Parser::fail(const std::string& message) const {
    const Token& token = peek();
    throw SyntaxError(message + " at position " + std::to_string(token.position), token.position,
                      {{"token", token.type == TokenType::End ? describe(token.type) : token.text}});
}

// Грамматика: Statement -> Expression [ "to" Identifier ]
AstNodePtr Parser::parseStatement() {
    auto node = parseExpression();
    if (match(TokenType::To)) {
        std::size_t position = previous().position;
        const Token& unit = consume(TokenType::Identifier, "expected unit name after 'to'");
        node = std::make_unique<ConversionNode>(std::move(node), unit.text, position);
    }
    return node;
}

// Грамматика: Expression -> Term { ("+" | "-") Term }
AstNodePtr Parser::parseExpression() {
    auto node = parseTerm();
    while (true) {
        if (match(TokenType::Plus) || match(TokenType::Minus)) {
            const Token& op = previous();
            auto right = parseTerm();
            node = std::make_unique<BinaryNode>(op.text[0], std::move(node), std::move(right), op.position);
        } else {
            break;
        }
    }
    return node;
}

// Грамматика: Term -> Implicit { ("*" | "/" | "%") Implicit }
AstNodePtr Parser::parseTerm() {
    auto node = parseImplicitProduct();
    while (match(TokenType::Star) || match(TokenType::Slash) || match(TokenType::Percent)) {
        const Token& op = previous();
        auto right = parseImplicitProduct();
        node = std::make_unique<BinaryNode>(op.text[0], std::move(node), std::move(right), op.position);
    }
    return node;
}

// Грамматика: Implicit -> Unary { Power }, где Power начинается с идентификатора.
// Величина с единицей остаётся одним операндом: 10 m / 2 s = (10 m) / (2 s)
AstNodePtr Parser::parseImplicitProduct() {
    auto node = parseUnary();
    while (check(TokenType::Identifier)) {
        std::size_t position = peek().position;
        auto right = parsePower();
        node = std::make_unique<BinaryNode>('*', std::move(node), std::move(right), position);
    }
    return node;
}

// Грамматика: Unary -> ("+" | "-") Unary | Power
AstNodePtr Parser::parseUnary() {
    if (match(TokenType::Plus) || match(TokenType::Minus)) {
        const Token& op = previous();
        return std::make_unique<UnaryNode>(op.text[0], parseUnary(), op.position);
    }
    return parsePower();
}

// Грамматика: Power -> Primary [ "^" Unary ]
// Правая часть разбирается через Unary, поэтому 2 ^ 3 ^ 2 = 2 ^ (3 ^ 2)
AstNodePtr Parser::parsePower() {
    auto base = parsePrimary();
    if (match(TokenType::Caret)) {
        std::size_t position = previous().position;
        auto exponent = parseUnary();
        return std::make_unique<BinaryNode>('^', std::move(base), std::move(exponent), position);
    }
    return base;
}

// Грамматика: Primary -> Number | Identifier | Call | "(" Expression ")"
AstNodePtr Parser::parsePrimary() {
    // Число
    if (match(TokenType::Number)) {
        const auto& token = previous();
        return std::make_unique<NumberNode>(token.numericValue, token.position);
    }

    // Вызов функции или имя константы/единицы
    if (match(TokenType::Identifier)) {
        const auto& token = previous();
        if (check(TokenType::LParen)) {
            return parseFunctionCall(token);
        }
        return std::make_unique<IdentifierNode>(token.text, token.position);
    }

    // Группировка скобками
    if (match(TokenType::LParen)) {
        auto node = parseExpression();
        consume(TokenType::RParen, "expected ')'");
        return node;
    }

    fail("unexpected " + std::string(describe(peek().type)));
}

// Разбор вызова функции, например: log(8, 2) или mean([1, 2, 3])
AstNodePtr Parser::parseFunctionCall(const Token& name) {
    consume(TokenType::LParen, "expected '(' after function name");
    std::vector<AstNodePtr> arguments;
    if (!check(TokenType::RParen)) {
        do {
            parseArgument(arguments);
        } while (match(TokenType::Comma));
    }
    consume(TokenType::RParen, "expected ')' after function arguments");
    return std::make_unique<CallNode>(name.text, std::move(arguments), name.position);
}

void Parser::parseArgument(std::vector<AstNodePtr>& arguments) {
    if (!match(TokenType::LBracket)) {
        arguments.push_back(parseExpression());
        return;
    }
    // Список значений разворачивается в аргументы вызова
    do {
        arguments.push_back(parseExpression());
    } while (match(TokenType::Comma));
    consume(TokenType::RBracket, "expected ']'");
}

AstNodePtr parse(const std::string& text) {
    if (text.size() > kMaxExpressionLength) {
        throw SyntaxError("expression exceeds maximum length of " + std::to_string(kMaxExpressionLength) +
                              " characters",
                          kMaxExpressionLength, {{"length", std::to_string(text.size())}});
    }
    bool blank = std::all_of(text.begin(), text.end(),
                             [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; });
    if (blank) {
        throw SyntaxError("empty expression", 0);
    }

    // Этап 1: Лексический анализ
    Tokenizer tokenizer(text);
    auto tokens = tokenizer.tokenize();

    // Этап 2: Синтаксический анализ
    Parser parser(std::move(tokens));
    return parser.parse();
}

} // namespace scicalc
