#include <catch2/catch.hpp>

#include "scicalc/errors.hpp"
#include "scicalc/tokenizer.hpp"

using namespace scicalc;

namespace {
std::vector<TokenType> typesOf(const std::string& text) {
    std::vector<TokenType> types;
    for (const auto& token : Tokenizer(text).tokenize()) {
        types.push_back(token.type);
    }
    return types;
}

std::size_t errorPosition(const std::string& text) {
    try {
        Tokenizer(text).tokenize();
    }
    catch (const SyntaxError& e) {
        return e.position();
    }
    FAIL("expected SyntaxError for '" << text << "'");
    return 0;
}
}

TEST_CASE("Tokenizer splits operators and numbers", "[tokenizer]") {
    auto tokens = Tokenizer("2 + 3.5e2*(4)").tokenize();

    REQUIRE(tokens.size() == 8);
    CHECK(tokens[0].type == TokenType::Number);
    CHECK(tokens[0].numericValue == 2.0);
    CHECK(tokens[1].type == TokenType::Plus);
    CHECK(tokens[1].position == 2);
    CHECK(tokens[2].numericValue == 350.0);
    CHECK(tokens[2].text == "3.5e2");
    CHECK(tokens[3].type == TokenType::Star);
    CHECK(tokens[4].type == TokenType::LParen);
    CHECK(tokens[6].type == TokenType::RParen);
    CHECK(tokens[7].type == TokenType::End);
}

TEST_CASE("Tokenizer recognizes identifiers and the conversion keyword", "[tokenizer]") {
    SECTION("Unit conversion") {
        auto tokens = Tokenizer("5 km to mi").tokenize();
        REQUIRE(tokens.size() == 5);
        CHECK(tokens[1].type == TokenType::Identifier);
        CHECK(tokens[1].text == "km");
        CHECK(tokens[2].type == TokenType::To);
        CHECK(tokens[3].text == "mi");
    }

    SECTION("Case is preserved") {
        auto tokens = Tokenizer("degC T log10").tokenize();
        CHECK(tokens[0].text == "degC");
        CHECK(tokens[1].text == "T");
        CHECK(tokens[2].text == "log10");
    }

    SECTION("TO in any supported spelling is a keyword") {
        CHECK(typesOf("1 m TO ft")[2] == TokenType::To);
        CHECK(typesOf("1 m To ft")[2] == TokenType::To);
    }

    SECTION("Brackets and commas") {
        CHECK(typesOf("mean([1, 2])") ==
              std::vector<TokenType>{TokenType::Identifier, TokenType::LParen, TokenType::LBracket, TokenType::Number,
                                     TokenType::Comma, TokenType::Number, TokenType::RBracket, TokenType::RParen,
                                     TokenType::End});
    }
}

TEST_CASE("Exponent is consumed only when digits follow", "[tokenizer]") {
    CHECK(typesOf("2e") == std::vector<TokenType>{TokenType::Number, TokenType::Identifier, TokenType::End});
    CHECK(typesOf("2e-3") == std::vector<TokenType>{TokenType::Number, TokenType::End});
    CHECK(typesOf("2e-x") ==
          std::vector<TokenType>{TokenType::Number, TokenType::Identifier, TokenType::Minus, TokenType::Identifier,
                                 TokenType::End});
}

TEST_CASE("Malformed numbers are rejected", "[tokenizer][errors]") {
    REQUIRE_THROWS_WITH(Tokenizer(".5").tokenize(), Catch::Contains("malformed number"));
    REQUIRE_THROWS_WITH(Tokenizer("5.").tokenize(), Catch::Contains("malformed number"));
    REQUIRE_THROWS_WITH(Tokenizer("1.2.3").tokenize(), Catch::Contains("malformed number"));
    REQUIRE_THROWS_WITH(Tokenizer("1e999").tokenize(), Catch::Contains("out of range"));

    CHECK(errorPosition(".5") == 0);
    CHECK(errorPosition("2 + 1.2.3") == 4);
}

TEST_CASE("Very small literals underflow quietly", "[tokenizer]") {
    std::vector<Token> subnormal = Tokenizer("1e-310").tokenize();
    REQUIRE(subnormal.size() == 2);
    CHECK(subnormal[0].type == TokenType::Number);
    CHECK(subnormal[0].numericValue > 0.0);
    CHECK(subnormal[0].numericValue < 1e-300);

    std::vector<Token> vanishing = Tokenizer("1e-400").tokenize();
    CHECK(vanishing[0].numericValue == 0.0);

    REQUIRE_THROWS_WITH(Tokenizer("-1e999").tokenize(), Catch::Contains("out of range"));
}

TEST_CASE("Invalid characters report their position", "[tokenizer][errors]") {
    REQUIRE_THROWS_AS(Tokenizer("2 # 3").tokenize(), SyntaxError);
    REQUIRE_THROWS_WITH(Tokenizer("2 # 3").tokenize(), Catch::Contains("invalid character '#' at position 2"));
    CHECK(errorPosition("abc;") == 3);
    CHECK(errorPosition("__import__") == 0);
}
