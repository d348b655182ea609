#include <catch2/catch.hpp>

#include "errors.hpp"
#include "test_helpers.hpp"
#include "tokenizer.hpp"

#include <vector>

using namespace ratcalc;
using ratcalc::test::errorKind;

namespace {
std::vector<TokenType> types(const std::string& text) {
    std::vector<TokenType> result;
    for (const auto& token : Tokenizer(text).tokenize()) {
        result.push_back(token.type);
    }
    return result;
}
}

TEST_CASE("Tokenizer recognizes every token kind", "[tokenizer]") {
    REQUIRE(types("x = 2.5 * (y - .5) / 3 ^ 2 + root(8, 3)") ==
            std::vector<TokenType>{TokenType::Identifier, TokenType::Assign, TokenType::Number,
                                   TokenType::Star, TokenType::LParen, TokenType::Identifier,
                                   TokenType::Minus, TokenType::Number, TokenType::RParen,
                                   TokenType::Slash, TokenType::Number, TokenType::Caret,
                                   TokenType::Number, TokenType::Plus, TokenType::Identifier,
                                   TokenType::LParen, TokenType::Number, TokenType::Comma,
                                   TokenType::Number, TokenType::RParen, TokenType::End});
}

TEST_CASE("Tokenizer keeps source spans", "[tokenizer]") {
    auto tokens = Tokenizer("  12.50+var_1").tokenize();
    REQUIRE(tokens.size() == 4);

    REQUIRE(tokens[0].text == "12.50");
    REQUIRE(tokens[0].position == 2);
    REQUIRE(tokens[0].length == 5);

    REQUIRE(tokens[1].type == TokenType::Plus);
    REQUIRE(tokens[1].position == 7);

    REQUIRE(tokens[2].text == "var_1");
    REQUIRE(tokens[2].position == 8);

    REQUIRE(tokens[3].type == TokenType::End);
    REQUIRE(tokens[3].position == 13);
}

TEST_CASE("Tokenizer reads the root sign", "[tokenizer]") {
    auto tokens = Tokenizer("3\xE2\x88\x9A" "8").tokenize();
    REQUIRE(tokens.size() == 4);
    REQUIRE(tokens[1].type == TokenType::Root);
    REQUIRE(tokens[1].position == 1);
    REQUIRE(tokens[1].length == 3);
    REQUIRE(tokens[2].text == "8");
    REQUIRE(tokens[2].position == 4);
}

TEST_CASE("Tokenizer is lazy and restartable", "[tokenizer]") {
    Tokenizer tokenizer("1 + x");

    REQUIRE(tokenizer.next().type == TokenType::Number);
    REQUIRE(tokenizer.next().type == TokenType::Plus);
    REQUIRE(tokenizer.next().type == TokenType::Identifier);
    REQUIRE(tokenizer.next().type == TokenType::End);
    REQUIRE(tokenizer.next().type == TokenType::End);

    tokenizer.reset();
    REQUIRE(tokenizer.next().text == "1");
}

TEST_CASE("Tokenizer splits numbers and identifiers", "[tokenizer]") {
    SECTION("second dot ends a number") {
        auto tokens = Tokenizer("1.2.3").tokenize();
        REQUIRE(tokens[0].text == "1.2");
        REQUIRE(tokens[1].text == ".3");
    }

    SECTION("digits then letters") {
        REQUIRE(types("2x") == std::vector<TokenType>{TokenType::Number, TokenType::Identifier, TokenType::End});
    }

    SECTION("identifiers are case sensitive") {
        auto tokens = Tokenizer("Xy xY").tokenize();
        REQUIRE(tokens[0].text == "Xy");
        REQUIRE(tokens[1].text == "xY");
    }
}

TEST_CASE("Tokenizer rejects unknown characters", "[tokenizer]") {
    SECTION("symbol") {
        Tokenizer tokenizer("2 $ 3");
        try {
            tokenizer.tokenize();
            FAIL("ожидалось исключение");
        }
        catch (const LexError& ex) {
            REQUIRE(ex.kind() == LexError::Kind::UnrecognizedCharacter);
            REQUIRE(ex.where() == 2);
        }
    }

    SECTION("lone dot") {
        REQUIRE(errorKind<LexError>([] { Tokenizer(".").tokenize(); }) == LexError::Kind::UnrecognizedCharacter);
    }

    SECTION("other multibyte characters") {
        REQUIRE(errorKind<LexError>([] { Tokenizer("2 \xC3\x97 3").tokenize(); }) ==
                LexError::Kind::UnrecognizedCharacter);
    }
}

TEST_CASE("Tokenizer of blank input yields only End", "[tokenizer]") {
    REQUIRE(types("") == std::vector<TokenType>{TokenType::End});
    REQUIRE(types(" \t ") == std::vector<TokenType>{TokenType::End});
}
