#include "tokenizer.hpp"

#include "errors.hpp"

#include <cctype>
#include <utility>

namespace ratcalc {

namespace {
// Знак корня √ (U+221A) в UTF-8
const std::string kRootSign = "\xE2\x88\x9A";
}

Tokenizer::Tokenizer(std::string sourceText) : source(std::move(sourceText)) {}

// Выделяет один токен начиная с текущей позиции
Token Tokenizer::next() {
    skipWhitespace();
    if (isAtEnd()) {
        return {TokenType::End, "", index, 0};
    }

    char ch = peek();
    switch (ch) {
    // Односимвольные токены
    case '+':
        return makeSingle(TokenType::Plus);
    case '-':
        return makeSingle(TokenType::Minus);
    case '*':
        return makeSingle(TokenType::Star);
    case '/':
        return makeSingle(TokenType::Slash);
    case '^':
        return makeSingle(TokenType::Caret);
    case '(':
        return makeSingle(TokenType::LParen);
    case ')':
        return makeSingle(TokenType::RParen);
    case ',':
        return makeSingle(TokenType::Comma);
    case '=':
        return makeSingle(TokenType::Assign);
    default:
        break;
    }

    // Знак корня занимает три байта
    if (source.compare(index, kRootSign.size(), kRootSign) == 0) {
        Token token{TokenType::Root, kRootSign, index, kRootSign.size()};
        index += kRootSign.size();
        return token;
    }

    // Многосимвольные токены (числа и идентификаторы)
    if (std::isdigit(static_cast<unsigned char>(ch))) {
        return makeNumber();
    }
    if (ch == '.' && index + 1 < source.size() &&
        std::isdigit(static_cast<unsigned char>(source[index + 1]))) {
        return makeNumber();
    }
    if (std::isalpha(static_cast<unsigned char>(ch)) || ch == '_') {
        return makeIdentifier();
    }
    throw LexError(LexError::Kind::UnrecognizedCharacter, index);
}

void Tokenizer::reset() {
    index = 0;
}

// Основной цикл разбора: проходит по строке и выделяет токены
std::vector<Token> Tokenizer::tokenize() {
    reset();
    std::vector<Token> tokens;
    while (true) {
        tokens.push_back(next());
        if (tokens.back().type == TokenType::End) {
            break;
        }
    }
    return tokens;
}

bool Tokenizer::isAtEnd() const {
    return index >= source.size();
}

char Tokenizer::peek() const {
    return source[index];
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

Token Tokenizer::makeSingle(TokenType type) {
    std::size_t start = index;
    return {type, std::string(1, advance()), start, 1};
}

// Разбор числового литерала
// Поддерживает целые числа и десятичные дроби, вторая точка завершает число
Token Tokenizer::makeNumber() {
    std::size_t start = index;
    bool hasDot = false;
    while (!isAtEnd()) {
        char ch = peek();
        if (ch == '.') {
            if (hasDot) {
                break;
            }
            hasDot = true;
            advance();
        } else if (std::isdigit(static_cast<unsigned char>(ch))) {
            advance();
        } else {
            break;
        }
    }

    return {TokenType::Number, source.substr(start, index - start), start, index - start};
}

// Разбор идентификатора: [A-Za-z_][A-Za-z0-9_]*
// Регистр сохраняется, имена x и X различны
Token Tokenizer::makeIdentifier() {
    std::size_t start = index;
    while (!isAtEnd() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')) {
        advance();
    }

    return {TokenType::Identifier, source.substr(start, index - start), start, index - start};
}

} // namespace ratcalc
