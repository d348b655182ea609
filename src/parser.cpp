#include "parser.hpp"

#include "functions.hpp"
#include "tokenizer.hpp"

#include <stdexcept>
#include <utility>

namespace ratcalc {

namespace {
// Гарантирует, что список токенов заканчивается токеном End
std::vector<Token> terminated(std::vector<Token> tokens) {
    if (tokens.empty() || tokens.back().type != TokenType::End) {
        std::size_t end = tokens.empty() ? 0 : tokens.back().position + tokens.back().length;
        tokens.push_back({TokenType::End, "", end, 0});
    }
    return tokens;
}

// Счётчик глубины рекурсии на время разбора одного уровня вложенности
class NestingGuard {
public:
    NestingGuard(std::size_t& depth, std::size_t position) : depth(depth) {
        if (depth >= kMaxNestingDepth) {
            throw ParseError(ParseError::Kind::NestingTooDeep, position);
        }
        ++depth;
    }

    ~NestingGuard() { --depth; }

    NestingGuard(const NestingGuard&) = delete;
    NestingGuard& operator=(const NestingGuard&) = delete;

private:
    std::size_t& depth;
};
}

Parser::Parser(std::vector<Token> tokens) : tokens(terminated(std::move(tokens))) {}

// Запуск процесса парсинга
// Ожидает, что всё выражение будет полностью разобрано
std::unique_ptr<Expression> Parser::parse() {
    if (isAtEnd()) {
        throw ParseError(ParseError::Kind::EmptyExpression, peek().position);
    }

    auto exprNode = parseStatement();
    if (!isAtEnd()) {
        if (peek().type == TokenType::RParen) {
            throw ParseError(ParseError::Kind::UnmatchedParen, peek().position);
        }
        if (peek().type == TokenType::Assign) {
            // Присваивание допустимо только как всё выражение целиком
            throw ParseError(ParseError::Kind::UnexpectedToken, peek().position);
        }
        throw ParseError(ParseError::Kind::TrailingInput, peek().position);
    }
    return exprNode;
}

const Token& Parser::peek() const {
    return tokens[current];
}

const Token& Parser::peekNext() const {
    return current + 1 < tokens.size() ? tokens[current + 1] : tokens.back();
}

bool Parser::match(TokenType type) {
    if (!isAtEnd() && tokens[current].type == type) {
        ++current;
        return true;
    }
    return false;
}

const Token& Parser::consume(TokenType type, ParseError::Kind kind) {
    if (match(type)) {
        return tokens[current - 1];
    }
    throw ParseError(kind, peek().position);
}

bool Parser::isAtEnd() const {
    return peek().type == TokenType::End;
}

void Parser::unexpected() const {
    const Token& token = peek();
    if (token.type == TokenType::RParen && openParens == 0) {
        throw ParseError(ParseError::Kind::UnmatchedParen, token.position);
    }
    if (token.type == TokenType::End && openParens > 0) {
        throw ParseError(ParseError::Kind::UnmatchedParen, token.position);
    }
    throw ParseError(ParseError::Kind::UnexpectedToken, token.position);
}

std::unique_ptr<Expression> Parser::limited(std::unique_ptr<Expression> node, std::size_t position) const {
    if (node->height > kMaxNestingDepth) {
        throw ParseError(ParseError::Kind::NestingTooDeep, position);
    }
    return node;
}

// Грамматика: Statement -> Identifier "=" Expression | Expression
std::unique_ptr<Expression> Parser::parseStatement() {
    if (peek().type == TokenType::Identifier && peekNext().type == TokenType::Assign) {
        std::string name = peek().text;
        std::size_t position = peek().position;
        current += 2;
        return limited(makeAssignment(std::move(name), parseExpression()), position);
    }
    return parseExpression();
}

// Грамматика: Expression -> Term { ("+" | "-") Term }
std::unique_ptr<Expression> Parser::parseExpression() {
    auto node = parseTerm();
    while (true) {
        std::size_t position = peek().position;
        if (match(TokenType::Plus)) {
            auto right = parseTerm();
            node = limited(makeBinary('+', std::move(node), std::move(right)), position);
        } else if (match(TokenType::Minus)) {
            auto right = parseTerm();
            node = limited(makeBinary('-', std::move(node), std::move(right)), position);
        } else {
            break;
        }
    }
    return node;
}

// Грамматика: Term -> Power { ("*" | "/") Power }
std::unique_ptr<Expression> Parser::parseTerm() {
    auto node = parsePower();
    while (true) {
        std::size_t position = peek().position;
        if (match(TokenType::Star)) {
            auto right = parsePower();
            node = limited(makeBinary('*', std::move(node), std::move(right)), position);
        } else if (match(TokenType::Slash)) {
            auto right = parsePower();
            node = limited(makeBinary('/', std::move(node), std::move(right)), position);
        } else {
            break;
        }
    }
    return node;
}

// Грамматика: Power -> Unary [ ("^" | "√") Power ]
// Правая ассоциативность: 2^3^2 = 2^(3^2), 3√2^6 = 3√(2^6)
std::unique_ptr<Expression> Parser::parsePower() {
    auto node = parseUnary();
    std::size_t position = peek().position;
    if (match(TokenType::Caret)) {
        NestingGuard guard(depth, position);
        return limited(makeBinary('^', std::move(node), parsePower()), position);
    }
    if (match(TokenType::Root)) {
        NestingGuard guard(depth, position);
        return limited(makeRoot(std::move(node), parsePower()), position);
    }
    return node;
}

// Грамматика: Unary -> ("+" | "-" | "√") Unary | Primary
// Унарный минус связывает сильнее степени: -2^2 = (-2)^2
std::unique_ptr<Expression> Parser::parseUnary() {
    std::size_t position = peek().position;
    if (match(TokenType::Plus)) {
        NestingGuard guard(depth, position);
        return limited(makeUnary('+', parseUnary()), position);
    }
    if (match(TokenType::Minus)) {
        NestingGuard guard(depth, position);
        return limited(makeUnary('-', parseUnary()), position);
    }
    if (match(TokenType::Root)) {
        NestingGuard guard(depth, position);
        return limited(makeRoot(makeLiteral(Number(2)), parseUnary()), position);
    }
    return parsePrimary();
}

// Грамматика: Primary -> Number | Identifier | Identifier "(" Args ")" | "(" Expression ")"
std::unique_ptr<Expression> Parser::parsePrimary() {
    // Число
    if (match(TokenType::Number)) {
        return makeLiteral(Number::fromLiteral(tokens[current - 1].text));
    }

    // Переменная или вызов функции
    if (match(TokenType::Identifier)) {
        const auto& token = tokens[current - 1];
        if (findFunction(token.text) != nullptr) {
            return parseFunctionCall(token.text);
        }
        return makeVariable(token.text);
    }

    // Группировка скобками
    if (match(TokenType::LParen)) {
        return parseGrouped();
    }

    unexpected();
}

// Разбор вызова функции, например: sqrt(2) или root(27, 3).
// Аргументы разбираются списком, их число сверяется с таблицей функций.
std::unique_ptr<Expression> Parser::parseFunctionCall(const std::string& name) {
    const FunctionInfo* info = findFunction(name);
    std::size_t position = tokens[current - 1].position;
    consume(TokenType::LParen, ParseError::Kind::UnexpectedToken);
    NestingGuard guard(depth, position);
    ++openParens;

    std::vector<std::unique_ptr<Expression>> arguments;
    arguments.push_back(parseExpression());
    while (match(TokenType::Comma)) {
        arguments.push_back(parseExpression());
    }
    if (!match(TokenType::RParen)) {
        unexpected();
    }
    --openParens;

    if (arguments.size() != info->arity) {
        throw ParseError(ParseError::Kind::ArgumentCount, position);
    }

    switch (info->function) {
    case Function::Sqrt:
        return limited(makeRoot(makeLiteral(Number(2)), std::move(arguments[0])), position);
    case Function::Root:
        return limited(makeRoot(std::move(arguments[1]), std::move(arguments[0])), position);
    }
    throw std::logic_error("Неизвестная встроенная функция");
}

std::unique_ptr<Expression> Parser::parseGrouped() {
    NestingGuard guard(depth, tokens[current - 1].position);
    ++openParens;
    auto node = parseExpression();
    if (!match(TokenType::RParen)) {
        unexpected();
    }
    --openParens;
    return node;
}

// Полный цикл разбора строки:
// 1. Токенизация (Tokenizer)
// 2. Парсинг (Parser) -> построение AST
std::unique_ptr<Expression> parseText(const std::string& text) {
    Tokenizer tokenizer(text);
    Parser parser(tokenizer.tokenize());
    return parser.parse();
}

} // namespace ratcalc
