#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "ast.hpp"
#include "errors.hpp"
#include "token.hpp"

namespace ratcalc {

// Предельная глубина вложенности: скобки, унарные операторы, степени
// и высота дерева. Ограничивает рекурсию парсера, вычислителя и деструктора дерева.
constexpr std::size_t kMaxNestingDepth = 1000;

// Класс синтаксического анализатора (парсера)
// Строит Абстрактное Синтаксическое Дерево (AST) из списка токенов.
// Реализует алгоритм рекурсивного спуска.
class Parser {
public:
    // Конструктор принимает список токенов от лексера
    explicit Parser(std::vector<Token> tokens);

    // Основной метод запуска парсинга
    // Возвращает корневой узел AST
    // Выбрасывает ParseError при синтаксических ошибках
    std::unique_ptr<Expression> parse();

private:
    const std::vector<Token> tokens; // Список токенов
    std::size_t current = 0;         // Индекс текущего токена
    std::size_t openParens = 0;      // Глубина вложенности скобок
    std::size_t depth = 0;           // Текущая глубина рекурсии

    // Возвращает текущий токен без продвижения
    const Token& peek() const;

    // Возвращает токен, следующий за текущим
    const Token& peekNext() const;

    // Проверяет, соответствует ли текущий токен ожидаемому типу.
    // Если да — сдвигает указатель и возвращает true.
    bool match(TokenType type);

    // Ожидает токен определенного типа.
    // Если тип совпадает — возвращает токен и сдвигает указатель.
    // Если нет — выбрасывает ParseError вида kind.
    const Token& consume(TokenType type, ParseError::Kind kind);

    // Проверка на конец списка токенов
    bool isAtEnd() const;

    // Ошибка для токена, который не может стоять в текущем месте
    [[noreturn]] void unexpected() const;

    // Проверка высоты построенного узла.
    // Выбрасывает ParseError(NestingTooDeep), если дерево слишком высокое.
    std::unique_ptr<Expression> limited(std::unique_ptr<Expression> node, std::size_t position) const;

    // --- Методы рекурсивного спуска (от низкого приоритета к высокому) ---

    // Разбор присваивания (только на верхнем уровне)
    std::unique_ptr<Expression> parseStatement();

    // Разбор выражения (сложение/вычитание)
    std::unique_ptr<Expression> parseExpression();

    // Разбор слагаемого (умножение/деление)
    std::unique_ptr<Expression> parseTerm();

    // Разбор степени и корня (правоассоциативно)
    std::unique_ptr<Expression> parsePower();

    // Разбор унарного оператора
    std::unique_ptr<Expression> parseUnary();

    // Разбор первичного выражения (числа, переменные, скобки, вызовы функций)
    std::unique_ptr<Expression> parsePrimary();

    // Разбор вызова функции
    std::unique_ptr<Expression> parseFunctionCall(const std::string& name);

    // Разбор выражения в скобках после открывающей скобки
    std::unique_ptr<Expression> parseGrouped();
};

// Токенизация и разбор строки за один вызов
std::unique_ptr<Expression> parseText(const std::string& text);

} // namespace ratcalc
