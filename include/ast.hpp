#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <variant>

#include "number.hpp"

namespace ratcalc {

struct Expression;

// Узлы абстрактного синтаксического дерева (AST).
// Каждый узел владеет своими потомками, дерево не меняется после построения.

// Числовая константа (лист дерева)
struct Literal {
    Number value;
};

// Ссылка на переменную
struct Variable {
    std::string name;
};

// Унарная операция (унарный минус или плюс)
struct UnaryOp {
    char op;
    std::unique_ptr<Expression> operand;
};

// Бинарная арифметическая операция (+, -, *, /, ^)
struct BinaryOp {
    char op;
    std::unique_ptr<Expression> left;
    std::unique_ptr<Expression> right;
};

// Корень степени degree из radicand
struct Root {
    std::unique_ptr<Expression> degree;
    std::unique_ptr<Expression> radicand;
};

// Присваивание name = value, допустимо только на верхнем уровне
struct Assignment {
    std::string name;
    std::unique_ptr<Expression> value;
};

// Узел дерева: замкнутый набор вариантов, обход через std::visit
struct Expression {
    std::variant<Literal, Variable, UnaryOp, BinaryOp, Root, Assignment> node;
    std::size_t height = 1; // Высота поддерева, у листа 1
};

// Конструкторы узлов
std::unique_ptr<Expression> makeLiteral(Number value);
std::unique_ptr<Expression> makeVariable(std::string name);
std::unique_ptr<Expression> makeUnary(char op, std::unique_ptr<Expression> operand);
std::unique_ptr<Expression> makeBinary(char op, std::unique_ptr<Expression> left,
                                       std::unique_ptr<Expression> right);
std::unique_ptr<Expression> makeRoot(std::unique_ptr<Expression> degree,
                                     std::unique_ptr<Expression> radicand);
std::unique_ptr<Expression> makeAssignment(std::string name, std::unique_ptr<Expression> value);

// Текстовое представление дерева в скобочной записи, например "(+ 2 (* 3 4))".
// Используется в диагностике и тестах парсера.
std::string toString(const Expression& expression);

} // namespace ratcalc
