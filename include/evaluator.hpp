#pragma once

#include "ast.hpp"
#include "number.hpp"
#include "variable_table.hpp"

namespace ratcalc {

// Вычислитель дерева выражения над точными дробями.
// Читает переменные из таблицы; записывает в неё только при присваивании.
class Evaluator {
public:
    explicit Evaluator(VariableTable& variables) : variables(variables) {}

    // Вычисляет значение дерева.
    // Пример: (= x (+ 2 2)) -> 4, и x становится равным 4.
    // Выбрасывает EvalError; при ошибке таблица переменных не меняется.
    Number evaluate(const Expression& expression) const;

private:
    VariableTable& variables;
};

} // namespace ratcalc
