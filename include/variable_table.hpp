#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>

#include "number.hpp"

namespace ratcalc {

// Снимок таблицы переменных, упорядоченный по имени
using VariableSnapshot = std::map<std::string, Number>;

// Таблица переменных: имя -> значение.
// Имена чувствительны к регистру, повторное присваивание заменяет значение.
class VariableTable {
public:
    // Значение переменной, если она определена
    std::optional<Number> get(const std::string& name) const;

    // Записывает значение. Выбрасывает EvalError(InvalidName) для имени,
    // не подходящего под [A-Za-z][A-Za-z0-9_]*, и EvalError(ReservedName)
    // для имени встроенной функции.
    void set(const std::string& name, const Number& value);

    // Удаляет переменную, false если её не было
    bool remove(const std::string& name);

    bool contains(const std::string& name) const;
    std::size_t size() const { return values.size(); }

    VariableSnapshot snapshot() const { return values; }

    // Заменяет содержимое таблицы снимком. Все имена проверяются заранее,
    // при ошибке таблица остаётся прежней.
    void restore(const VariableSnapshot& snapshot);

    static bool isValidName(const std::string& name);
    static bool isReserved(const std::string& name);

private:
    VariableSnapshot values;

    // Выбрасывает EvalError, если имя нельзя использовать
    static void validate(const std::string& name);
};

} // namespace ratcalc
