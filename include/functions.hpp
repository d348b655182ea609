#pragma once

#include <cstddef>
#include <string>

namespace ratcalc {

// Встроенные функции калькулятора. Их имена зарезервированы
// и не могут использоваться как имена переменных.
enum class Function {
    Sqrt, // sqrt(x)    — квадратный корень
    Root  // root(x, n) — корень степени n
};

struct FunctionInfo {
    const char* name;
    Function function;
    std::size_t arity;
};

// Поиск встроенной функции по имени, nullptr если такой нет
const FunctionInfo* findFunction(const std::string& name);

} // namespace ratcalc
