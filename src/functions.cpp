#include "functions.hpp"

namespace ratcalc {

namespace {
// Таблица встроенных функций
const FunctionInfo kFunctions[] = {
    {"sqrt", Function::Sqrt, 1},
    {"root", Function::Root, 2},
};
}

const FunctionInfo* findFunction(const std::string& name) {
    for (const auto& info : kFunctions) {
        if (name == info.name) {
            return &info;
        }
    }
    return nullptr;
}

} // namespace ratcalc
