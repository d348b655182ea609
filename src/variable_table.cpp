#include "variable_table.hpp"

#include "errors.hpp"
#include "functions.hpp"

#include <cctype>

namespace ratcalc {

std::optional<Number> VariableTable::get(const std::string& name) const {
    auto it = values.find(name);
    if (it == values.end()) {
        return std::nullopt;
    }
    return it->second;
}

void VariableTable::set(const std::string& name, const Number& value) {
    validate(name);
    values[name] = value;
}

bool VariableTable::remove(const std::string& name) {
    return values.erase(name) > 0;
}

bool VariableTable::contains(const std::string& name) const {
    return values.find(name) != values.end();
}

void VariableTable::restore(const VariableSnapshot& snapshot) {
    for (const auto& [name, value] : snapshot) {
        validate(name);
    }
    values = snapshot;
}

// Имя начинается с буквы, дальше буквы, цифры и подчёркивания
bool VariableTable::isValidName(const std::string& name) {
    if (name.empty() || !std::isalpha(static_cast<unsigned char>(name.front()))) {
        return false;
    }
    for (char ch : name) {
        if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '_') {
            return false;
        }
    }
    return true;
}

bool VariableTable::isReserved(const std::string& name) {
    return findFunction(name) != nullptr;
}

void VariableTable::validate(const std::string& name) {
    if (isReserved(name)) {
        throw EvalError(EvalError::Kind::ReservedName, name);
    }
    if (!isValidName(name)) {
        throw EvalError(EvalError::Kind::InvalidName, name);
    }
}

} // namespace ratcalc
