#include "user_input.hpp"
#include "console.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <string>

namespace ratcalc {

// Безопасный парсинг числа из строки
std::size_t parseNumber(const std::string& value, bool allowZero) {
    // stoul пропускает знак и хвост, поэтому сначала проверяем цифры
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isdigit(c); })) {
        throw std::runtime_error("Некорректное числовое значение");
    }

    std::size_t result = 0;
    try {
        result = std::stoul(value);
    }
    catch (const std::exception&) {
        throw std::runtime_error("Некорректное числовое значение");
    }
    if (result == 0 && !allowZero) {
        throw std::runtime_error("Число должно быть положительным");
    }
    return result;
}

std::string trim(const std::string& value) {
    std::size_t first = value.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return {};
    }
    std::size_t last = value.find_last_not_of(" \t\r");
    return value.substr(first, last - first + 1);
}

std::optional<std::string> readLine(const std::string& prompt) {
    std::cout << Color::BOLD << prompt << Color::RESET << std::flush;

    std::string input;
    if (!std::getline(std::cin, input)) {
        return std::nullopt;
    }
    return input;
}

} // namespace ratcalc
