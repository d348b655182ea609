#pragma once

#include <string>

// ANSI цветовые коды для форматирования вывода в терминал
namespace Color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
    constexpr const char* GRAY = "\033[90m";
}

namespace ratcalc {

// Вывод приветственного заголовка программы
void printHeader();

// Сообщения в std::cerr: ошибка (красным) и предупреждение (жёлтым)
void printError(const std::string& message);
void printWarning(const std::string& message);

// Служебное сообщение в std::cout (серым)
void printInfo(const std::string& message);

} // namespace ratcalc
