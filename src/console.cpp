#include "console.hpp"

#include <iostream>

namespace ratcalc {

void printHeader() {
    std::cout << Color::BOLD << Color::CYAN;
    std::cout << "\n╔═══════════════════════════════════════════════════════════╗\n";
    std::cout << "║        Калькулятор точных дробей ratcalc v1.0            ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════╝\n";
    std::cout << Color::RESET;
    std::cout << Color::GRAY << "Команды: :history :sessions :vars :unset <имя> :reuse <id> :save :quit"
        << Color::RESET << "\n\n";
}

void printError(const std::string& message) {
    std::cerr << Color::RED << Color::BOLD << "✗ Ошибка: "
        << Color::RESET << Color::RED << message << Color::RESET << "\n";
}

void printWarning(const std::string& message) {
    std::cerr << Color::YELLOW << "Внимание: " << Color::RESET << message << "\n";
}

void printInfo(const std::string& message) {
    std::cout << Color::GRAY << message << Color::RESET << "\n";
}

} // namespace ratcalc
