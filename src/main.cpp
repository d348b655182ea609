#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include "calculator.hpp"
#include "console.hpp"
#include "errors.hpp"
#include "file_utils.hpp"
#include "settings.hpp"
#include "user_input.hpp"

using namespace ratcalc;

namespace {

    // Подчёркивание позиции ошибки под введённой строкой
    void printErrorPosition(const std::string& prompt, std::size_t position) {
        std::cerr << std::string(prompt.size() + position, ' ') << Color::RED << "^" << Color::RESET << "\n";
    }

    void printEntry(const Calculator& calculator, const HistoryEntry& entry) {
        std::cout << "  " << Color::GRAY << formatTimestamp(entry.timestamp) << Color::RESET << "  "
            << Color::YELLOW << entry.input << Color::RESET;
        if (entry.result) {
            std::cout << " = " << Color::GREEN << calculator.format(*entry.result) << Color::RESET;
        }
        std::cout << "\n    " << Color::GRAY << entry.id << Color::RESET << "\n";
    }

    void printHistory(const Calculator& calculator, const std::optional<std::string>& sessionId) {
        auto entries = calculator.historyEntries(sessionId);
        if (entries.empty()) {
            printInfo("История пуста");
            return;
        }
        for (const auto& entry : entries) {
            printEntry(calculator, entry);
        }
    }

    void printSessions(const Calculator& calculator) {
        const auto& sessions = calculator.sessions();
        if (sessions.empty()) {
            printInfo("Сессий нет");
            return;
        }
        for (std::size_t i = 0; i < sessions.size(); ++i) {
            const Session& session = sessions[i];
            std::cout << "  " << Color::CYAN << (i + 1) << Color::RESET << ". "
                << formatTimestamp(session.startedAt) << "  "
                << Color::GRAY << session.id << Color::RESET
                << "  (" << session.entries.size() << " записей)";
            if (i + 1 == sessions.size()) {
                std::cout << Color::BOLD << "  <- последняя" << Color::RESET;
            }
            std::cout << "\n";
        }
    }

    void printVariables(const Calculator& calculator) {
        auto variables = calculator.variables();
        if (variables.empty()) {
            printInfo("Переменные не заданы");
            return;
        }
        for (const auto& [name, value] : variables) {
            std::cout << "  " << Color::CYAN << name << Color::RESET << " = "
                << Color::GREEN << calculator.format(value) << Color::RESET
                << Color::GRAY << "  (" << value.toFractionString() << ")" << Color::RESET << "\n";
        }
    }

    void trySave(Calculator& calculator) {
        try {
            calculator.save();
            printInfo("История сохранена");
        }
        catch (const SaveError& ex) {
            printError(ex.what());
        }
    }

    // Обработка команды вида ":name аргумент". Возвращает false для :quit.
    bool runCommand(Calculator& calculator, const std::string& line) {
        std::size_t space = line.find(' ');
        std::string command = line.substr(0, space);
        std::string argument = space == std::string::npos ? std::string() : trim(line.substr(space + 1));

        if (command == ":quit" || command == ":q") {
            return false;
        }
        if (command == ":history") {
            printHistory(calculator, argument.empty() ? std::nullopt : std::optional<std::string>(argument));
        }
        else if (command == ":sessions") {
            printSessions(calculator);
        }
        else if (command == ":vars") {
            printVariables(calculator);
        }
        else if (command == ":unset") {
            if (!calculator.removeVariable(argument)) {
                printWarning("переменная '" + argument + "' не задана");
            }
        }
        else if (command == ":reuse") {
            auto text = calculator.reinsert(argument);
            if (!text) {
                printWarning("запись '" + argument + "' не найдена");
            }
            else {
                std::cout << Color::YELLOW << *text << Color::RESET << "\n";
            }
        }
        else if (command == ":save") {
            trySave(calculator);
        }
        else {
            printWarning("неизвестная команда " + command);
        }
        return true;
    }

    void runLoop(Calculator& calculator) {
        const std::string prompt = "> ";
        while (true) {
            auto line = readLine(prompt);
            if (!line) {
                std::cout << "\n";
                break;
            }

            std::string input = trim(*line);
            if (!input.empty() && input.front() == ':') {
                if (!runCommand(calculator, input)) {
                    break;
                }
                continue;
            }

            try {
                auto result = calculator.evaluate(*line);
                if (result) {
                    std::cout << Color::GREEN << "= " << result->text << Color::RESET << "\n";
                }
            }
            catch (const EngineError& ex) {
                if (dynamic_cast<const EvalError*>(&ex) == nullptr) {
                    printErrorPosition(prompt, ex.where());
                }
                printError(ex.what());
                continue;
            }

            try {
                if (calculator.checkpoint()) {
                    printInfo("Автосохранение выполнено");
                }
            }
            catch (const SaveError& ex) {
                printError(ex.what());
            }
        }
    }

} // namespace

int main(int argc, char** argv) {
    printHeader();

    std::filesystem::path historyPath;
    try {
        historyPath = argc >= 2 ? std::filesystem::path(argv[1])
                                : defaultDataDirectory() / "history.bin";
    }
    catch (const std::exception& ex) {
        printError(ex.what());
        return 1;
    }

    Settings settings;
    try {
        settings = loadSettings(historyPath.parent_path() / "ratcalc.conf");
    }
    catch (const std::exception& ex) {
        printWarning(std::string("настройки по умолчанию: ") + ex.what());
    }

    Calculator calculator(settings);
    if (auto error = calculator.open(historyPath)) {
        printWarning(std::string("история не загружена, начинаем с пустой: ") + error->what());
    }
    printInfo("Файл истории: " + historyPath.string());

    runLoop(calculator);

    trySave(calculator);
    return 0;
}
