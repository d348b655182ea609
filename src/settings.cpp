#include "settings.hpp"

#include "user_input.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

namespace ratcalc {

namespace {

// Максимум знаков после запятой: дальше вывод теряет смысл
constexpr std::size_t kMaxDecimalPlaces = 1000;

std::size_t parseSetting(const std::string& key, const std::string& value, std::size_t lineNumber,
                         bool allowZero) {
    try {
        return parseNumber(value, allowZero);
    }
    catch (const std::runtime_error& ex) {
        throw std::runtime_error("Настройка '" + key + "' в строке " + std::to_string(lineNumber) +
                                 ": " + ex.what());
    }
}

} // namespace

Settings loadSettings(const std::filesystem::path& path) {
    Settings settings;

    std::ifstream input(path);
    if (!input.is_open()) {
        if (!std::filesystem::exists(path)) {
            saveSettings(path, settings);
            return settings;
        }
        throw std::runtime_error("Не удалось открыть файл настроек: " + path.string());
    }

    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(input, line)) {
        ++lineNumber;

        // Комментарий до конца строки
        std::size_t hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        std::size_t eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::runtime_error("Строка " + std::to_string(lineNumber) +
                                     " файла настроек: ожидается 'ключ = значение'");
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        if (key == "decimal_places") {
            std::size_t places = parseSetting(key, value, lineNumber, true);
            if (places > kMaxDecimalPlaces) {
                throw std::runtime_error("Настройка 'decimal_places' не может превышать " +
                                         std::to_string(kMaxDecimalPlaces));
            }
            settings.decimalPlaces = places;
        }
        else if (key == "autosave_interval") {
            settings.autosaveInterval = parseSetting(key, value, lineNumber, false);
        }
    }
    return settings;
}

void saveSettings(const std::filesystem::path& path, const Settings& settings) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream output(path, std::ios::trunc);
    if (!output.is_open()) {
        throw std::runtime_error("Не удалось создать файл настроек: " + path.string());
    }
    output << "# Настройки ratcalc\n";
    output << "decimal_places = " << settings.decimalPlaces << "\n";
    output << "autosave_interval = " << settings.autosaveInterval << "\n";
    if (!output) {
        throw std::runtime_error("Ошибка записи файла настроек: " + path.string());
    }
}

} // namespace ratcalc
