#pragma once

#include <cstddef>
#include <filesystem>

namespace ratcalc {

// Настройки калькулятора. Ядро использует только decimalPlaces.
struct Settings {
    std::size_t decimalPlaces = 6;     // Знаков после запятой при выводе
    std::size_t autosaveInterval = 10; // Несохранённых записей до автосохранения
};

// Читает файл настроек вида "ключ = значение" (комментарии начинаются с #).
// Неизвестные ключи пропускаются, некорректное значение — std::runtime_error.
// Если файла нет, он создаётся со значениями по умолчанию.
Settings loadSettings(const std::filesystem::path& path);

// Записывает настройки в файл
void saveSettings(const std::filesystem::path& path, const Settings& settings);

} // namespace ratcalc
