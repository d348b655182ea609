#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace ratcalc {

// Безопасный парсинг неотрицательного целого из строки.
// Ноль допускается только при allowZero.
std::size_t parseNumber(const std::string& value, bool allowZero = false);

// Удаление пробелов и табуляций по краям
std::string trim(const std::string& value);

// Чтение строки после приглашения. nullopt, если ввод закончился (EOF).
std::optional<std::string> readLine(const std::string& prompt);

} // namespace ratcalc
