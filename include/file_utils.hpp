#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ratcalc {

// Чтение файла целиком. Выбрасывает LoadError(Io), если файл не удалось прочитать.
std::vector<std::uint8_t> readFileBytes(const std::filesystem::path& path);

// Атомарная запись: данные пишутся во временный файл <path>.tmp,
// который затем переименовывается поверх path. Недостающие директории создаются.
// Выбрасывает SaveError(Io).
void writeFileAtomically(const std::filesystem::path& path, const std::vector<std::uint8_t>& bytes);

// Локальное время по метке в миллисекундах: "2024-05-01 14:03:27"
std::string formatTimestamp(std::int64_t milliseconds);

// Директория данных пользователя: $XDG_DATA_HOME/ratcalc,
// затем $HOME/.local/share/ratcalc, иначе текущая директория
std::filesystem::path defaultDataDirectory();

} // namespace ratcalc
