#pragma once

#include <cstdint>
#include <vector>

namespace ratcalc {

// Сжатый блок: [u32 исходный размер][поток zlib]
// Размер исходных данных хранится перед потоком, чтобы выделить буфер заранее.
std::vector<std::uint8_t> compressBlock(const std::vector<std::uint8_t>& data);

// Распаковка блока. Выбрасывает LoadError(Corrupt), если поток повреждён,
// обрезан или его размер не совпадает с заявленным.
std::vector<std::uint8_t> decompressBlock(const std::vector<std::uint8_t>& block);

// Предельный размер распакованных данных (256 МБ)
constexpr std::uint32_t kMaxUncompressedSize = 256u * 1024u * 1024u;

} // namespace ratcalc
