#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "history.hpp"
#include "number.hpp"

namespace ratcalc {

using Bytes = std::vector<std::uint8_t>;

// Запись примитивов в буфер в порядке little-endian
class ByteWriter {
public:
    void writeU8(std::uint8_t value);
    void writeU32(std::uint32_t value);
    void writeI64(std::int64_t value);
    void writeString(const std::string& value); // u32 длина + байты
    void writeBlob(const Bytes& value);         // u32 длина + байты
    void writeNumber(const Number& value);

    const Bytes& bytes() const { return buffer; }
    Bytes release() { return std::move(buffer); }

private:
    Bytes buffer;
};

// Чтение примитивов с проверкой границ.
// Выход за конец буфера — LoadError(Corrupt).
class ByteReader {
public:
    explicit ByteReader(const Bytes& data) : data(data) {}

    std::uint8_t readU8();
    std::uint32_t readU32();
    std::int64_t readI64();
    std::string readString();
    Bytes readBlob();
    Number readNumber();

    bool atEnd() const { return offset == data.size(); }
    std::size_t remaining() const { return data.size() - offset; }

private:
    const Bytes& data;
    std::size_t offset = 0;

    // Проверяет, что в буфере осталось не меньше count байт
    void require(std::size_t count) const;
};

// Полезная нагрузка текущей версии: таблица переменных и сессии
Bytes encodePayload(const HistoryContainer& container);

// Разбор полезной нагрузки версии version с миграцией до текущей
HistoryContainer decodePayload(const Bytes& payload, std::uint32_t version);

// Файл целиком: [u32 версия][сжатый блок]
Bytes encodeFile(const HistoryContainer& container);

// Разбор файла. Выбрасывает LoadError(IncompatibleVersion) для неизвестной
// версии и LoadError(Corrupt) для повреждённых данных.
HistoryContainer decodeFile(const Bytes& file);

} // namespace ratcalc
