#include "history_codec.hpp"

#include "compression.hpp"
#include "errors.hpp"

#include <algorithm>
#include <iterator>

namespace ratcalc {

// ------------------------------------------------------------------
// ByteWriter
// ------------------------------------------------------------------

void ByteWriter::writeU8(std::uint8_t value) {
    buffer.push_back(value);
}

void ByteWriter::writeU32(std::uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        buffer.push_back(static_cast<std::uint8_t>(value >> (8 * i)));
    }
}

void ByteWriter::writeI64(std::int64_t value) {
    const auto bits = static_cast<std::uint64_t>(value);
    for (int i = 0; i < 8; ++i) {
        buffer.push_back(static_cast<std::uint8_t>(bits >> (8 * i)));
    }
}

void ByteWriter::writeString(const std::string& value) {
    writeU32(static_cast<std::uint32_t>(value.size()));
    buffer.insert(buffer.end(), value.begin(), value.end());
}

void ByteWriter::writeBlob(const Bytes& value) {
    writeU32(static_cast<std::uint32_t>(value.size()));
    buffer.insert(buffer.end(), value.begin(), value.end());
}

// Число: [u8 знак][модуль числителя][знаменатель][u8 флаг неточности],
// целые части записываются старшим байтом вперёд
void ByteWriter::writeNumber(const Number& value) {
    Bytes numerator;
    Bytes denominator;
    boost::multiprecision::export_bits(BigInt(boost::multiprecision::abs(value.numerator())),
                                       std::back_inserter(numerator), 8);
    boost::multiprecision::export_bits(value.denominator(), std::back_inserter(denominator), 8);

    writeU8(value.isNegative() ? 1 : 0);
    writeBlob(numerator);
    writeBlob(denominator);
    writeU8(value.inexact() ? 1 : 0);
}

// ------------------------------------------------------------------
// ByteReader
// ------------------------------------------------------------------

void ByteReader::require(std::size_t count) const {
    if (count > remaining()) {
        throw LoadError(LoadError::Kind::Corrupt, "неожиданный конец данных");
    }
}

std::uint8_t ByteReader::readU8() {
    require(1);
    return data[offset++];
}

std::uint32_t ByteReader::readU32() {
    require(4);
    std::uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<std::uint32_t>(data[offset++]) << (8 * i);
    }
    return value;
}

std::int64_t ByteReader::readI64() {
    require(8);
    std::uint64_t bits = 0;
    for (int i = 0; i < 8; ++i) {
        bits |= static_cast<std::uint64_t>(data[offset++]) << (8 * i);
    }
    return static_cast<std::int64_t>(bits);
}

std::string ByteReader::readString() {
    std::uint32_t length = readU32();
    require(length);
    std::string value(data.begin() + offset, data.begin() + offset + length);
    offset += length;
    return value;
}

Bytes ByteReader::readBlob() {
    std::uint32_t length = readU32();
    require(length);
    Bytes value(data.begin() + offset, data.begin() + offset + length);
    offset += length;
    return value;
}

Number ByteReader::readNumber() {
    std::uint8_t negative = readU8();
    Bytes numeratorBytes = readBlob();
    Bytes denominatorBytes = readBlob();
    std::uint8_t inexact = readU8();
    if (negative > 1 || inexact > 1) {
        throw LoadError(LoadError::Kind::Corrupt, "недопустимый флаг числа");
    }

    BigInt numerator;
    BigInt denominator;
    boost::multiprecision::import_bits(numerator, numeratorBytes.begin(), numeratorBytes.end(), 8);
    boost::multiprecision::import_bits(denominator, denominatorBytes.begin(), denominatorBytes.end(), 8);
    if (denominator == 0) {
        throw LoadError(LoadError::Kind::Corrupt, "нулевой знаменатель");
    }
    if (negative == 1) {
        numerator = -numerator;
    }
    return Number(std::move(numerator), std::move(denominator), inexact == 1);
}

// ------------------------------------------------------------------
// Полезная нагрузка
// ------------------------------------------------------------------

namespace {

void writeEntry(ByteWriter& writer, const HistoryEntry& entry) {
    writer.writeString(entry.id);
    writer.writeI64(entry.timestamp);
    writer.writeString(entry.input);
    writer.writeU8(entry.result ? 1 : 0);
    if (entry.result) {
        writer.writeNumber(*entry.result);
    }
    writer.writeU8(entry.precisionLoss ? 1 : 0);
}

HistoryEntry readEntry(ByteReader& reader) {
    HistoryEntry entry;
    entry.id = reader.readString();
    entry.timestamp = reader.readI64();
    entry.input = reader.readString();
    std::uint8_t hasResult = reader.readU8();
    if (hasResult > 1) {
        throw LoadError(LoadError::Kind::Corrupt, "недопустимый признак результата");
    }
    if (hasResult == 1) {
        entry.result = reader.readNumber();
    }
    std::uint8_t precisionLoss = reader.readU8();
    if (precisionLoss > 1) {
        throw LoadError(LoadError::Kind::Corrupt, "недопустимый признак потери точности");
    }
    entry.precisionLoss = precisionLoss == 1;
    return entry;
}

Session readSession(ByteReader& reader) {
    Session session;
    session.id = reader.readString();
    session.startedAt = reader.readI64();
    std::uint32_t count = reader.readU32();
    for (std::uint32_t i = 0; i < count; ++i) {
        session.entries.push_back(readEntry(reader));
    }
    return session;
}

// Таблица переменных появилась в версии 2
VariableSnapshot readVariables(ByteReader& reader) {
    VariableSnapshot snapshot;
    std::uint32_t count = reader.readU32();
    for (std::uint32_t i = 0; i < count; ++i) {
        std::string name = reader.readString();
        snapshot[name] = reader.readNumber();
    }
    return snapshot;
}

} // namespace

Bytes encodePayload(const HistoryContainer& container) {
    ByteWriter writer;

    VariableSnapshot variables = container.variables.snapshot();
    writer.writeU32(static_cast<std::uint32_t>(variables.size()));
    for (const auto& [name, value] : variables) {
        writer.writeString(name);
        writer.writeNumber(value);
    }

    writer.writeU32(static_cast<std::uint32_t>(container.sessions.size()));
    for (const auto& session : container.sessions) {
        writer.writeString(session.id);
        writer.writeI64(session.startedAt);
        writer.writeU32(static_cast<std::uint32_t>(session.entries.size()));
        for (const auto& entry : session.entries) {
            writeEntry(writer, entry);
        }
    }
    return writer.release();
}

HistoryContainer decodePayload(const Bytes& payload, std::uint32_t version) {
    if (version < kOldestSupportedVersion || version > kCurrentFormatVersion) {
        throw LoadError(LoadError::Kind::IncompatibleVersion,
                        "версия " + std::to_string(version) + " не поддерживается");
    }

    ByteReader reader(payload);
    HistoryContainer container;

    // Версия 1 не хранила переменные: после миграции таблица пуста
    if (version >= 2) {
        VariableSnapshot snapshot = readVariables(reader);
        try {
            container.variables.restore(snapshot);
        }
        catch (const EvalError& ex) {
            throw LoadError(LoadError::Kind::Corrupt, ex.what());
        }
    }

    std::uint32_t count = reader.readU32();
    for (std::uint32_t i = 0; i < count; ++i) {
        container.sessions.push_back(readSession(reader));
    }
    if (!reader.atEnd()) {
        throw LoadError(LoadError::Kind::Corrupt, "лишние данные после истории");
    }

    // Порядок в файле не важен, в памяти сессии идут по времени начала
    std::stable_sort(container.sessions.begin(), container.sessions.end(),
                     [](const Session& a, const Session& b) { return a.startedAt < b.startedAt; });
    container.version = kCurrentFormatVersion;
    return container;
}

Bytes encodeFile(const HistoryContainer& container) {
    ByteWriter writer;
    writer.writeU32(kCurrentFormatVersion);
    Bytes file = writer.release();

    Bytes block = compressBlock(encodePayload(container));
    file.insert(file.end(), block.begin(), block.end());
    return file;
}

// Версия проверяется до распаковки и разбора полезной нагрузки
HistoryContainer decodeFile(const Bytes& file) {
    ByteReader reader(file);
    std::uint32_t version = reader.readU32();
    if (version < kOldestSupportedVersion || version > kCurrentFormatVersion) {
        throw LoadError(LoadError::Kind::IncompatibleVersion,
                        "версия " + std::to_string(version) + " не поддерживается");
    }

    Bytes block(file.begin() + 4, file.end());
    return decodePayload(decompressBlock(block), version);
}

} // namespace ratcalc
