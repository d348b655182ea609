#include "compression.hpp"

#include "errors.hpp"

#include <string>

#include <zlib.h>

namespace ratcalc {

namespace {
constexpr std::size_t kSizePrefix = 4;
}

std::vector<std::uint8_t> compressBlock(const std::vector<std::uint8_t>& data) {
    if (data.size() > kMaxUncompressedSize) {
        throw SaveError(SaveError::Kind::Io, "история превышает допустимый размер");
    }

    const auto size = static_cast<std::uint32_t>(data.size());
    uLongf compressedSize = compressBound(static_cast<uLong>(size));
    std::vector<std::uint8_t> block(kSizePrefix + compressedSize);

    // Исходный размер в little-endian перед потоком
    for (std::size_t i = 0; i < kSizePrefix; ++i) {
        block[i] = static_cast<std::uint8_t>(size >> (8 * i));
    }

    int status = compress2(block.data() + kSizePrefix, &compressedSize,
                           data.data(), static_cast<uLong>(size), Z_DEFAULT_COMPRESSION);
    if (status != Z_OK) {
        throw SaveError(SaveError::Kind::Io, "ошибка сжатия zlib (код " + std::to_string(status) + ")");
    }

    block.resize(kSizePrefix + compressedSize);
    return block;
}

std::vector<std::uint8_t> decompressBlock(const std::vector<std::uint8_t>& block) {
    if (block.size() <= kSizePrefix) {
        throw LoadError(LoadError::Kind::Corrupt, "сжатый блок обрезан");
    }

    std::uint32_t size = 0;
    for (std::size_t i = 0; i < kSizePrefix; ++i) {
        size |= static_cast<std::uint32_t>(block[i]) << (8 * i);
    }
    if (size == 0 || size > kMaxUncompressedSize) {
        throw LoadError(LoadError::Kind::Corrupt, "недопустимый размер данных " + std::to_string(size));
    }

    std::vector<std::uint8_t> data(size);
    uLongf length = size;
    uLong consumed = static_cast<uLong>(block.size() - kSizePrefix);
    int status = uncompress2(data.data(), &length, block.data() + kSizePrefix, &consumed);

    // Поток должен распаковаться ровно в заявленный размер и занять весь блок
    if (status != Z_OK) {
        throw LoadError(LoadError::Kind::Corrupt, "ошибка распаковки zlib (код " + std::to_string(status) + ")");
    }
    if (length != size || consumed != block.size() - kSizePrefix) {
        throw LoadError(LoadError::Kind::Corrupt, "размер распакованных данных не совпадает");
    }
    return data;
}

} // namespace ratcalc
