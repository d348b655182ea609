#include "file_utils.hpp"

#include "errors.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <system_error>

namespace ratcalc {

std::vector<std::uint8_t> readFileBytes(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw LoadError(LoadError::Kind::Io, "не удалось открыть файл " + path.string());
    }

    std::vector<std::uint8_t> bytes{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
    if (input.bad()) {
        throw LoadError(LoadError::Kind::Io, "ошибка чтения файла " + path.string());
    }
    return bytes;
}

void writeFileAtomically(const std::filesystem::path& path, const std::vector<std::uint8_t>& bytes) {
    std::error_code ec;
    std::filesystem::path directory = path.parent_path();
    if (!directory.empty()) {
        std::filesystem::create_directories(directory, ec);
        if (ec) {
            throw SaveError(SaveError::Kind::Io, "не удалось создать директорию " + directory.string() + ": " + ec.message());
        }
    }

    std::filesystem::path temporary = path;
    temporary += ".tmp";

    {
        std::ofstream output(temporary, std::ios::binary | std::ios::trunc);
        if (!output.is_open()) {
            throw SaveError(SaveError::Kind::Io, "не удалось открыть файл " + temporary.string());
        }
        output.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        output.flush();
        if (!output) {
            output.close();
            std::filesystem::remove(temporary, ec);
            throw SaveError(SaveError::Kind::Io, "ошибка записи файла " + temporary.string());
        }
    }

    // Старый файл заменяется только полностью записанным новым
    std::filesystem::rename(temporary, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temporary, ignored);
        throw SaveError(SaveError::Kind::Io, "не удалось заменить " + path.string() + ": " + ec.message());
    }
}

std::string formatTimestamp(std::int64_t milliseconds) {
    std::chrono::system_clock::time_point point{std::chrono::milliseconds(milliseconds)};
    auto time = std::chrono::system_clock::to_time_t(point);
    std::tm tm_buf;

#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::filesystem::path defaultDataDirectory() {
    const char* dataHome = std::getenv("XDG_DATA_HOME");
    if (dataHome != nullptr && *dataHome != '\0') {
        return std::filesystem::path(dataHome) / "ratcalc";
    }

    const char* home = std::getenv("HOME");
    if (home != nullptr && *home != '\0') {
        return std::filesystem::path(home) / ".local" / "share" / "ratcalc";
    }

    return std::filesystem::current_path();
}

} // namespace ratcalc
