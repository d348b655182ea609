#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "number.hpp"
#include "variable_table.hpp"

namespace ratcalc {

// Версия формата файла истории, которую пишет эта сборка
constexpr std::uint32_t kCurrentFormatVersion = 2;

// Самая старая версия, для которой есть миграция
constexpr std::uint32_t kOldestSupportedVersion = 1;

// Одна вычисленная запись истории. Не меняется после создания.
struct HistoryEntry {
    std::string id;             // Случайный UUID v4
    std::int64_t timestamp = 0; // Миллисекунды от начала эпохи Unix
    std::string input;          // Исходный текст выражения
    std::optional<Number> result; // Пусто, если записана ошибка
    bool precisionLoss = false;

    bool operator==(const HistoryEntry& other) const;
    bool operator!=(const HistoryEntry& other) const { return !(*this == other); }
};

// Один запуск калькулятора: записи в порядке вычисления
struct Session {
    std::string id;
    std::int64_t startedAt = 0;
    std::vector<HistoryEntry> entries;

    bool operator==(const Session& other) const;
    bool operator!=(const Session& other) const { return !(*this == other); }
};

// Содержимое файла истории
struct HistoryContainer {
    std::uint32_t version = kCurrentFormatVersion;
    VariableTable variables;
    std::vector<Session> sessions; // Упорядочены по времени начала
};

// Новая запись с уникальным идентификатором и текущим временем
HistoryEntry makeEntry(std::string input, const Number& result);

// Случайный идентификатор в виде UUID v4
std::string generateId();

// Текущее время в миллисекундах от начала эпохи Unix
std::int64_t currentTimestamp();

// Хранилище истории: единственный владелец контейнера в памяти.
// Новые записи добавляются только через append, сессии упорядочены по времени начала.
class HistoryStore {
public:
    HistoryStore() = default;

    // Загружает контейнер из файла. Отсутствующий файл означает первый запуск.
    // При ошибке хранилище остаётся пустым и выбрасывается LoadError.
    void load(const std::filesystem::path& path);

    // Сериализует, сжимает и атомарно записывает контейнер.
    // Выбрасывает SaveError, записи в памяти при этом сохраняются.
    void save(const std::filesystem::path& path);

    // Сбрасывает хранилище в пустое состояние
    void clear();

    // Добавляет запись в сессию текущего запуска, создавая её при первой записи
    void append(HistoryEntry entry);

    // Все сессии, от ранних к поздним
    const std::vector<Session>& sessions() const { return container.sessions; }

    // Сессия, начатая последней (выбор по умолчанию), nullptr если сессий нет
    const Session* latestSession() const;

    const Session* findSession(const std::string& id) const;
    const HistoryEntry* findEntry(const std::string& id) const;

    // Все записи всех сессий в хронологическом порядке
    std::vector<HistoryEntry> entries() const;

    // Таблица переменных, принадлежащая контейнеру
    VariableTable& variables() { return container.variables; }
    const VariableTable& variables() const { return container.variables; }

    // Число записей, добавленных после последнего сохранения или загрузки
    std::size_t unsavedEntries() const { return pending; }

    const HistoryContainer& data() const { return container; }

private:
    HistoryContainer container;
    std::optional<std::string> currentSessionId; // Сессия этого запуска
    std::size_t pending = 0;

    Session& currentSession();
};

} // namespace ratcalc
