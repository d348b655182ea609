#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "history.hpp"
#include "number.hpp"
#include "settings.hpp"
#include "variable_table.hpp"

namespace ratcalc {

// Результат вычисления, готовый к показу
struct DisplayResult {
    Number value;
    std::string text;     // Десятичная запись с учётом decimalPlaces
    bool precisionLoss = false;
    std::string entryId;  // Идентификатор добавленной записи истории
};

// Точка входа для фронтенда: вычисление выражений поверх хранилища истории.
// Переменные живут в контейнере истории и сохраняются вместе с ним.
class Calculator {
public:
    explicit Calculator(Settings settings = {});

    // Загружает историю из path и запоминает путь для save().
    // При ошибке подставляется пустая история, а ошибка возвращается для уведомления.
    std::optional<LoadError> open(const std::filesystem::path& path);

    // Вычисляет выражение и добавляет запись в историю.
    // Пустой ввод — nullopt без записи. Выбрасывает наследников EngineError,
    // при этом история и переменные не меняются.
    std::optional<DisplayResult> evaluate(const std::string& text);

    // Записи сессии sessionId или, без аргумента, все записи по порядку
    std::vector<HistoryEntry> historyEntries(const std::optional<std::string>& sessionId = std::nullopt) const;

    // Исходный текст записи для повторного редактирования
    std::optional<std::string> reinsert(const std::string& entryId) const;

    VariableSnapshot variables() const;
    bool removeVariable(const std::string& name);

    const std::vector<Session>& sessions() const { return store.sessions(); }

    // Сохранение в файл, переданный в open(). Выбрасывает SaveError.
    void save();

    // Сохраняет, если накопилось не меньше autosaveInterval несохранённых записей.
    // Возвращает true, если сохранение выполнено.
    bool checkpoint();

    std::size_t unsavedEntries() const { return store.unsavedEntries(); }

    std::string format(const Number& value) const;

    const Settings& settings() const { return config; }
    const std::optional<std::filesystem::path>& path() const { return historyPath; }

private:
    Settings config;
    HistoryStore store;
    std::optional<std::filesystem::path> historyPath;
};

} // namespace ratcalc
