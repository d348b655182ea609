#include "calculator.hpp"

#include "evaluator.hpp"
#include "parser.hpp"
#include "user_input.hpp"

namespace ratcalc {

Calculator::Calculator(Settings settings) : config(settings) {}

std::optional<LoadError> Calculator::open(const std::filesystem::path& path) {
    historyPath = path;
    try {
        store.load(path);
    }
    catch (const LoadError& ex) {
        // load уже оставил хранилище пустым
        return ex;
    }
    return std::nullopt;
}

std::optional<DisplayResult> Calculator::evaluate(const std::string& text) {
    if (trim(text).empty()) {
        return std::nullopt;
    }

    // Разбор и вычисление до изменения истории: при исключении ничего не записано
    auto expression = parseText(text);
    Evaluator evaluator(store.variables());
    Number value = evaluator.evaluate(*expression);

    HistoryEntry entry = makeEntry(text, value);
    DisplayResult result{value, format(value), value.inexact(), entry.id};
    store.append(std::move(entry));
    return result;
}

std::vector<HistoryEntry> Calculator::historyEntries(const std::optional<std::string>& sessionId) const {
    if (!sessionId) {
        return store.entries();
    }
    const Session* session = store.findSession(*sessionId);
    if (session == nullptr) {
        return {};
    }
    return session->entries;
}

std::optional<std::string> Calculator::reinsert(const std::string& entryId) const {
    const HistoryEntry* entry = store.findEntry(entryId);
    if (entry == nullptr) {
        return std::nullopt;
    }
    return entry->input;
}

VariableSnapshot Calculator::variables() const {
    return store.variables().snapshot();
}

bool Calculator::removeVariable(const std::string& name) {
    return store.variables().remove(name);
}

void Calculator::save() {
    if (!historyPath) {
        throw SaveError(SaveError::Kind::Io, "не задан файл истории");
    }
    store.save(*historyPath);
}

bool Calculator::checkpoint() {
    if (!historyPath || store.unsavedEntries() < config.autosaveInterval) {
        return false;
    }
    save();
    return true;
}

std::string Calculator::format(const Number& value) const {
    return value.toDecimalString(config.decimalPlaces);
}

} // namespace ratcalc
