#include "history.hpp"

#include "errors.hpp"
#include "file_utils.hpp"
#include "history_codec.hpp"

#include <algorithm>
#include <chrono>
#include <system_error>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace ratcalc {

bool HistoryEntry::operator==(const HistoryEntry& other) const {
    return id == other.id && timestamp == other.timestamp && input == other.input &&
           result == other.result && precisionLoss == other.precisionLoss;
}

bool Session::operator==(const Session& other) const {
    return id == other.id && startedAt == other.startedAt && entries == other.entries;
}

HistoryEntry makeEntry(std::string input, const Number& result) {
    HistoryEntry entry;
    entry.id = generateId();
    entry.timestamp = currentTimestamp();
    entry.input = std::move(input);
    entry.result = result;
    entry.precisionLoss = result.inexact();
    return entry;
}

// UUID версии 4, генератор засевается из системного источника энтропии целиком
std::string generateId() {
    static boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

std::int64_t currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

void HistoryStore::load(const std::filesystem::path& path) {
    clear();

    std::error_code ec;
    bool exists = std::filesystem::exists(path, ec);
    if (ec) {
        throw LoadError(LoadError::Kind::Io, path.string() + ": " + ec.message());
    }
    if (!exists) {
        // Первый запуск: пустая история
        return;
    }

    try {
        container = decodeFile(readFileBytes(path));
    }
    catch (const LoadError&) {
        clear();
        throw;
    }
}

void HistoryStore::save(const std::filesystem::path& path) {
    writeFileAtomically(path, encodeFile(container));
    pending = 0;
}

void HistoryStore::clear() {
    container = HistoryContainer{};
    currentSessionId.reset();
    pending = 0;
}

void HistoryStore::append(HistoryEntry entry) {
    currentSession().entries.push_back(std::move(entry));
    ++pending;
}

Session& HistoryStore::currentSession() {
    auto& sessions = container.sessions;
    if (currentSessionId) {
        auto it = std::find_if(sessions.begin(), sessions.end(),
                               [this](const Session& s) { return s.id == *currentSessionId; });
        if (it != sessions.end()) {
            return *it;
        }
    }

    // Сессия создаётся при первой записи запуска
    Session session;
    session.id = generateId();
    session.startedAt = currentTimestamp();
    currentSessionId = session.id;

    auto position = std::upper_bound(sessions.begin(), sessions.end(), session.startedAt,
                                     [](std::int64_t time, const Session& s) { return time < s.startedAt; });
    return *sessions.insert(position, std::move(session));
}

const Session* HistoryStore::latestSession() const {
    if (container.sessions.empty()) {
        return nullptr;
    }
    return &container.sessions.back();
}

const Session* HistoryStore::findSession(const std::string& id) const {
    for (const auto& session : container.sessions) {
        if (session.id == id) {
            return &session;
        }
    }
    return nullptr;
}

const HistoryEntry* HistoryStore::findEntry(const std::string& id) const {
    for (const auto& session : container.sessions) {
        for (const auto& entry : session.entries) {
            if (entry.id == id) {
                return &entry;
            }
        }
    }
    return nullptr;
}

std::vector<HistoryEntry> HistoryStore::entries() const {
    std::vector<HistoryEntry> all;
    for (const auto& session : container.sessions) {
        all.insert(all.end(), session.entries.begin(), session.entries.end());
    }
    return all;
}

} // namespace ratcalc
