/**
 * @file JsonTranscriptRepository.cpp
 * @brief Implementation of JsonTranscriptRepository.
 */

#include "infrastructure/JsonTranscriptRepository.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace podscribe::domain {

// ADL hooks for nlohmann::json
void to_json(nlohmann::json& j, const TranscriptSegment& segment) {
    j = nlohmann::json{{"text", segment.text}, {"start", segment.startOffset}, {"ordinal", segment.ordinal}};
}

void from_json(const nlohmann::json& j, TranscriptSegment& segment) {
    segment.text = j.value("text", std::string{});
    segment.startOffset = j.value("start", 0.0);
    segment.ordinal = j.value("ordinal", 0);
}

} // namespace podscribe::domain

namespace podscribe::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;
using domain::CoreError;
using domain::ErrorKind;
using domain::TranscriptRecord;

namespace {

json RecordToJson(const TranscriptRecord& record) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        record.savedAt.time_since_epoch()).count();
    json j = {
        {"transcript", record.transcript},
        {"saved_at", millis}
    };
    if (record.summary) {
        j["summary"] = *record.summary;
    }
    if (record.segments) {
        j["segments"] = *record.segments;
    }
    return j;
}

TranscriptRecord RecordFromJson(const std::string& key, const json& j) {
    TranscriptRecord record;
    record.mediaLocator = key;
    record.transcript = j.value("transcript", std::string{});
    if (j.contains("summary") && j["summary"].is_string()) {
        record.summary = j["summary"].get<std::string>();
    }
    if (j.contains("segments") && j["segments"].is_array()) {
        record.segments = j["segments"].get<std::vector<domain::TranscriptSegment>>();
    }
    record.savedAt = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(j.value("saved_at", static_cast<long long>(0))));
    return record;
}

} // namespace

JsonTranscriptRepository::JsonTranscriptRepository(fs::path storePath)
    : m_storePath(std::move(storePath)) {}

void JsonTranscriptRepository::ensureLoaded() {
    if (m_loaded) return;
    m_loaded = true;

    if (!fs::exists(m_storePath)) {
        return;
    }

    json j;
    try {
        std::ifstream f(m_storePath);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[JsonTranscriptRepository] Failed to parse " << m_storePath << ": " << e.what() << std::endl;
        setAsideUnreadableDocument();
        return;
    }
    if (!j.is_object()) {
        std::cerr << "[JsonTranscriptRepository] Not an object document: " << m_storePath << std::endl;
        setAsideUnreadableDocument();
        return;
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        try {
            m_records[it.key()] = RecordFromJson(it.key(), it.value());
        } catch (const std::exception& e) {
            // Kept verbatim so the next write carries it forward untouched.
            std::cerr << "[JsonTranscriptRepository] Skipping unreadable record '" << it.key() << "': "
                      << e.what() << std::endl;
            m_unreadable[it.key()] = it.value();
        }
    }
    std::cout << "[JsonTranscriptRepository] Loaded " << m_records.size() << " records from " << m_storePath << std::endl;
}

void JsonTranscriptRepository::setAsideUnreadableDocument() {
    fs::path aside = m_storePath;
    aside += "." + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) + ".corrupt";

    std::error_code ec;
    fs::rename(m_storePath, aside, ec);
    if (ec) {
        std::cerr << "[JsonTranscriptRepository] Cannot move " << m_storePath << " aside (" << ec.message()
                  << "); store is read-only" << std::endl;
        m_readOnly = true;
        return;
    }
    std::cerr << "[JsonTranscriptRepository] Moved unreadable store to " << aside << std::endl;
}

std::optional<TranscriptRecord> JsonTranscriptRepository::find(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ensureLoaded();
    auto it = m_records.find(key);
    if (it == m_records.end()) {
        return std::nullopt;
    }
    return it->second;
}

void JsonTranscriptRepository::put(const TranscriptRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ensureLoaded();
    if (m_readOnly) {
        throw CoreError(ErrorKind::PersistenceFailure,
                        "Refusing to overwrite unreadable store " + m_storePath.string());
    }

    auto previous = m_records.find(record.mediaLocator);
    std::optional<TranscriptRecord> rollback;
    if (previous != m_records.end()) {
        rollback = previous->second;
    }
    m_records[record.mediaLocator] = record;

    json doc = m_unreadable;
    doc.erase(record.mediaLocator);
    for (const auto& [key, value] : m_records) {
        doc[key] = RecordToJson(value);
    }

    try {
        performAtomicWrite(doc.dump(2));
    } catch (const CoreError&) {
        if (rollback) {
            m_records[record.mediaLocator] = *rollback;
        } else {
            m_records.erase(record.mediaLocator);
        }
        throw;
    }
    m_unreadable.erase(record.mediaLocator);
}

std::vector<std::string> JsonTranscriptRepository::keys() {
    std::lock_guard<std::mutex> lock(m_mutex);
    ensureLoaded();
    std::vector<std::string> result;
    result.reserve(m_records.size());
    for (const auto& entry : m_records) {
        result.push_back(entry.first);
    }
    return result;
}

void JsonTranscriptRepository::performAtomicWrite(const std::string& content) {
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = m_storePath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    std::error_code ec;
    if (m_storePath.has_parent_path()) {
        fs::create_directories(m_storePath.parent_path(), ec);
        if (ec) {
            throw CoreError(ErrorKind::PersistenceFailure,
                            "Cannot create " + m_storePath.parent_path().string() + ": " + ec.message());
        }
    }

    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            throw CoreError(ErrorKind::PersistenceFailure, "Cannot open temp file " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            fs::remove(tempPath, ec);
            throw CoreError(ErrorKind::PersistenceFailure, "Write failed for " + tempPath.string());
        }
    }

    fs::rename(tempPath, m_storePath, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(tempPath, ec);
        throw CoreError(ErrorKind::PersistenceFailure, "Rename to " + m_storePath.string() + " failed: " + reason);
    }
}

} // namespace podscribe::infrastructure
