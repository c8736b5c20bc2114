/**
 * @file JsonTranscriptRepository.hpp
 * @brief TranscriptRepository backed by a single JSON document on disk.
 */

#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>

#include "domain/TranscriptRepository.hpp"

namespace podscribe::infrastructure {

/**
 * @class JsonTranscriptRepository
 * @brief Keeps every record in one object keyed by locator.
 *
 * The document is read lazily on first access and rewritten in full on each put()
 * through a temp file and rename, so a crash never leaves a truncated store.
 * Records that fail to parse are written back as found. A document that cannot be
 * parsed at all is moved to a ".corrupt" file before anything new is written.
 */
class JsonTranscriptRepository : public domain::TranscriptRepository {
public:
    explicit JsonTranscriptRepository(std::filesystem::path storePath);

    std::optional<domain::TranscriptRecord> find(const std::string& key) override;

    /** @throws CoreError (PersistenceFailure) when the document cannot be written. */
    void put(const domain::TranscriptRecord& record) override;

    std::vector<std::string> keys() override;

    const std::filesystem::path& path() const { return m_storePath; }

private:
    std::filesystem::path m_storePath;
    std::map<std::string, domain::TranscriptRecord> m_records;
    nlohmann::json m_unreadable = nlohmann::json::object(); ///< Records that failed to parse, kept as found.
    bool m_loaded = false;
    bool m_readOnly = false;
    std::mutex m_mutex;

    void ensureLoaded();
    void setAsideUnreadableDocument();
    void performAtomicWrite(const std::string& content);
};

} // namespace podscribe::infrastructure
