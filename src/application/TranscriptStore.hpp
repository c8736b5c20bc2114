/**
 * @file TranscriptStore.hpp
 * @brief Upsert/lookup of transcript, summary and segments keyed by media locator.
 */

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "domain/Transcript.hpp"
#include "domain/TranscriptRepository.hpp"

namespace podscribe::application {

/**
 * @class TranscriptStore
 * @brief Best-effort persistence: backend failures are logged, never thrown.
 */
class TranscriptStore {
public:
    explicit TranscriptStore(std::shared_ptr<domain::TranscriptRepository> repository);

    /**
     * @brief Inserts or updates the record for a media locator.
     *
     * The transcript is always overwritten. Summary and segments are only overwritten
     * by non-empty values, so a later save without them keeps what was stored before.
     * savedAt is refreshed on every call and never moves backwards.
     *
     * @return False if the backend failed.
     */
    bool save(const std::string& mediaLocator,
              const std::string& transcript,
              const std::optional<std::string>& summary = std::nullopt,
              const std::optional<std::vector<domain::TranscriptSegment>>& segments = std::nullopt);

    /** @brief The stored record, or nullopt if absent or unreadable. */
    std::optional<domain::TranscriptRecord> load(const std::string& mediaLocator);

    /** @brief Trims whitespace and lower-cases the scheme and host. */
    static std::string CanonicalKey(const std::string& mediaLocator);

private:
    std::shared_ptr<domain::TranscriptRepository> m_repository;
    std::mutex m_mutex;
};

} // namespace podscribe::application
