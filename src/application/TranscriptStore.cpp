/**
 * @file TranscriptStore.cpp
 * @brief Implementation of TranscriptStore.
 */

#include "application/TranscriptStore.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>

namespace podscribe::application {

using domain::TranscriptRecord;

TranscriptStore::TranscriptStore(std::shared_ptr<domain::TranscriptRepository> repository)
    : m_repository(std::move(repository)) {}

bool TranscriptStore::save(const std::string& mediaLocator,
                           const std::string& transcript,
                           const std::optional<std::string>& summary,
                           const std::optional<std::vector<domain::TranscriptSegment>>& segments) {
    const std::string key = CanonicalKey(mediaLocator);
    if (key.empty()) return false;

    const bool hasSummary = summary && !summary->empty();
    const bool hasSegments = segments && !segments->empty();

    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        auto now = std::chrono::system_clock::now();
        auto existing = m_repository->find(key);

        TranscriptRecord record;
        if (existing) {
            record = std::move(*existing);
            record.savedAt = std::max(now, record.savedAt);
        } else {
            record.mediaLocator = key;
            record.savedAt = now;
        }

        record.transcript = transcript;
        if (hasSummary) record.summary = summary;
        if (hasSegments) record.segments = segments;

        m_repository->put(record);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[TranscriptStore] PersistenceFailure saving " << key << ": " << e.what() << std::endl;
        return false;
    }
}

std::optional<TranscriptRecord> TranscriptStore::load(const std::string& mediaLocator) {
    const std::string key = CanonicalKey(mediaLocator);
    if (key.empty()) return std::nullopt;

    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        return m_repository->find(key);
    } catch (const std::exception& e) {
        std::cerr << "[TranscriptStore] PersistenceFailure loading " << key << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::string TranscriptStore::CanonicalKey(const std::string& mediaLocator) {
    const auto first = mediaLocator.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = mediaLocator.find_last_not_of(" \t\r\n");
    std::string key = mediaLocator.substr(first, last - first + 1);

    const auto schemeEnd = key.find("://");
    if (schemeEnd == std::string::npos) return key;

    auto authorityEnd = key.find_first_of("/?#", schemeEnd + 3);
    if (authorityEnd == std::string::npos) authorityEnd = key.size();

    // userinfo is case sensitive; only the host part after '@' is folded.
    auto hostStart = key.rfind('@', authorityEnd);
    hostStart = (hostStart == std::string::npos || hostStart < schemeEnd) ? schemeEnd + 3 : hostStart + 1;

    auto lower = [](unsigned char c) { return static_cast<char>(std::tolower(c)); };
    std::transform(key.begin(), key.begin() + static_cast<std::ptrdiff_t>(schemeEnd), key.begin(), lower);
    std::transform(key.begin() + static_cast<std::ptrdiff_t>(hostStart),
                   key.begin() + static_cast<std::ptrdiff_t>(authorityEnd),
                   key.begin() + static_cast<std::ptrdiff_t>(hostStart), lower);
    return key;
}

} // namespace podscribe::application
