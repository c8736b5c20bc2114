/**
 * @file TranscriptRepository.hpp
 * @brief Key-value storage backend for transcript records.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/Transcript.hpp"

namespace podscribe::domain {

/**
 * @class TranscriptRepository
 * @brief Stores records keyed by TranscriptRecord::mediaLocator. Implementations may throw on I/O failure.
 */
class TranscriptRepository {
public:
    virtual ~TranscriptRepository() = default;

    virtual std::optional<TranscriptRecord> find(const std::string& key) = 0;

    /** @brief Inserts or replaces the record stored under record.mediaLocator. */
    virtual void put(const TranscriptRecord& record) = 0;

    virtual std::vector<std::string> keys() = 0;
};

} // namespace podscribe::domain
