/**
 * @file Summarizer.hpp
 * @brief Interface for the external text summarization service.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/Transcript.hpp"

namespace podscribe::domain {

/**
 * @class Summarizer
 * @brief Opaque text-in/text-out collaborator.
 *
 * Both overloads throw CoreError(EmptySummaryResponse) when the service answers with nothing.
 */
class Summarizer {
public:
    virtual ~Summarizer() = default;

    virtual std::string summarize(const std::string& transcript) = 0;

    /** @brief Timestamped variant; the summary is expected to cite [MM:SS] timecodes. */
    virtual std::string summarize(const std::vector<TranscriptSegment>& segments) = 0;
};

} // namespace podscribe::domain
