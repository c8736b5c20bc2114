/**
 * @file EpisodeSession.hpp
 * @brief Ties one episode to the playback engine, the transcription pipeline and the store.
 */

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "application/AsyncTaskManager.hpp"
#include "application/PlaybackEngine.hpp"
#include "application/TranscriptStore.hpp"
#include "application/TranscriptionPipeline.hpp"
#include "domain/Episode.hpp"
#include "domain/Summarizer.hpp"
#include "domain/TimecodeParser.hpp"

namespace podscribe::application {

/**
 * @class EpisodeSession
 * @brief Per-episode composition of the core services.
 *
 * Holds the episode's transcript, segments and summary as last restored, transcribed or
 * summarized, and turns timecodes found in the summary into seeks on the shared engine.
 */
class EpisodeSession {
public:
    EpisodeSession(domain::Episode episode,
                   std::shared_ptr<PlaybackEngine> engine,
                   std::shared_ptr<TranscriptionPipeline> pipeline,
                   std::shared_ptr<TranscriptStore> store,
                   std::shared_ptr<domain::Summarizer> summarizer = nullptr);

    const domain::Episode& episode() const { return m_episode; }

    /** @brief Loads a previously saved transcript and summary. @return True if one existed. */
    bool restore();

    /** @brief Plays (or resumes) this episode on the shared engine. */
    void play();

    /**
     * @brief Runs a transcription to its terminal state on the calling thread.
     *
     * Whatever text was recognized is persisted afterwards, including the partial output
     * of a failed run.
     */
    domain::TranscriptionRun transcribe(const TranscriptionPipeline::Listener& onUpdate = nullptr);

    /** @brief transcribe() as a background task; progress mirrors fractionComplete. */
    std::shared_ptr<TaskStatus> transcribeAsync(AsyncTaskManager& tasks,
                                                TranscriptionPipeline::Listener onUpdate = nullptr);

    /**
     * @brief Requests a summary of the current transcript and persists it.
     * @throws std::logic_error without a transcript or summarizer.
     * @throws domain::CoreError (EmptySummaryResponse) when the service returns nothing.
     */
    std::string summarize();

    std::shared_ptr<TaskStatus> summarizeAsync(AsyncTaskManager& tasks);

    std::string transcript() const;
    std::vector<domain::TranscriptSegment> segments() const;
    std::string summary() const;
    bool isSaved() const;

    /** @brief Summary tokens, one vector per line. */
    std::vector<std::vector<domain::TimecodeToken>> summaryLines() const;

    /** @brief Every timecode cited by the summary, in order. */
    std::vector<domain::TimecodeToken> summaryTimecodes() const;

    /**
     * @brief Moves playback of this episode to an absolute position, starting it if needed.
     */
    void seekToTimecode(double seconds);

    /** @brief Seeks to the first timecode on a summary line. @return False if it has none. */
    bool activateLine(const std::vector<domain::TimecodeToken>& line);

private:
    void persist();

    domain::Episode m_episode;
    std::shared_ptr<PlaybackEngine> m_engine;
    std::shared_ptr<TranscriptionPipeline> m_pipeline;
    std::shared_ptr<TranscriptStore> m_store;
    std::shared_ptr<domain::Summarizer> m_summarizer;

    mutable std::mutex m_mutex;
    std::string m_transcript;
    std::vector<domain::TranscriptSegment> m_segments;
    std::string m_summary;
    bool m_saved = false;
};

} // namespace podscribe::application
