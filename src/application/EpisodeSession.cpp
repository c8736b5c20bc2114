/**
 * @file EpisodeSession.cpp
 * @brief Implementation of EpisodeSession.
 */

#include "application/EpisodeSession.hpp"

#include <iostream>
#include <stdexcept>

namespace podscribe::application {

using domain::TimecodeParser;
using domain::TimecodeToken;

EpisodeSession::EpisodeSession(domain::Episode episode,
                               std::shared_ptr<PlaybackEngine> engine,
                               std::shared_ptr<TranscriptionPipeline> pipeline,
                               std::shared_ptr<TranscriptStore> store,
                               std::shared_ptr<domain::Summarizer> summarizer)
    : m_episode(std::move(episode))
    , m_engine(std::move(engine))
    , m_pipeline(std::move(pipeline))
    , m_store(std::move(store))
    , m_summarizer(std::move(summarizer)) {}

bool EpisodeSession::restore() {
    if (!m_episode.isPlayable() || !m_store) return false;

    auto record = m_store->load(*m_episode.mediaLocator);
    if (!record) return false;

    std::lock_guard<std::mutex> lock(m_mutex);
    m_transcript = record->transcript;
    m_segments = record->segments.value_or(std::vector<domain::TranscriptSegment>{});
    m_summary = record->summary.value_or("");
    m_saved = true;
    return true;
}

void EpisodeSession::play() {
    m_engine->play(m_episode);
}

domain::TranscriptionRun EpisodeSession::transcribe(const TranscriptionPipeline::Listener& onUpdate) {
    if (!m_episode.isPlayable()) {
        domain::TranscriptionRun run;
        run.status = domain::RunStatus::Failed;
        run.error = domain::RunError{domain::ErrorKind::MediaUnavailable, "Episode has no audio."};
        run.statusText = "Failed: " + run.error->reason;
        return run;
    }

    auto run = m_pipeline->run(*m_episode.mediaLocator, onUpdate);
    if (!run.isTerminal()) {
        // Superseded by a newer run; that run owns the result.
        return run;
    }
    std::cout << "[EpisodeSession] Transcription of '" << m_episode.title << "' ended: "
              << domain::RunStatusToString(run.status) << " (" << run.segments.size() << " segments)" << std::endl;

    // A failed run with nothing recognized leaves the restored transcript alone.
    if (run.status == domain::RunStatus::Done || !run.text.empty()) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_transcript = run.text;
        m_segments = run.segments;
    }
    persist();
    return run;
}

std::shared_ptr<TaskStatus> EpisodeSession::transcribeAsync(AsyncTaskManager& tasks,
                                                            TranscriptionPipeline::Listener onUpdate) {
    return tasks.SubmitTask(TaskType::Transcription, "Transcribe " + m_episode.title,
        [this, onUpdate](std::shared_ptr<TaskStatus> status) {
            auto run = transcribe([&status, &onUpdate](const domain::TranscriptionRun& snapshot) {
                status->progress = static_cast<float>(snapshot.fractionComplete);
                if (onUpdate) onUpdate(snapshot);
            });
            if (run.error) {
                throw std::runtime_error(run.error->reason);
            }
        });
}

std::string EpisodeSession::summarize() {
    std::string transcript;
    std::vector<domain::TranscriptSegment> segments;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        transcript = m_transcript;
        segments = m_segments;
    }
    if (transcript.empty()) {
        throw std::logic_error("Transcribe the episode first, then generate a summary.");
    }
    if (!m_summarizer) {
        throw std::logic_error("No summarizer configured.");
    }

    std::string summary = segments.empty() ? m_summarizer->summarize(transcript)
                                           : m_summarizer->summarize(segments);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_summary = summary;
    }
    persist();
    return summary;
}

std::shared_ptr<TaskStatus> EpisodeSession::summarizeAsync(AsyncTaskManager& tasks) {
    return tasks.SubmitTask(TaskType::Summarization, "Summarize " + m_episode.title,
        [this](std::shared_ptr<TaskStatus>) { summarize(); });
}

std::string EpisodeSession::transcript() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_transcript;
}

std::vector<domain::TranscriptSegment> EpisodeSession::segments() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_segments;
}

std::string EpisodeSession::summary() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_summary;
}

bool EpisodeSession::isSaved() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_saved;
}

std::vector<std::vector<TimecodeToken>> EpisodeSession::summaryLines() const {
    return TimecodeParser::ParseLines(summary());
}

std::vector<TimecodeToken> EpisodeSession::summaryTimecodes() const {
    std::vector<TimecodeToken> timecodes;
    for (auto& token : TimecodeParser::Parse(summary())) {
        if (token.isTimecode()) timecodes.push_back(std::move(token));
    }
    return timecodes;
}

void EpisodeSession::seekToTimecode(double seconds) {
    if (!m_episode.isPlayable()) return;

    if (!m_engine->isActive(m_episode.id)) {
        m_engine->play(m_episode);
    }
    m_engine->seekToPosition(seconds);
}

bool EpisodeSession::activateLine(const std::vector<TimecodeToken>& line) {
    auto target = TimecodeParser::FirstTimecode(line);
    if (!target) return false;
    seekToTimecode(*target);
    return true;
}

void EpisodeSession::persist() {
    if (!m_store || !m_episode.isPlayable()) return;

    std::string transcript;
    std::string summary;
    std::vector<domain::TranscriptSegment> segments;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        transcript = m_transcript;
        summary = m_summary;
        segments = m_segments;
    }
    if (transcript.empty()) return;

    if (m_store->save(*m_episode.mediaLocator, transcript, summary, segments)) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_saved = true;
    }
}

} // namespace podscribe::application
