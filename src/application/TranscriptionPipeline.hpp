/**
 * @file TranscriptionPipeline.hpp
 * @brief Download -> locale resolution -> model install -> incremental recognition.
 */

#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "application/StateChannel.hpp"
#include "domain/ContentFetcher.hpp"
#include "domain/IncrementalTranscriber.hpp"
#include "domain/Transcript.hpp"

namespace podscribe::application {

/**
 * @struct TranscriptionConfig
 * @brief Loaded from the "transcription" section of settings.json.
 */
struct TranscriptionConfig {
    std::string deviceLocale;            ///< Empty means "derive from LANG".
    std::string fallbackLocale = "en-US";
    std::string tempDirectory;           ///< Empty means the system temp directory.
};

/**
 * @class TranscriptionStream
 * @brief One lazy, pull-driven transcription run.
 *
 * Nothing happens until next() is called. Each call advances the run by one step and
 * returns the resulting snapshot; after Done or Failed it returns nullopt. The downloaded
 * audio file belongs to the stream and is removed on every exit path.
 */
class TranscriptionStream {
public:
    using Sink = std::function<void(const domain::TranscriptionRun&)>;

    TranscriptionStream(int runId,
                        std::string mediaLocator,
                        std::shared_ptr<domain::ContentFetcher> fetcher,
                        std::shared_ptr<domain::IncrementalTranscriber> transcriber,
                        TranscriptionConfig config,
                        Sink sink = nullptr);
    ~TranscriptionStream();

    TranscriptionStream(const TranscriptionStream&) = delete;
    TranscriptionStream& operator=(const TranscriptionStream&) = delete;

    /** @brief Advances one step. Blocks on network and recognition work. */
    std::optional<domain::TranscriptionRun> next();

    /** @brief Stops the run at the next step boundary. Callable from any thread. */
    void cancel();

    bool isCancelled() const { return m_cancelled.load(); }

    domain::TranscriptionRun current() const;

    int runId() const { return m_runId; }
    const std::string& mediaLocator() const { return m_mediaLocator; }

private:
    enum class Step { Announce, Download, Fetch, Install, Recognize, Finished };

    void download();
    void prepareRecognition();
    void installModel();
    void openSession();
    void recognizeNext();
    std::optional<std::string> resolveLocale() const;

    void fail(domain::ErrorKind kind, const std::string& reason);
    void setStatus(domain::RunStatus status, const std::string& text);
    void updateFraction();
    domain::TranscriptionRun emit();
    std::filesystem::path makeEphemeralPath() const;
    void removeEphemeralAudio();

    const int m_runId;
    const std::string m_mediaLocator;
    std::shared_ptr<domain::ContentFetcher> m_fetcher;
    std::shared_ptr<domain::IncrementalTranscriber> m_transcriber;
    TranscriptionConfig m_config;
    Sink m_sink;

    Step m_step = Step::Announce;
    std::filesystem::path m_audioPath;
    std::unique_ptr<domain::RecognitionSession> m_session;
    double m_totalDuration = 0.0;
    double m_lastProcessedMark = 0.0;
    std::atomic<double> m_processedSeconds{0.0};
    std::atomic<bool> m_cancelled{false};

    mutable std::mutex m_runMutex;
    domain::TranscriptionRun m_run;
};

/**
 * @class TranscriptionPipeline
 * @brief Starts transcription runs and tracks the current one.
 *
 * Only the most recent run writes into the observable state; starting a new run cancels
 * the previous one first.
 */
class TranscriptionPipeline {
public:
    using Listener = StateChannel<domain::TranscriptionRun>::Listener;
    using ListenerId = StateChannel<domain::TranscriptionRun>::ListenerId;

    TranscriptionPipeline(std::shared_ptr<domain::ContentFetcher> fetcher,
                          std::shared_ptr<domain::IncrementalTranscriber> transcriber,
                          TranscriptionConfig config = {});
    ~TranscriptionPipeline();

    TranscriptionPipeline(const TranscriptionPipeline&) = delete;
    TranscriptionPipeline& operator=(const TranscriptionPipeline&) = delete;

    /**
     * @brief Creates a new lazy run for a media locator, cancelling the previous one.
     * @return The stream; the caller drives it with next().
     */
    std::shared_ptr<TranscriptionStream> transcribe(const std::string& mediaLocator);

    /**
     * @brief Drives a new run to its terminal state on the calling thread.
     * @param onUpdate Optional; receives every snapshot in order.
     * @return The terminal snapshot (or the last one seen if the run was cancelled).
     */
    domain::TranscriptionRun run(const std::string& mediaLocator, const Listener& onUpdate = nullptr);

    /**
     * @brief Same as run(), on a worker thread owned by the pipeline.
     *
     * Safe to call from several threads; the previous worker is cancelled and joined
     * before the new one is installed.
     */
    void transcribeAsync(const std::string& mediaLocator, Listener onUpdate = nullptr);

    /** @brief Cancels the current run and waits for the async worker, if any. */
    void cancel();

    domain::TranscriptionRun snapshot() const;

    ListenerId subscribe(Listener listener);
    void unsubscribe(ListenerId id);

private:
    void joinWorker();

    std::shared_ptr<domain::ContentFetcher> m_fetcher;
    std::shared_ptr<domain::IncrementalTranscriber> m_transcriber;
    TranscriptionConfig m_config;

    StateChannel<domain::TranscriptionRun> m_state;
    std::atomic<int> m_currentRunId{0};

    std::mutex m_transitionMutex;
    std::mutex m_mutex;
    std::shared_ptr<TranscriptionStream> m_current;
    std::thread m_worker;
};

} // namespace podscribe::application
