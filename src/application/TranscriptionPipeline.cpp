/**
 * @file TranscriptionPipeline.cpp
 * @brief Implementation of TranscriptionStream and TranscriptionPipeline.
 */

#include "application/TranscriptionPipeline.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <random>

namespace podscribe::application {

namespace fs = std::filesystem;

using domain::CoreError;
using domain::ErrorKind;
using domain::RunStatus;
using domain::TranscriptionRun;

namespace {

std::string RandomToken(std::size_t length) {
    static const char alphanum[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(alphanum) - 2);
    std::string s;
    s.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        s += alphanum[pick(rng)];
    }
    return s;
}

// Keeps the payload's extension so downstream decoders can sniff the container.
std::string ExtensionOf(const std::string& locator) {
    std::string path = locator.substr(0, locator.find_first_of("?#"));
    const auto slash = path.find_last_of('/');
    const auto dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return ".audio";

    std::string ext = path.substr(dot);
    if (ext.size() < 2 || ext.size() > 6) return ".audio";
    for (std::size_t i = 1; i < ext.size(); ++i) {
        if (!std::isalnum(static_cast<unsigned char>(ext[i]))) return ".audio";
    }
    return ext;
}

// LC_ALL > LC_MESSAGES > LANG, with the encoding suffix stripped ("pt_BR.UTF-8" -> "pt_BR").
std::string EnvironmentLocale() {
    for (const char* var : {"LC_ALL", "LC_MESSAGES", "LANG"}) {
        const char* value = std::getenv(var);
        if (!value || !*value) continue;
        std::string locale(value);
        locale = locale.substr(0, locale.find_first_of(".@"));
        if (locale == "C" || locale == "POSIX" || locale.empty()) continue;
        return locale;
    }
    return {};
}

} // namespace

// ---------------------------------------------------------------------------
// TranscriptionStream
// ---------------------------------------------------------------------------

TranscriptionStream::TranscriptionStream(int runId,
                                         std::string mediaLocator,
                                         std::shared_ptr<domain::ContentFetcher> fetcher,
                                         std::shared_ptr<domain::IncrementalTranscriber> transcriber,
                                         TranscriptionConfig config,
                                         Sink sink)
    : m_runId(runId)
    , m_mediaLocator(std::move(mediaLocator))
    , m_fetcher(std::move(fetcher))
    , m_transcriber(std::move(transcriber))
    , m_config(std::move(config))
    , m_sink(std::move(sink)) {
    m_run.runId = m_runId;
    m_run.mediaLocator = m_mediaLocator;
    m_run.status = RunStatus::Preparing;
    m_run.statusText = "Preparing...";
}

TranscriptionStream::~TranscriptionStream() {
    m_session.reset();
    removeEphemeralAudio();
}

std::optional<TranscriptionRun> TranscriptionStream::next() {
    if (m_step == Step::Finished) return std::nullopt;

    if (m_cancelled) {
        std::cout << "[TranscriptionStream] Run " << m_runId << " cancelled" << std::endl;
        m_session.reset();
        removeEphemeralAudio();
        m_step = Step::Finished;
        return std::nullopt;
    }

    ErrorKind stageError = ErrorKind::RecognitionFailed;
    try {
        switch (m_step) {
            case Step::Announce:
                m_step = Step::Download;
                return emit();

            case Step::Download:
                setStatus(RunStatus::Downloading, "Downloading audio...");
                m_step = Step::Fetch;
                return emit();

            case Step::Fetch:
                stageError = ErrorKind::DownloadFailed;
                download();
                if (m_cancelled) return next();
                stageError = ErrorKind::RecognitionFailed;
                prepareRecognition();
                if (m_step == Step::Install) return emit();
                openSession();
                return emit();

            case Step::Install:
                stageError = ErrorKind::AssetInstallFailed;
                installModel();
                if (m_cancelled) return next();
                stageError = ErrorKind::RecognitionFailed;
                openSession();
                return emit();

            case Step::Recognize:
                recognizeNext();
                if (m_cancelled) return next();
                return emit();

            case Step::Finished:
                break;
        }
    } catch (const CoreError& e) {
        if (m_cancelled) return next();
        fail(e.kind(), e.what());
        return emit();
    } catch (const std::exception& e) {
        if (m_cancelled) return next();
        fail(stageError, e.what());
        return emit();
    }
    return std::nullopt;
}

void TranscriptionStream::cancel() {
    m_cancelled = true;
}

TranscriptionRun TranscriptionStream::current() const {
    std::lock_guard<std::mutex> lock(m_runMutex);
    return m_run;
}

void TranscriptionStream::download() {
    m_audioPath = makeEphemeralPath();
    std::cout << "[TranscriptionStream] Downloading " << m_mediaLocator << " to " << m_audioPath << std::endl;
    m_fetcher->fetchToFile(m_mediaLocator, m_audioPath.string(),
                           [this](std::uint64_t, std::uint64_t) { return !m_cancelled.load(); });
}

void TranscriptionStream::prepareRecognition() {
    setStatus(RunStatus::Downloading, "Setting up transcriber...");

    if (!m_transcriber->isAvailable()) {
        throw CoreError(ErrorKind::RecognitionFailed, "Speech transcription is not available on this device.");
    }

    auto locale = resolveLocale();
    if (!locale) {
        throw CoreError(ErrorKind::LocaleUnsupported,
                        "No supported speech language is available. Install a recognition model for your language.");
    }
    {
        std::lock_guard<std::mutex> lock(m_runMutex);
        m_run.locale = *locale;
    }
    std::cout << "[TranscriptionStream] Using locale " << *locale << std::endl;

    if (m_transcriber->needsAssetInstall(*locale)) {
        setStatus(RunStatus::InstallingModel, "Downloading speech model...");
        m_step = Step::Install;
    }
}

void TranscriptionStream::installModel() {
    const std::string locale = current().locale;
    m_transcriber->installAssets(locale, [this](double fraction) {
        const int pct = static_cast<int>(std::clamp(fraction, 0.0, 1.0) * 100);
        setStatus(RunStatus::InstallingModel, "Downloading speech model... " + std::to_string(pct) + "%");
        if (m_sink && !m_cancelled) m_sink(current());
        return !m_cancelled.load();
    });
}

void TranscriptionStream::openSession() {
    const std::string locale = current().locale;
    m_session = m_transcriber->openSession(m_audioPath.string(), locale, [this](double processedSeconds) {
        // Only ever moves forward; the recognizer may report overlapping ranges.
        double previous = m_processedSeconds.load();
        while (processedSeconds > previous &&
               !m_processedSeconds.compare_exchange_weak(previous, processedSeconds)) {
        }
    });
    if (!m_session) {
        throw CoreError(ErrorKind::RecognitionFailed, "Recognition session could not be opened.");
    }
    m_totalDuration = m_session->totalDuration();
    setStatus(RunStatus::Transcribing, "Transcribing... 0%");
    m_step = Step::Recognize;
}

void TranscriptionStream::recognizeNext() {
    auto result = m_session->next();

    if (!result) {
        m_session.reset();
        removeEphemeralAudio();
        {
            std::lock_guard<std::mutex> lock(m_runMutex);
            m_run.fractionComplete = 1.0;
            m_run.status = RunStatus::Done;
            m_run.statusText = "Done";
        }
        m_step = Step::Finished;
        std::cout << "[TranscriptionStream] Run " << m_runId << " done" << std::endl;
        return;
    }

    std::string text = result->text;
    text.erase(0, text.find_first_not_of(" \t\r\n"));
    text.erase(text.find_last_not_of(" \t\r\n") + 1);

    const double processed = m_processedSeconds.load();
    {
        std::lock_guard<std::mutex> lock(m_runMutex);
        if (!text.empty()) {
            double start = result->startOffset.value_or(m_lastProcessedMark);
            if (!m_run.segments.empty()) {
                start = std::max(start, m_run.segments.back().startOffset);
            }
            domain::TranscriptSegment segment;
            segment.text = text;
            segment.startOffset = std::max(start, 0.0);
            segment.ordinal = m_run.segments.empty() ? 0 : m_run.segments.back().ordinal + 1;
            m_run.segments.push_back(std::move(segment));

            if (!m_run.text.empty()) m_run.text += ' ';
            m_run.text += text;
        }
    }
    m_lastProcessedMark = std::max(m_lastProcessedMark, processed);
    updateFraction();
}

std::optional<std::string> TranscriptionStream::resolveLocale() const {
    std::string device = m_config.deviceLocale.empty() ? EnvironmentLocale() : m_config.deviceLocale;

    for (const auto& candidate : {device, m_config.fallbackLocale}) {
        if (candidate.empty()) continue;
        if (auto supported = m_transcriber->supportedLocale(candidate)) {
            return supported;
        }
    }

    auto installed = m_transcriber->installedLocales();
    if (!installed.empty()) return installed.front();
    return std::nullopt;
}

void TranscriptionStream::fail(ErrorKind kind, const std::string& reason) {
    std::cerr << "[TranscriptionStream] Run " << m_runId << " failed (" << domain::ErrorKindToString(kind)
              << "): " << reason << std::endl;
    m_session.reset();
    removeEphemeralAudio();
    {
        std::lock_guard<std::mutex> lock(m_runMutex);
        m_run.status = RunStatus::Failed;
        m_run.statusText = "Failed: " + reason;
        m_run.error = domain::RunError{kind, reason};
    }
    m_step = Step::Finished;
}

void TranscriptionStream::setStatus(RunStatus status, const std::string& text) {
    std::lock_guard<std::mutex> lock(m_runMutex);
    m_run.status = status;
    m_run.statusText = text;
}

void TranscriptionStream::updateFraction() {
    std::lock_guard<std::mutex> lock(m_runMutex);
    if (m_totalDuration > 0.0) {
        const double fraction = std::clamp(m_processedSeconds.load() / m_totalDuration, 0.0, 1.0);
        m_run.fractionComplete = std::max(m_run.fractionComplete, fraction);
    }
    const int pct = static_cast<int>(m_run.fractionComplete * 100);
    m_run.statusText = "Transcribing... " + std::to_string(pct) + "%";
}

TranscriptionRun TranscriptionStream::emit() {
    TranscriptionRun snapshot = current();
    if (m_sink && !m_cancelled) {
        m_sink(snapshot);
    }
    return snapshot;
}

fs::path TranscriptionStream::makeEphemeralPath() const {
    fs::path dir = m_config.tempDirectory.empty() ? fs::temp_directory_path() : fs::path(m_config.tempDirectory);
    std::error_code ec;
    fs::create_directories(dir, ec);
    return dir / ("podscribe-" + std::to_string(m_runId) + "-" + RandomToken(12) + ExtensionOf(m_mediaLocator));
}

void TranscriptionStream::removeEphemeralAudio() {
    if (m_audioPath.empty()) return;
    std::error_code ec;
    fs::remove(m_audioPath, ec);
    if (ec) {
        std::cerr << "[TranscriptionStream] Could not remove " << m_audioPath << ": " << ec.message() << std::endl;
    }
    m_audioPath.clear();
}

// ---------------------------------------------------------------------------
// TranscriptionPipeline
// ---------------------------------------------------------------------------

TranscriptionPipeline::TranscriptionPipeline(std::shared_ptr<domain::ContentFetcher> fetcher,
                                             std::shared_ptr<domain::IncrementalTranscriber> transcriber,
                                             TranscriptionConfig config)
    : m_fetcher(std::move(fetcher))
    , m_transcriber(std::move(transcriber))
    , m_config(std::move(config)) {}

TranscriptionPipeline::~TranscriptionPipeline() {
    cancel();
}

std::shared_ptr<TranscriptionStream> TranscriptionPipeline::transcribe(const std::string& mediaLocator) {
    std::shared_ptr<TranscriptionStream> previous;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        previous = m_current;
    }
    if (previous) {
        previous->cancel();
    }

    const int runId = ++m_currentRunId;
    auto sink = [this, runId](const TranscriptionRun& run) {
        m_state.update([this, runId, &run](TranscriptionRun& state) {
            if (runId != m_currentRunId.load()) return false;
            state = run;
            return true;
        });
    };
    auto stream = std::make_shared<TranscriptionStream>(runId, mediaLocator, m_fetcher, m_transcriber, m_config, sink);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_current = stream;
    }
    sink(stream->current());
    return stream;
}

TranscriptionRun TranscriptionPipeline::run(const std::string& mediaLocator, const Listener& onUpdate) {
    auto stream = transcribe(mediaLocator);
    TranscriptionRun last = stream->current();
    while (auto snapshot = stream->next()) {
        last = *snapshot;
        if (onUpdate) onUpdate(last);
    }
    return last;
}

void TranscriptionPipeline::transcribeAsync(const std::string& mediaLocator, Listener onUpdate) {
    // Callers replacing the async run are serialized; each one retires the worker it found.
    std::lock_guard<std::mutex> transition(m_transitionMutex);
    cancel();
    auto stream = transcribe(mediaLocator);

    std::thread worker([stream, onUpdate = std::move(onUpdate)]() {
        try {
            while (auto snapshot = stream->next()) {
                if (onUpdate) onUpdate(*snapshot);
            }
        } catch (const std::exception& e) {
            std::cerr << "[TranscriptionPipeline] Listener error: " << e.what() << std::endl;
            stream->cancel();
        }
    });

    std::thread stale;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        stale = std::move(m_worker);
        m_worker = std::move(worker);
    }
    if (stale.joinable()) {
        stale.join();
    }
}

void TranscriptionPipeline::cancel() {
    std::shared_ptr<TranscriptionStream> current;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        current = m_current;
    }
    if (current) {
        current->cancel();
    }
    joinWorker();
}

void TranscriptionPipeline::joinWorker() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        worker = std::move(m_worker);
    }
    if (!worker.joinable()) return;
    if (worker.get_id() == std::this_thread::get_id()) {
        worker.detach();
    } else {
        worker.join();
    }
}

TranscriptionRun TranscriptionPipeline::snapshot() const {
    return m_state.snapshot();
}

TranscriptionPipeline::ListenerId TranscriptionPipeline::subscribe(Listener listener) {
    return m_state.subscribe(std::move(listener));
}

void TranscriptionPipeline::unsubscribe(ListenerId id) {
    m_state.unsubscribe(id);
}

} // namespace podscribe::application
