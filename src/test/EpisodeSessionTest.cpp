#include <cassert>
#include <iostream>

#include "application/AsyncTaskManager.hpp"
#include "application/EpisodeSession.hpp"
#include "TestDoubles.hpp"

using namespace podscribe;
using application::EpisodeSession;
using domain::RunStatus;
using domain::TransportPhase;

namespace {

const std::string kLocator = "https://cdn.example.com/show/ep42.mp3";

struct Fixture {
    test::ScratchDir dir{"session"};
    std::shared_ptr<test::FakeMediaPlayer> player = std::make_shared<test::FakeMediaPlayer>();
    std::shared_ptr<test::FakeTransportSurface> surface = std::make_shared<test::FakeTransportSurface>();
    std::shared_ptr<test::FakeContentFetcher> fetcher = std::make_shared<test::FakeContentFetcher>();
    std::shared_ptr<test::FakeTranscriber> transcriber = std::make_shared<test::FakeTranscriber>();
    std::shared_ptr<test::InMemoryRepository> repository = std::make_shared<test::InMemoryRepository>();
    std::shared_ptr<test::FakeSummarizer> summarizer = std::make_shared<test::FakeSummarizer>();

    std::shared_ptr<application::PlaybackEngine> engine;
    std::shared_ptr<application::TranscriptionPipeline> pipeline;
    std::shared_ptr<application::TranscriptStore> store;

    Fixture() {
        application::PlaybackConfig playback;
        playback.durationPoll.interval = std::chrono::milliseconds(5);
        playback.durationPoll.timeout = std::chrono::milliseconds(300);
        engine = std::make_shared<application::PlaybackEngine>(player, surface, playback);

        application::TranscriptionConfig transcription;
        transcription.deviceLocale = "en-US";
        transcription.tempDirectory = dir.path().string();
        pipeline = std::make_shared<application::TranscriptionPipeline>(fetcher, transcriber, transcription);

        store = std::make_shared<application::TranscriptStore>(repository);

        player->setDuration(4000.0);
        transcriber->script = {
            {"Welcome to the show.", 0.0, 30.0},
            {"Today we talk about parsers.", 5.0, 60.0},
            {"That's all.", 55.0, 100.0}
        };
    }

    domain::Episode episode(const std::string& locator = kLocator) const {
        domain::Episode e;
        e.id = "ep42";
        e.title = "Parsers";
        e.mediaLocator = locator;
        return e;
    }

    std::unique_ptr<EpisodeSession> session() {
        return std::make_unique<EpisodeSession>(episode(), engine, pipeline, store, summarizer);
    }
};

void TestTranscribePersists() {
    std::cout << "[Test] Transcription is persisted and restorable..." << std::endl;
    Fixture f;
    auto session = f.session();
    assert(!session->restore());
    assert(!session->isSaved());

    auto run = session->transcribe();
    assert(run.status == RunStatus::Done);
    assert(session->transcript() == "Welcome to the show. Today we talk about parsers. That's all.");
    assert(session->segments().size() == 3);
    assert(session->isSaved());

    auto other = f.session();
    assert(other->restore());
    assert(other->transcript() == session->transcript());
    assert(other->segments() == session->segments());
    assert(other->summary().empty());
    std::cout << "[PASS] Transcribe persists" << std::endl;
}

void TestFailedRunPersistsPartialText() {
    std::cout << "[Test] Partial text of a failed run is kept..." << std::endl;
    Fixture f;
    f.transcriber->failAfter = 1;
    auto session = f.session();
    auto run = session->transcribe();
    assert(run.status == RunStatus::Failed);
    assert(session->transcript() == "Welcome to the show.");
    auto record = f.store->load(kLocator);
    assert(record && record->transcript == "Welcome to the show.");

    // Nothing recognized: nothing saved, nothing overwritten.
    Fixture g;
    g.fetcher->fail = true;
    auto empty = g.session();
    assert(empty->transcribe().status == RunStatus::Failed);
    assert(!empty->isSaved());
    assert(g.repository->puts == 0);
    std::cout << "[PASS] Partial text" << std::endl;
}

void TestSummarize() {
    std::cout << "[Test] Summaries prefer segments and are persisted..." << std::endl;
    Fixture f;
    auto session = f.session();

    bool threw = false;
    try {
        session->summarize();
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    session->transcribe();
    const std::string summary = session->summarize();
    assert(summary == f.summarizer->response);
    assert(f.summarizer->lastSegments.size() == 3);
    assert(f.summarizer->lastPlain.empty());

    auto record = f.store->load(kLocator);
    assert(record && record->summary && *record->summary == summary);
    assert(record->segments && record->segments->size() == 3);

    auto timecodes = session->summaryTimecodes();
    assert(timecodes.size() == 2);
    assert(timecodes[0].seconds == 5.0 && timecodes[1].seconds == 3723.0);
    assert(session->summaryLines().size() == 3);
    std::cout << "[PASS] Summarize" << std::endl;
}

void TestEmptySummaryResponse() {
    std::cout << "[Test] Empty summary response propagates..." << std::endl;
    Fixture f;
    auto session = f.session();
    session->transcribe();
    session->summarize();
    f.summarizer->response.clear();

    bool threw = false;
    try {
        session->summarize();
    } catch (const domain::CoreError& e) {
        threw = e.kind() == domain::ErrorKind::EmptySummaryResponse;
    }
    assert(threw);
    // The previous summary survives.
    assert(!session->summary().empty());
    std::cout << "[PASS] Empty summary response" << std::endl;
}

void TestTimecodeSeeks() {
    std::cout << "[Test] Tapping a summary line seeks the episode..." << std::endl;
    Fixture f;
    auto session = f.session();
    session->transcribe();
    session->summarize();
    auto lines = session->summaryLines();

    assert(!session->activateLine(lines[1]));
    assert(f.player->loaded.empty());

    // Not playing yet: the line starts playback and the seek lands once the duration is known.
    assert(session->activateLine(lines[0]));
    assert(f.engine->isActive("ep42"));
    assert(test::WaitFor([&f] {
        auto seeks = f.player->seekLog();
        return !seeks.empty() && seeks.back() == 5.0;
    }));

    assert(test::WaitFor([&f] { return f.engine->state().phase == TransportPhase::Playing; }));
    assert(session->activateLine(lines[2]));
    assert(f.player->seekLog().back() == 3723.0);
    assert(f.player->loaded.size() == 1);
    std::cout << "[PASS] Timecode seeks" << std::endl;
}

void TestUnplayableEpisode() {
    std::cout << "[Test] Episode without media..." << std::endl;
    Fixture f;
    domain::Episode silent;
    silent.id = "silent";
    EpisodeSession session(silent, f.engine, f.pipeline, f.store, f.summarizer);
    assert(!session.restore());
    auto run = session.transcribe();
    assert(run.status == RunStatus::Failed);
    assert(run.error && run.error->kind == domain::ErrorKind::MediaUnavailable);
    session.seekToTimecode(10.0);
    assert(f.player->loaded.empty());
    std::cout << "[PASS] Unplayable episode" << std::endl;
}

void TestAsyncTasks() {
    std::cout << "[Test] Background transcription and summary tasks..." << std::endl;
    Fixture f;
    auto session = f.session();
    {
        application::AsyncTaskManager tasks;
        auto status = session->transcribeAsync(tasks);
        tasks.waitAll();
        assert(status->isCompleted);
        assert(!status->failed);
        assert(status->progress == 1.0f);

        auto summaryStatus = session->summarizeAsync(tasks);
        tasks.waitAll();
        assert(summaryStatus->isCompleted && !summaryStatus->failed);
        assert(!session->summary().empty());
    }

    Fixture g;
    g.fetcher->fail = true;
    auto failing = g.session();
    application::AsyncTaskManager tasks;
    auto status = failing->transcribeAsync(tasks);
    tasks.waitAll();
    assert(status->isCompleted);
    assert(status->failed);
    assert(!status->errorMessage.empty());
    std::cout << "[PASS] Async tasks" << std::endl;
}

void TestTaskManagerBookkeeping() {
    std::cout << "[Test] Task manager reclaims finished threads and records unknown errors..." << std::endl;
    application::AsyncTaskManager tasks;
    using Status = std::shared_ptr<application::TaskStatus>;

    for (int i = 0; i < 20; ++i) {
        tasks.SubmitTask(application::TaskType::Transcription, "noop", [](Status) {});
    }
    assert(test::WaitFor([&tasks] { return tasks.GetActiveTasks().empty(); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto odd = tasks.SubmitTask(application::TaskType::Summarization, "odd", [](Status) { throw 42; });
    assert(tasks.GetThreadCount() <= 2);

    assert(test::WaitFor([&odd] { return odd->isCompleted.load(); }));
    assert(odd->failed);
    assert(odd->errorMessage == "Unknown error during task execution.");
    tasks.waitAll();
    assert(tasks.GetThreadCount() == 0);
    std::cout << "[PASS] Task manager bookkeeping" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting EpisodeSession tests..." << std::endl;
    TestTranscribePersists();
    TestFailedRunPersistsPartialText();
    TestSummarize();
    TestEmptySummaryResponse();
    TestTimecodeSeeks();
    TestUnplayableEpisode();
    TestAsyncTasks();
    TestTaskManagerBookkeeping();
    std::cout << "[PASS] All EpisodeSession tests passed." << std::endl;
    return 0;
}
