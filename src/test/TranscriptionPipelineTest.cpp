#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "application/TranscriptionPipeline.hpp"
#include "TestDoubles.hpp"

using namespace podscribe;
using application::TranscriptionConfig;
using application::TranscriptionPipeline;
using domain::ErrorKind;
using domain::RunStatus;
using domain::TranscriptionRun;

namespace {

const std::string kLocator = "https://cdn.example.com/show/episode.mp3?token=abc";

struct Fixture {
    test::ScratchDir dir{"pipeline"};
    std::shared_ptr<test::FakeContentFetcher> fetcher = std::make_shared<test::FakeContentFetcher>();
    std::shared_ptr<test::FakeTranscriber> transcriber = std::make_shared<test::FakeTranscriber>();
    TranscriptionConfig config;

    Fixture() {
        config.deviceLocale = "en-US";
        config.tempDirectory = dir.path().string();
        transcriber->script = {
            {"Hello", std::nullopt, 25.0},
            {"world", std::nullopt, 50.0},
            {"   ", std::nullopt, 75.0},
            {"bye", 80.0, 100.0}
        };
    }

    std::unique_ptr<TranscriptionPipeline> pipeline() {
        return std::make_unique<TranscriptionPipeline>(fetcher, transcriber, config);
    }
};

std::vector<TranscriptionRun> Collect(TranscriptionPipeline& pipeline, const std::string& locator) {
    std::vector<TranscriptionRun> updates;
    pipeline.run(locator, [&updates](const TranscriptionRun& run) { updates.push_back(run); });
    return updates;
}

void TestHappyPath() {
    std::cout << "[Test] Full run produces ordered segments and monotonic progress..." << std::endl;
    Fixture f;
    auto pipeline = f.pipeline();
    auto updates = Collect(*pipeline, kLocator);

    assert(!updates.empty());
    assert(updates.front().status == RunStatus::Preparing);
    bool sawDownloading = false;
    bool sawTranscribing = false;
    double lastFraction = 0.0;
    for (const auto& u : updates) {
        assert(u.fractionComplete >= lastFraction);
        assert(u.fractionComplete >= 0.0 && u.fractionComplete <= 1.0);
        lastFraction = u.fractionComplete;
        sawDownloading |= u.status == RunStatus::Downloading;
        sawTranscribing |= u.status == RunStatus::Transcribing;
    }
    assert(sawDownloading && sawTranscribing);

    const auto& done = updates.back();
    assert(done.status == RunStatus::Done);
    assert(done.fractionComplete == 1.0);
    assert(done.statusText == "Done");
    assert(std::string(domain::RunStatusToString(done.status)) == "Done");
    assert(!done.error);
    assert(done.locale == "en-US");
    assert(done.text == "Hello world bye");

    assert(done.segments.size() == 3);
    assert(done.segments[0].ordinal == 0 && done.segments[0].startOffset == 0.0);
    assert(done.segments[1].ordinal == 1 && done.segments[1].startOffset == 25.0);
    assert(done.segments[2].ordinal == 2 && done.segments[2].startOffset == 80.0);

    assert(f.transcriber->audioExistedAtOpen);
    assert(f.transcriber->openedPath.find(".mp3") != std::string::npos);
    assert(f.dir.fileCount() == 0);

    auto snapshot = pipeline->snapshot();
    assert(snapshot.status == RunStatus::Done && snapshot.text == done.text);
    std::cout << "[PASS] Happy path" << std::endl;
}

void TestLocaleResolution() {
    std::cout << "[Test] Locale fallback order..." << std::endl;
    {
        Fixture f;
        f.config.deviceLocale = "xx-YY";
        auto run = f.pipeline()->run(kLocator);
        assert(run.status == RunStatus::Done && run.locale == "en-US");
    }
    {
        Fixture f;
        f.config.deviceLocale = "xx-YY";
        f.transcriber->supported.clear();
        f.transcriber->installed = {"de-DE", "fr-FR"};
        auto run = f.pipeline()->run(kLocator);
        assert(run.status == RunStatus::Done && run.locale == "de-DE");
        assert(f.transcriber->openedLocale == "de-DE");
    }
    {
        Fixture f;
        f.transcriber->supported.clear();
        auto run = f.pipeline()->run(kLocator);
        assert(run.status == RunStatus::Failed);
        assert(run.error && run.error->kind == ErrorKind::LocaleUnsupported);
        assert(run.statusText.rfind("Failed: ", 0) == 0);
        assert(f.dir.fileCount() == 0);
    }
    std::cout << "[PASS] Locale fallback" << std::endl;
}

void TestDownloadFailure() {
    std::cout << "[Test] Download failure..." << std::endl;
    Fixture f;
    f.fetcher->fail = true;
    auto run = f.pipeline()->run(kLocator);
    assert(run.status == RunStatus::Failed);
    assert(run.error && run.error->kind == ErrorKind::DownloadFailed);
    assert(run.text.empty());
    assert(f.dir.fileCount() == 0);
    std::cout << "[PASS] Download failure" << std::endl;
}

void TestUnavailableTranscriber() {
    std::cout << "[Test] Unavailable recognizer..." << std::endl;
    Fixture f;
    f.transcriber->available = false;
    auto run = f.pipeline()->run(kLocator);
    assert(run.status == RunStatus::Failed);
    assert(run.error && run.error->kind == ErrorKind::RecognitionFailed);
    assert(f.dir.fileCount() == 0);
    std::cout << "[PASS] Unavailable recognizer" << std::endl;
}

void TestModelInstall() {
    std::cout << "[Test] Model installation step..." << std::endl;
    {
        Fixture f;
        f.transcriber->needsInstall = true;
        auto pipeline = f.pipeline();
        auto updates = Collect(*pipeline, kLocator);
        bool sawInstall = false;
        for (const auto& u : updates) sawInstall |= u.status == RunStatus::InstallingModel;
        assert(sawInstall);
        assert(f.transcriber->installedFor == "en-US");
        assert(updates.back().status == RunStatus::Done);
    }
    {
        Fixture f;
        f.transcriber->needsInstall = true;
        f.transcriber->failInstall = true;
        auto run = f.pipeline()->run(kLocator);
        assert(run.status == RunStatus::Failed);
        assert(run.error && run.error->kind == ErrorKind::AssetInstallFailed);
        assert(f.dir.fileCount() == 0);
    }
    std::cout << "[PASS] Model installation" << std::endl;
}

void TestRecognitionFailureKeepsPartialOutput() {
    std::cout << "[Test] Recognition failure keeps partial output..." << std::endl;
    Fixture f;
    f.transcriber->failAfter = 2;
    auto run = f.pipeline()->run(kLocator);
    assert(run.status == RunStatus::Failed);
    assert(run.error && run.error->kind == ErrorKind::RecognitionFailed);
    assert(run.text == "Hello world");
    assert(run.segments.size() == 2);
    assert(run.fractionComplete == 0.5);
    assert(f.dir.fileCount() == 0);
    std::cout << "[PASS] Partial output preserved" << std::endl;
}

void TestCancellation() {
    std::cout << "[Test] Cancellation removes the downloaded audio..." << std::endl;
    Fixture f;
    auto pipeline = f.pipeline();
    auto stream = pipeline->transcribe(kLocator);

    while (auto snapshot = stream->next()) {
        if (snapshot->status == RunStatus::Transcribing) break;
    }
    assert(f.dir.fileCount() == 1);

    stream->cancel();
    assert(!stream->next());
    assert(!stream->next());
    assert(f.dir.fileCount() == 0);
    assert(stream->current().status != RunStatus::Done);
    std::cout << "[PASS] Cancellation" << std::endl;
}

void TestNewRunSupersedesOld() {
    std::cout << "[Test] A new run cancels the previous one..." << std::endl;
    Fixture f;
    auto pipeline = f.pipeline();
    auto first = pipeline->transcribe(kLocator);
    first->next();
    auto second = pipeline->transcribe("https://cdn.example.com/other.mp3");

    assert(first->isCancelled());
    assert(!second->isCancelled());
    assert(!first->next());
    assert(pipeline->snapshot().runId == second->runId());
    assert(pipeline->snapshot().mediaLocator == "https://cdn.example.com/other.mp3");

    while (second->next()) {
    }
    assert(pipeline->snapshot().status == RunStatus::Done);
    assert(f.dir.fileCount() == 0);
    std::cout << "[PASS] Supersede" << std::endl;
}

void TestAsyncRun() {
    std::cout << "[Test] Async run and subscribers..." << std::endl;
    Fixture f;
    f.transcriber->onStep = [] { std::this_thread::sleep_for(std::chrono::milliseconds(2)); };
    auto pipeline = f.pipeline();

    std::atomic<int> notifications{0};
    auto id = pipeline->subscribe([&notifications](const TranscriptionRun&) { ++notifications; });

    std::atomic<bool> sawDone{false};
    pipeline->transcribeAsync(kLocator, [&sawDone](const TranscriptionRun& run) {
        if (run.status == RunStatus::Done) sawDone = true;
    });
    assert(test::WaitFor([&sawDone] { return sawDone.load(); }));
    pipeline->cancel();
    pipeline->unsubscribe(id);

    auto snapshot = pipeline->snapshot();
    assert(snapshot.status == RunStatus::Done);
    assert(snapshot.fractionComplete == 1.0);
    assert(notifications > 3);
    assert(f.dir.fileCount() == 0);
    std::cout << "[PASS] Async run" << std::endl;
}

void TestAsyncCancel() {
    std::cout << "[Test] Cancelling an async run..." << std::endl;
    Fixture f;
    f.transcriber->onStep = [] { std::this_thread::sleep_for(std::chrono::milliseconds(30)); };
    auto pipeline = f.pipeline();
    pipeline->transcribeAsync(kLocator);
    assert(test::WaitFor([&pipeline] { return pipeline->snapshot().status == RunStatus::Transcribing; }));
    pipeline->cancel();
    assert(pipeline->snapshot().status != RunStatus::Done);
    assert(f.dir.fileCount() == 0);
    std::cout << "[PASS] Async cancel" << std::endl;
}

void TestConcurrentAsyncStarts() {
    std::cout << "[Test] Several threads starting async runs..." << std::endl;
    Fixture f;
    auto pipeline = f.pipeline();

    std::vector<std::thread> callers;
    for (int t = 0; t < 4; ++t) {
        callers.emplace_back([&pipeline, t] {
            for (int i = 0; i < 50; ++i) {
                pipeline->transcribeAsync(kLocator + "&n=" + std::to_string(t * 100 + i));
            }
        });
    }
    for (auto& caller : callers) caller.join();

    assert(test::WaitFor([&pipeline] { return pipeline->snapshot().status == RunStatus::Done; }));
    pipeline->cancel();
    assert(pipeline->snapshot().text == "Hello world bye");
    assert(f.dir.fileCount() == 0);
    std::cout << "[PASS] Concurrent async starts" << std::endl;
}

void TestCancelDuringModelInstall() {
    std::cout << "[Test] Cancelling while the model downloads..." << std::endl;
    Fixture f;
    f.transcriber->needsInstall = true;
    f.transcriber->installSteps = 200;
    f.transcriber->installStepDelay = std::chrono::milliseconds(10);
    auto pipeline = f.pipeline();

    pipeline->transcribeAsync(kLocator);
    assert(test::WaitFor([&pipeline] { return pipeline->snapshot().status == RunStatus::InstallingModel; }));

    const auto started = std::chrono::steady_clock::now();
    pipeline->transcribeAsync("https://cdn.example.com/other.mp3");
    const auto waited = std::chrono::steady_clock::now() - started;
    assert(waited < std::chrono::milliseconds(1000));
    assert(f.transcriber->abortedInstalls == 1);

    assert(test::WaitFor([&pipeline] { return pipeline->snapshot().status == RunStatus::InstallingModel; }));
    pipeline->cancel();
    assert(f.transcriber->abortedInstalls == 2);
    assert(pipeline->snapshot().status != RunStatus::Done);
    assert(f.dir.fileCount() == 0);
    std::cout << "[PASS] Cancel during install" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting TranscriptionPipeline tests..." << std::endl;
    TestHappyPath();
    TestLocaleResolution();
    TestDownloadFailure();
    TestUnavailableTranscriber();
    TestModelInstall();
    TestRecognitionFailureKeepsPartialOutput();
    TestCancellation();
    TestNewRunSupersedesOld();
    TestAsyncRun();
    TestAsyncCancel();
    TestConcurrentAsyncStarts();
    TestCancelDuringModelInstall();
    std::cout << "[PASS] All TranscriptionPipeline tests passed." << std::endl;
    return 0;
}
