#include <cassert>
#include <fstream>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

#include "application/TranscriptStore.hpp"
#include "infrastructure/JsonTranscriptRepository.hpp"
#include "TestDoubles.hpp"

using namespace podscribe;
using application::TranscriptStore;
using infrastructure::JsonTranscriptRepository;

namespace {

const std::string kLocator = "https://Cdn.Example.com/show/ep1.mp3";

class BrokenRepository : public domain::TranscriptRepository {
public:
    std::optional<domain::TranscriptRecord> find(const std::string&) override { return std::nullopt; }
    void put(const domain::TranscriptRecord&) override {
        throw domain::CoreError(domain::ErrorKind::PersistenceFailure, "disk full");
    }
    std::vector<std::string> keys() override { return {}; }
};

void TestSaveThenLoad(const test::ScratchDir& dir) {
    std::cout << "[Test] Save then load..." << std::endl;
    auto repo = std::make_shared<JsonTranscriptRepository>(dir.path() / "store.json");
    TranscriptStore store(repo);

    std::vector<domain::TranscriptSegment> segments{{"Hello", 0.0, 0}, {"world", 4.5, 1}};
    assert(store.save(kLocator, "Hello world", std::string("- [0:04] greeting"), segments));

    auto record = store.load(kLocator);
    assert(record);
    assert(record->transcript == "Hello world");
    assert(record->summary && *record->summary == "- [0:04] greeting");
    assert(record->segments && *record->segments == segments);
    assert(!store.load("https://cdn.example.com/other.mp3"));
    std::cout << "[PASS] Save then load" << std::endl;
}

void TestUpsertKeepsOneRecord(const test::ScratchDir& dir) {
    std::cout << "[Test] Upsert semantics..." << std::endl;
    auto repo = std::make_shared<JsonTranscriptRepository>(dir.path() / "upsert.json");
    TranscriptStore store(repo);

    assert(store.save(kLocator, "T1", std::string("S1")));
    const auto first = store.load(kLocator)->savedAt;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    // Same locator with different host casing and padding maps to the same record.
    assert(store.save("  https://cdn.example.COM/show/ep1.mp3 ", "T2", std::string("")));
    assert(repo->keys().size() == 1);

    auto record = store.load(kLocator);
    assert(record->transcript == "T2");
    assert(record->summary && *record->summary == "S1");
    assert(record->savedAt >= first);
    std::cout << "[PASS] Upsert semantics" << std::endl;
}

void TestReloadFromDisk(const test::ScratchDir& dir) {
    std::cout << "[Test] Records survive a new repository instance..." << std::endl;
    const auto path = dir.path() / "reload.json";
    {
        TranscriptStore store(std::make_shared<JsonTranscriptRepository>(path));
        assert(store.save(kLocator, "persisted text", std::nullopt, std::vector<domain::TranscriptSegment>{{"persisted text", 12.0, 0}}));
    }
    TranscriptStore reopened(std::make_shared<JsonTranscriptRepository>(path));
    auto record = reopened.load(kLocator);
    assert(record && record->transcript == "persisted text");
    assert(!record->summary);
    assert(record->segments && record->segments->size() == 1 && (*record->segments)[0].startOffset == 12.0);

    // No temp files left next to the store.
    for (const auto& entry : std::filesystem::directory_iterator(dir.path())) {
        assert(entry.path().extension() != ".tmp");
    }
    std::cout << "[PASS] Reload from disk" << std::endl;
}

void TestCorruptFileIsSetAside() {
    std::cout << "[Test] Corrupt store file is moved aside, not overwritten..." << std::endl;
    test::ScratchDir dir("corrupt");
    const auto path = dir.path() / "corrupt.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    TranscriptStore store(std::make_shared<JsonTranscriptRepository>(path));
    assert(!store.load(kLocator));
    assert(store.save(kLocator, "fresh"));
    assert(store.load(kLocator)->transcript == "fresh");

    bool foundAside = false;
    for (const auto& entry : std::filesystem::directory_iterator(dir.path())) {
        if (entry.path().extension() != ".corrupt") continue;
        std::ifstream in(entry.path());
        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        foundAside = content == "{ not json";
    }
    assert(foundAside);
    assert(dir.fileCount() == 2);
    std::cout << "[PASS] Corrupt store file" << std::endl;
}

void TestMalformedRecordDoesNotLoseOthers() {
    std::cout << "[Test] A malformed record leaves the other records intact..." << std::endl;
    test::ScratchDir dir("malformed");
    const auto path = dir.path() / "store.json";
    {
        std::ofstream out(path);
        out << R"({
            "https://a.example.com/1.mp3": {"transcript": "first", "summary": "kept", "saved_at": 1000},
            "https://b.example.com/2.mp3": {"transcript": "second", "segments": [{"text": 5}]},
            "https://d.example.com/4.mp3": {"transcript": "fourth", "saved_at": "yesterday"}
        })";
    }

    {
        TranscriptStore store(std::make_shared<JsonTranscriptRepository>(path));
        auto first = store.load("https://a.example.com/1.mp3");
        assert(first && first->transcript == "first" && first->summary == std::optional<std::string>("kept"));
        assert(!store.load("https://b.example.com/2.mp3"));
        assert(store.save("https://c.example.com/3.mp3", "third"));
        assert(store.save("https://d.example.com/4.mp3", "fourth again"));
    }

    TranscriptStore reopened(std::make_shared<JsonTranscriptRepository>(path));
    assert(reopened.load("https://a.example.com/1.mp3")->summary == std::optional<std::string>("kept"));
    assert(reopened.load("https://c.example.com/3.mp3")->transcript == "third");
    assert(reopened.load("https://d.example.com/4.mp3")->transcript == "fourth again");

    std::ifstream in(path);
    nlohmann::json doc;
    in >> doc;
    assert(doc.contains("https://b.example.com/2.mp3"));
    assert(doc["https://b.example.com/2.mp3"]["segments"][0]["text"] == 5);
    assert(doc.size() == 4);
    std::cout << "[PASS] Malformed record" << std::endl;
}

void TestPersistenceFailureIsSwallowed() {
    std::cout << "[Test] Persistence failure is reported, not thrown..." << std::endl;
    TranscriptStore store(std::make_shared<BrokenRepository>());
    assert(!store.save(kLocator, "text"));
    assert(!store.save("   ", "text"));
    std::cout << "[PASS] Persistence failure" << std::endl;
}

void TestCanonicalKey() {
    std::cout << "[Test] Canonical keys..." << std::endl;
    assert(TranscriptStore::CanonicalKey(" HTTPS://Feeds.Example.com/A/B.mp3?X=Y ") == "https://feeds.example.com/A/B.mp3?X=Y");
    assert(TranscriptStore::CanonicalKey("https://User@Host.COM/p") == "https://User@host.com/p");
    assert(TranscriptStore::CanonicalKey("/local/File.mp3") == "/local/File.mp3");
    assert(TranscriptStore::CanonicalKey("\t\n").empty());
    std::cout << "[PASS] Canonical keys" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting TranscriptStore tests..." << std::endl;
    test::ScratchDir dir("store");
    TestSaveThenLoad(dir);
    TestUpsertKeepsOneRecord(dir);
    TestReloadFromDisk(dir);
    TestCorruptFileIsSetAside();
    TestMalformedRecordDoesNotLoseOthers();
    TestPersistenceFailureIsSwallowed();
    TestCanonicalKey();
    std::cout << "[PASS] All TranscriptStore tests passed." << std::endl;
    return 0;
}
