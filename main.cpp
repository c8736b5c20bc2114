#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

#include "application/EpisodeSession.hpp"
#include "application/PlaybackEngine.hpp"
#include "application/TranscriptStore.hpp"
#include "application/TranscriptionPipeline.hpp"
#include "domain/Errors.hpp"
#include "domain/TimecodeParser.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ConsoleTransportSurface.hpp"
#include "infrastructure/HttpContentFetcher.hpp"
#include "infrastructure/JsonTranscriptRepository.hpp"
#include "infrastructure/OllamaSummarizer.hpp"
#include "infrastructure/SdlMediaPlayer.hpp"
#include "infrastructure/WhisperCppTranscriber.hpp"

using namespace podscribe;

namespace {

struct Options {
    std::string mediaUrl;
    std::string title;
    std::string configPath;
    bool summarize = false;
    bool play = false;
    bool retranscribe = false;
};

void PrintUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " <media-url> [options]\n"
              << "  --title <text>     Episode title shown while playing\n"
              << "  --config <path>    settings.json to use instead of the default\n"
              << "  --retranscribe     Ignore a saved transcript\n"
              << "  --summarize        Request a summary when none is saved\n"
              << "  --play             Play the episode; commands: p, f, b, g <M:SS>, t <line>, q\n";
}

bool ParseArgs(int argc, char** argv, Options& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--summarize") {
            opts.summarize = true;
        } else if (arg == "--play") {
            opts.play = true;
        } else if (arg == "--retranscribe") {
            opts.retranscribe = true;
        } else if ((arg == "--title" || arg == "--config") && i + 1 < argc) {
            (arg == "--title" ? opts.title : opts.configPath) = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else if (!arg.empty() && arg[0] != '-' && opts.mediaUrl.empty()) {
            opts.mediaUrl = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return false;
        }
    }
    return !opts.mediaUrl.empty();
}

void PrintSummary(const application::EpisodeSession& session) {
    const auto lines = session.summaryLines();
    if (lines.empty()) return;

    std::cout << "\n=== Summary ===" << std::endl;
    int index = 0;
    for (const auto& line : lines) {
        std::string text;
        for (const auto& token : line) text += token.raw;
        auto first = domain::TimecodeParser::FirstTimecode(line);
        std::cout << std::setw(3) << ++index << (first ? " * " : "   ") << text << std::endl;
    }

    const auto timecodes = session.summaryTimecodes();
    if (!timecodes.empty()) {
        std::cout << "\nTimecodes:";
        for (const auto& token : timecodes) {
            std::cout << " " << domain::FormatClock(token.seconds);
        }
        std::cout << std::endl;
    }
}

void RunTransport(application::EpisodeSession& session, infrastructure::ConsoleTransportSurface& surface) {
    session.play();
    const auto lines = session.summaryLines();

    std::string input;
    while (std::getline(std::cin, input)) {
        if (input == "q") break;

        if (input.rfind("t ", 0) == 0) {
            try {
                const size_t index = std::stoul(input.substr(2));
                if (index == 0 || index > lines.size() || !session.activateLine(lines[index - 1])) {
                    std::cout << "No timecode on line " << index << std::endl;
                }
            } catch (const std::exception&) {
                std::cout << "Usage: t <summary line number>" << std::endl;
            }
            continue;
        }

        auto command = infrastructure::ConsoleTransportSurface::ParseCommand(input);
        if (!command) {
            std::cout << "Commands: p, f, b, g <M:SS>, t <line>, q" << std::endl;
            continue;
        }
        if (!surface.dispatch(*command)) {
            std::cout << "Command ignored" << std::endl;
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    Options opts;
    if (!ParseArgs(argc, argv, opts)) {
        PrintUsage(argv[0]);
        return 1;
    }

    infrastructure::AppConfig config = opts.configPath.empty()
        ? infrastructure::ConfigLoader::LoadDefault()
        : infrastructure::ConfigLoader::Load(opts.configPath);

    auto fetcher = std::make_shared<infrastructure::HttpContentFetcher>();
    auto transcriber = std::make_shared<infrastructure::WhisperCppTranscriber>(config.whisper, fetcher);
    auto repository = std::make_shared<infrastructure::JsonTranscriptRepository>(config.storePath);
    auto store = std::make_shared<application::TranscriptStore>(repository);
    auto pipeline = std::make_shared<application::TranscriptionPipeline>(fetcher, transcriber, config.transcription);
    auto summarizer = std::make_shared<infrastructure::OllamaSummarizer>(config.summarizer);

    auto surface = std::make_shared<infrastructure::ConsoleTransportSurface>(std::cout);
    auto player = std::make_shared<infrastructure::SdlMediaPlayer>(fetcher, config.transcription.tempDirectory);
    auto engine = std::make_shared<application::PlaybackEngine>(player, surface, config.playback);

    domain::Episode episode;
    episode.id = application::TranscriptStore::CanonicalKey(opts.mediaUrl);
    episode.title = opts.title.empty() ? opts.mediaUrl : opts.title;
    episode.mediaLocator = opts.mediaUrl;

    application::EpisodeSession session(episode, engine, pipeline, store, summarizer);

    const bool restored = !opts.retranscribe && session.restore();
    if (restored) {
        std::cout << "[Podscribe] Restored saved transcript for " << opts.mediaUrl << std::endl;
    } else {
        std::string lastStatus;
        auto run = session.transcribe([&lastStatus](const domain::TranscriptionRun& update) {
            if (update.statusText != lastStatus) {
                lastStatus = update.statusText;
                std::cout << "[Podscribe] " << update.statusText << std::endl;
            }
        });
        if (run.error) {
            std::cerr << "[Podscribe] Transcription failed (" << domain::ErrorKindToString(run.error->kind)
                      << "): " << run.error->reason << std::endl;
            if (run.text.empty()) {
                return 2;
            }
        }
    }

    for (const auto& segment : session.segments()) {
        std::cout << "[" << segment.formattedTime() << "] " << segment.text << std::endl;
    }
    if (session.segments().empty()) {
        std::cout << session.transcript() << std::endl;
    }

    if (opts.summarize && session.summary().empty() && !summarizer->isModelAvailable()) {
        std::cerr << "[Podscribe] Model '" << config.summarizer.model << "' is not available on "
                  << config.summarizer.host << ":" << config.summarizer.port << ", skipping summary" << std::endl;
    } else if (opts.summarize && session.summary().empty()) {
        try {
            session.summarize();
        } catch (const domain::CoreError& e) {
            std::cerr << "[Podscribe] Summary failed (" << domain::ErrorKindToString(e.kind()) << "): "
                      << e.what() << std::endl;
        } catch (const std::logic_error& e) {
            std::cerr << "[Podscribe] Summary unavailable: " << e.what() << std::endl;
        }
    }
    PrintSummary(session);

    if (opts.play) {
        if (!player->hasOutput()) {
            std::cerr << "[Podscribe] No audio output device; position will not advance" << std::endl;
        }
        RunTransport(session, *surface);
    }

    return 0;
}
