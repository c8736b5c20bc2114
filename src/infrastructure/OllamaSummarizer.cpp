#include "infrastructure/OllamaSummarizer.hpp"
#include "domain/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>

namespace podscribe::infrastructure {

namespace {

const char* kPlainPrompt =
    "You are an expert podcast analyst. Summarize the following podcast transcript into "
    "a concise, well-structured summary. Include the key topics discussed, main takeaways, "
    "and any notable quotes or insights. Use bullet points for clarity.";

const char* kTimestampedPrompt =
    "You are an expert podcast analyst. Summarize the following podcast transcript into "
    "a concise, well-structured summary. Include the key topics discussed, main takeaways, "
    "and any notable quotes or insights. Use bullet points for clarity. Each line of the "
    "transcript starts with its timestamp; begin every bullet with the timestamp where the "
    "point is made, written in square brackets exactly as [MM:SS] or [H:MM:SS].";

} // namespace

OllamaSummarizer::OllamaSummarizer(SummarizerConfig config)
    : m_config(std::move(config))
    , m_client(m_config.host, m_config.port) {}

std::string OllamaSummarizer::RenderSegments(const std::vector<domain::TranscriptSegment>& segments) {
    std::ostringstream out;
    for (const auto& segment : segments) {
        out << "[" << segment.formattedTime() << "] " << segment.text << "\n";
    }
    return out.str();
}

std::string OllamaSummarizer::request(const std::string& system, const std::string& prompt) {
    std::cout << "[OllamaSummarizer] Requesting summary from " << m_config.model << std::endl;
    auto response = m_client.generate(m_config.model, system, "TRANSCRIPT:\n" + prompt);

    const bool blank = !response ||
        std::all_of(response->begin(), response->end(), [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        throw domain::CoreError(domain::ErrorKind::EmptySummaryResponse,
                                "The summarizer returned an empty response.");
    }
    return *response;
}

std::string OllamaSummarizer::summarize(const std::string& transcript) {
    return request(kPlainPrompt, transcript);
}

std::string OllamaSummarizer::summarize(const std::vector<domain::TranscriptSegment>& segments) {
    return request(kTimestampedPrompt, RenderSegments(segments));
}

bool OllamaSummarizer::isModelAvailable() {
    return ListsModel(m_client.getAvailableModels(), m_config.model);
}

bool OllamaSummarizer::ListsModel(const std::vector<std::string>& listed, const std::string& wanted) {
    const bool tagged = wanted.find(':') != std::string::npos;
    for (const auto& name : listed) {
        if (name == wanted) return true;
        if (!tagged && name == wanted + ":latest") return true;
    }
    return false;
}

} // namespace podscribe::infrastructure
