/**
 * @file OllamaSummarizer.hpp
 * @brief Summarizer that prompts a local Ollama model.
 */

#pragma once

#include "domain/Summarizer.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace podscribe::infrastructure {

class OllamaSummarizer : public domain::Summarizer {
public:
    explicit OllamaSummarizer(SummarizerConfig config);

    std::string summarize(const std::string& transcript) override;
    std::string summarize(const std::vector<domain::TranscriptSegment>& segments) override;

    /** @brief "[M:SS] text" per segment, one per line. */
    static std::string RenderSegments(const std::vector<domain::TranscriptSegment>& segments);

    /** @brief Whether the configured model is listed by the server. */
    bool isModelAvailable();

    /** @brief Matches "llama3.2" against listed names such as "llama3.2:latest". */
    static bool ListsModel(const std::vector<std::string>& listed, const std::string& wanted);

private:
    SummarizerConfig m_config;
    OllamaClient m_client;

    std::string request(const std::string& system, const std::string& prompt);
};

} // namespace podscribe::infrastructure
