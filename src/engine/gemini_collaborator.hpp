#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "engine/ai_collaborator.hpp"

namespace clausedrift {

struct GeminiSettings {
    std::string apiKey;
    std::string model = "gemini-pro";
    std::string endpoint = "https://generativelanguage.googleapis.com/v1beta";
    std::chrono::milliseconds timeout{30000};
};

/**
 * AiCollaborator backed by the Gemini generateContent REST API.
 *
 * Calls block the calling thread on a local event loop until the reply
 * arrives or the timeout expires; a QCoreApplication must exist. Missing
 * key, transport errors, timeouts and malformed replies all yield nullopt.
 * Rate limiting is left to RateLimitedCollaborator.
 */
class GeminiCollaborator : public AiCollaborator
{
public:
    explicit GeminiCollaborator(GeminiSettings settings);

    std::optional<double> similarity(const std::string &textA,
                                     const std::string &textB) override;
    std::optional<std::string> summarize(const std::string &oldText,
                                         const std::string &newText,
                                         ChangeKind kind) override;
    std::optional<std::string> explain(const std::string &clauseText,
                                       const std::string &category,
                                       const std::string &changeSummary) override;

    static std::string similarityPrompt(const std::string &textA, const std::string &textB);
    static std::string summaryPrompt(const std::string &oldText,
                                     const std::string &newText,
                                     ChangeKind kind);
    static std::string explanationPrompt(const std::string &clauseText,
                                         const std::string &category,
                                         const std::string &changeSummary);

    // Extracts the first candidate's text from a generateContent response body.
    static std::optional<std::string> parseResponseText(const std::string &body);

private:
    std::optional<std::string> generate(const std::string &prompt, const char *purpose);

    GeminiSettings m_settings;
};

} // namespace clausedrift
