#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "common/enums.hpp"

namespace clausedrift {

struct PipelineConfig {
    // AI collaborator
    bool aiEnabled = false;
    std::string geminiApiKey;
    std::string geminiModel = "gemini-pro";
    std::string geminiEndpoint = "https://generativelanguage.googleapis.com/v1beta";
    std::chrono::milliseconds aiMinInterval{4000};
    std::chrono::milliseconds aiTimeout{30000};
    bool aiSemanticSimilarity = false;

    // Segmentation and fingerprinting
    int minClauseWords = 0;
    std::size_t maxVocabulary = 100;
    std::size_t keywordCount = 10;

    RiskLevel alertThreshold = RiskLevel::High;
    int workerCount = 2;
    bool traceEnabled = false;
};

// Reads CLAUSEDRIFT_* (and GEMINI_API_KEY) from the environment.
// Unparseable values keep their defaults and are logged.
PipelineConfig loadConfigFromEnvironment();

} // namespace clausedrift
