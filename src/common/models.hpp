#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace clausedrift {

// Caller-supplied section boundary, e.g. from an upstream PDF/HTML extractor.
struct SectionHint {
    std::string heading;
    std::string text;
};

struct Clause {
    int number = 0;
    std::optional<std::string> heading;
    std::optional<ClauseCategory> category;
    std::string text;
    std::size_t spanStart = 0;
    std::size_t spanEnd = 0;
    int wordCount = 0;
};

// Term weights are only comparable between vectors that share a sessionId.
struct TermVector {
    std::uint64_t sessionId = 0;
    std::vector<double> weights;
};

struct Fingerprint {
    std::string textHash;
    std::uint64_t editHash = 0;
    std::optional<TermVector> vector;
    std::map<std::string, double> keywords;
};

struct FingerprintedClause {
    Clause clause;
    Fingerprint fingerprint;
};

struct WordDiff {
    std::vector<std::string> addedWords;
    std::vector<std::string> removedWords;
    int wordCountChange = 0;
};

struct RiskAssessment {
    RiskLevel level = RiskLevel::Low;
    int score = 0;
    std::string explanation;
};

struct Change {
    ChangeKind kind = ChangeKind::Added;
    std::optional<Clause> oldClause;
    std::optional<Clause> newClause;
    double similarity = 0.0;
    std::optional<std::string> summary;
    std::optional<double> semanticSimilarity;
    // Set for MODIFIED and REWRITTEN only.
    std::optional<ChangeMagnitude> magnitude;
    std::optional<WordDiff> wordDiff;

    RiskLevel riskLevel = RiskLevel::Low;
    int riskScore = 0;
    std::string explanation;
    bool alert = false;

    // The clause a change is judged by: the new side when present.
    const Clause *subjectClause() const
    {
        if (newClause.has_value()) {
            return &*newClause;
        }
        return oldClause.has_value() ? &*oldClause : nullptr;
    }
};

struct DocumentVersion {
    std::string id;
    std::string text;
    std::vector<SectionHint> sections;
};

struct ComparisonStats {
    std::size_t oldClauses = 0;
    std::size_t newClauses = 0;
    std::size_t changesDetected = 0;
    std::size_t added = 0;
    std::size_t removed = 0;
    std::size_t modified = 0;
    std::size_t rewritten = 0;
    std::size_t alerts = 0;
    std::size_t highRiskChanges = 0;
};

struct ComparisonResult {
    std::string oldVersionId;
    std::string newVersionId;
    std::vector<Clause> oldClauses;
    std::vector<Clause> newClauses;
    std::vector<Change> changes;
    ComparisonStats stats;
};

} // namespace clausedrift
