#pragma once

#include <cstdint>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace clausedrift {

inline std::string toCategoryString(ClauseCategory category)
{
    switch (category) {
    case ClauseCategory::Liability:
        return "liability";
    case ClauseCategory::DataUsage:
        return "data_usage";
    case ClauseCategory::Termination:
        return "termination";
    case ClauseCategory::Jurisdiction:
        return "jurisdiction";
    case ClauseCategory::Payment:
        return "payment";
    case ClauseCategory::IntellectualProperty:
        return "intellectual_property";
    case ClauseCategory::ServiceLevel:
        return "service_level";
    case ClauseCategory::Marketing:
        return "marketing";
    }
    return "other";
}

inline std::optional<ClauseCategory> parseCategoryString(const std::string &value)
{
    if (value == "liability") {
        return ClauseCategory::Liability;
    }
    if (value == "data_usage") {
        return ClauseCategory::DataUsage;
    }
    if (value == "termination") {
        return ClauseCategory::Termination;
    }
    if (value == "jurisdiction") {
        return ClauseCategory::Jurisdiction;
    }
    if (value == "payment") {
        return ClauseCategory::Payment;
    }
    if (value == "intellectual_property") {
        return ClauseCategory::IntellectualProperty;
    }
    if (value == "service_level") {
        return ClauseCategory::ServiceLevel;
    }
    if (value == "marketing") {
        return ClauseCategory::Marketing;
    }
    return std::nullopt;
}

inline std::string toChangeKindString(ChangeKind kind)
{
    switch (kind) {
    case ChangeKind::Added:
        return "added";
    case ChangeKind::Removed:
        return "removed";
    case ChangeKind::Modified:
        return "modified";
    case ChangeKind::Rewritten:
        return "rewritten";
    }
    return "modified";
}

inline ChangeKind parseChangeKindString(const std::string &value)
{
    if (value == "added") {
        return ChangeKind::Added;
    }
    if (value == "removed") {
        return ChangeKind::Removed;
    }
    if (value == "rewritten") {
        return ChangeKind::Rewritten;
    }
    return ChangeKind::Modified;
}

inline std::string toRiskLevelString(RiskLevel level)
{
    switch (level) {
    case RiskLevel::Low:
        return "low";
    case RiskLevel::Medium:
        return "medium";
    case RiskLevel::High:
        return "high";
    case RiskLevel::Critical:
        return "critical";
    }
    return "low";
}

inline std::optional<RiskLevel> parseRiskLevelString(const std::string &value)
{
    if (value == "low") {
        return RiskLevel::Low;
    }
    if (value == "medium") {
        return RiskLevel::Medium;
    }
    if (value == "high") {
        return RiskLevel::High;
    }
    if (value == "critical") {
        return RiskLevel::Critical;
    }
    return std::nullopt;
}

inline std::string toMagnitudeString(ChangeMagnitude magnitude)
{
    switch (magnitude) {
    case ChangeMagnitude::Minor:
        return "minor";
    case ChangeMagnitude::Moderate:
        return "moderate";
    case ChangeMagnitude::Major:
        return "major";
    }
    return "major";
}

inline std::string toEditHashString(std::uint64_t hash)
{
    std::ostringstream out;
    out << std::hex << std::setw(16) << std::setfill('0') << hash;
    return out.str();
}

inline std::uint64_t parseEditHashString(const std::string &value)
{
    try {
        return static_cast<std::uint64_t>(std::stoull(value, nullptr, 16));
    } catch (const std::exception &) {
        return 0;
    }
}

inline void to_json(nlohmann::json &j, const ClauseCategory &category)
{
    j = toCategoryString(category);
}

inline void to_json(nlohmann::json &j, const ChangeKind &kind)
{
    j = toChangeKindString(kind);
}

inline void from_json(const nlohmann::json &j, ChangeKind &kind)
{
    if (j.is_string()) {
        kind = parseChangeKindString(j.get<std::string>());
    } else {
        kind = ChangeKind::Modified;
    }
}

inline void to_json(nlohmann::json &j, const RiskLevel &level)
{
    j = toRiskLevelString(level);
}

inline void from_json(const nlohmann::json &j, RiskLevel &level)
{
    level = RiskLevel::Low;
    if (j.is_string()) {
        level = parseRiskLevelString(j.get<std::string>()).value_or(RiskLevel::Low);
    }
}

inline void to_json(nlohmann::json &j, const SectionHint &hint)
{
    j = nlohmann::json{{"heading", hint.heading}, {"text", hint.text}};
}

inline void from_json(const nlohmann::json &j, SectionHint &hint)
{
    hint.heading = j.value("heading", "");
    // Extractors disagree on the body key; accept both.
    hint.text = j.contains("text") ? j.value("text", "") : j.value("body", "");
}

inline void to_json(nlohmann::json &j, const Clause &clause)
{
    j = nlohmann::json{
        {"number", clause.number},
        {"heading", clause.heading.has_value() ? nlohmann::json(*clause.heading)
                                               : nlohmann::json()},
        {"category", clause.category.has_value() ? nlohmann::json(*clause.category)
                                                 : nlohmann::json()},
        {"text", clause.text},
        {"spanStart", clause.spanStart},
        {"spanEnd", clause.spanEnd},
        {"wordCount", clause.wordCount}
    };
}

inline void from_json(const nlohmann::json &j, Clause &clause)
{
    clause.number = j.value("number", 0);
    if (j.contains("heading") && j.at("heading").is_string()) {
        clause.heading = j.at("heading").get<std::string>();
    } else {
        clause.heading.reset();
    }
    if (j.contains("category") && j.at("category").is_string()) {
        clause.category = parseCategoryString(j.at("category").get<std::string>());
    } else {
        clause.category.reset();
    }
    clause.text = j.value("text", "");
    clause.spanStart = j.value("spanStart", static_cast<std::size_t>(0));
    clause.spanEnd = j.value("spanEnd", static_cast<std::size_t>(0));
    clause.wordCount = j.value("wordCount", 0);
}

inline void to_json(nlohmann::json &j, const Fingerprint &fingerprint)
{
    nlohmann::json vector;
    if (fingerprint.vector.has_value()) {
        vector = nlohmann::json{
            {"session", fingerprint.vector->sessionId},
            {"weights", fingerprint.vector->weights}
        };
    }
    j = nlohmann::json{
        {"textHash", fingerprint.textHash},
        {"editHash", toEditHashString(fingerprint.editHash)},
        {"vector", vector},
        {"keywords", fingerprint.keywords}
    };
}

inline void from_json(const nlohmann::json &j, Fingerprint &fingerprint)
{
    fingerprint.textHash = j.value("textHash", "");
    fingerprint.editHash = parseEditHashString(j.value("editHash", ""));
    fingerprint.vector.reset();
    if (j.contains("vector") && j.at("vector").is_object()) {
        const auto &vector = j.at("vector");
        TermVector parsed;
        parsed.sessionId = vector.value("session", static_cast<std::uint64_t>(0));
        if (vector.contains("weights") && vector.at("weights").is_array()) {
            parsed.weights = vector.at("weights").get<std::vector<double>>();
        }
        fingerprint.vector = parsed;
    }
    if (j.contains("keywords") && j.at("keywords").is_object()) {
        fingerprint.keywords = j.at("keywords").get<std::map<std::string, double>>();
    } else {
        fingerprint.keywords.clear();
    }
}

inline void to_json(nlohmann::json &j, const WordDiff &diff)
{
    j = nlohmann::json{
        {"addedWords", diff.addedWords},
        {"removedWords", diff.removedWords},
        {"wordCountChange", diff.wordCountChange}
    };
}

inline void to_json(nlohmann::json &j, const Change &change)
{
    j = nlohmann::json{
        {"kind", change.kind},
        {"oldClauseId", change.oldClause.has_value() ? nlohmann::json(change.oldClause->number)
                                                     : nlohmann::json()},
        {"newClauseId", change.newClause.has_value() ? nlohmann::json(change.newClause->number)
                                                     : nlohmann::json()},
        {"similarity", change.similarity},
        {"summary", change.summary.has_value() ? nlohmann::json(*change.summary)
                                               : nlohmann::json()},
        {"riskLevel", change.riskLevel},
        {"riskScore", change.riskScore},
        {"explanation", change.explanation},
        {"alert", change.alert}
    };
    if (change.semanticSimilarity.has_value()) {
        j["semanticSimilarity"] = *change.semanticSimilarity;
    }
    if (change.magnitude.has_value()) {
        j["magnitude"] = toMagnitudeString(*change.magnitude);
    }
    if (change.wordDiff.has_value()) {
        j["wordDiff"] = *change.wordDiff;
    }
}

inline void to_json(nlohmann::json &j, const ComparisonStats &stats)
{
    j = nlohmann::json{
        {"oldClauses", stats.oldClauses},
        {"newClauses", stats.newClauses},
        {"changesDetected", stats.changesDetected},
        {"added", stats.added},
        {"removed", stats.removed},
        {"modified", stats.modified},
        {"rewritten", stats.rewritten},
        {"alerts", stats.alerts},
        {"highRiskChanges", stats.highRiskChanges}
    };
}

inline void to_json(nlohmann::json &j, const ComparisonResult &result)
{
    j = nlohmann::json{
        {"oldVersionId", result.oldVersionId},
        {"newVersionId", result.newVersionId},
        {"oldClauses", result.oldClauses},
        {"newClauses", result.newClauses},
        {"changes", result.changes},
        {"statistics", result.stats}
    };
}

} // namespace clausedrift
