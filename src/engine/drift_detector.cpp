#include "engine/drift_detector.hpp"

#include <exception>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "engine/fingerprint_engine.hpp"
#include "engine/text_diff.hpp"

namespace clausedrift {

namespace {

// Consumed flags for one detect() run, indexed like the input vectors.
struct MatchingState {
    std::vector<bool> oldConsumed;
    std::vector<bool> newConsumed;
};

void logAiFailure(const char *method, const std::exception &error)
{
    CDLOG_WARN(QStringLiteral("DriftDetector"),
               QStringLiteral("makeChange"),
               QStringLiteral("ai_call_failed"),
               QStringLiteral("collaborator_exception"),
               QStringLiteral("continue_without_result"),
               clausedrift::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"method", method}, {"error", error.what()}}));
}

} // namespace

DriftDetector::DriftDetector(AiCollaborator *collaborator, bool requestSemanticSimilarity)
    : m_collaborator(collaborator)
    , m_requestSemanticSimilarity(requestSemanticSimilarity)
{
}

std::vector<Change> DriftDetector::detect(const std::vector<FingerprintedClause> &oldClauses,
                                          const std::vector<FingerprintedClause> &newClauses) const
{
    CDLOG_DEBUG(QStringLiteral("DriftDetector"),
                QStringLiteral("detect"),
                QStringLiteral("detect_start"),
                QStringLiteral("comparison_run"),
                QStringLiteral("greedy_alignment"),
                clausedrift::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"oldClauses", oldClauses.size()},
                                {"newClauses", newClauses.size()}}));

    MatchingState state;
    state.oldConsumed.assign(oldClauses.size(), false);
    state.newConsumed.assign(newClauses.size(), false);

    std::vector<Change> changes;
    for (std::size_t n = 0; n < newClauses.size(); ++n) {
        const auto &candidate = newClauses[n];

        const FingerprintedClause *bestMatch = nullptr;
        std::size_t bestIndex = 0;
        double bestSimilarity = 0.0;
        for (std::size_t o = 0; o < oldClauses.size(); ++o) {
            if (state.oldConsumed[o]) {
                continue;
            }
            const double similarity = FingerprintEngine::similarity(
                oldClauses[o].fingerprint, candidate.fingerprint);
            if (similarity > bestSimilarity) {
                bestSimilarity = similarity;
                bestMatch = &oldClauses[o];
                bestIndex = o;
            }
        }

        if (bestMatch == nullptr || bestSimilarity < kRewrittenThreshold) {
            changes.push_back(makeChange(ChangeKind::Added, nullptr, &candidate, 0.0));
            state.newConsumed[n] = true;
            continue;
        }

        state.oldConsumed[bestIndex] = true;
        state.newConsumed[n] = true;

        if (bestSimilarity >= kIdenticalThreshold) {
            continue;
        }
        const ChangeKind kind = bestSimilarity >= kModifiedThreshold
            ? ChangeKind::Modified
            : ChangeKind::Rewritten;
        changes.push_back(makeChange(kind, bestMatch, &candidate, bestSimilarity));
    }

    for (std::size_t o = 0; o < oldClauses.size(); ++o) {
        if (!state.oldConsumed[o]) {
            changes.push_back(makeChange(ChangeKind::Removed, &oldClauses[o], nullptr, 0.0));
        }
    }

    CDLOG_INFO(QStringLiteral("DriftDetector"),
               QStringLiteral("detect"),
               QStringLiteral("detect_complete"),
               QStringLiteral("comparison_run"),
               QStringLiteral("greedy_alignment"),
               clausedrift::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"changes", changes.size()}}));
    return changes;
}

Change DriftDetector::makeChange(ChangeKind kind,
                                 const FingerprintedClause *oldClause,
                                 const FingerprintedClause *newClause,
                                 double similarity) const
{
    Change change;
    change.kind = kind;
    change.similarity = similarity;
    if (oldClause) {
        change.oldClause = oldClause->clause;
    }
    if (newClause) {
        change.newClause = newClause->clause;
    }
    const bool paired = kind == ChangeKind::Modified || kind == ChangeKind::Rewritten;
    if (paired && oldClause && newClause) {
        change.magnitude = changeMagnitude(similarity);
        change.wordDiff = wordDiff(oldClause->clause.text, newClause->clause.text);
    }

    if (!m_collaborator) {
        return change;
    }

    const std::string oldText = oldClause ? oldClause->clause.text : std::string();
    const std::string newText = newClause ? newClause->clause.text : std::string();

    try {
        auto summary = m_collaborator->summarize(oldText, newText, kind);
        if (summary.has_value() && !summary->empty()) {
            change.summary = std::move(summary);
        }
    } catch (const std::exception &error) {
        logAiFailure("summarize", error);
    }

    if (m_requestSemanticSimilarity && paired) {
        try {
            const auto semantic = m_collaborator->similarity(oldText, newText);
            if (semantic.has_value()) {
                change.semanticSimilarity = *semantic;
            }
        } catch (const std::exception &error) {
            logAiFailure("similarity", error);
        }
    }

    return change;
}

} // namespace clausedrift
