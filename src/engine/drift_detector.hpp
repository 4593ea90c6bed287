#pragma once

#include <vector>

#include "common/models.hpp"
#include "engine/ai_collaborator.hpp"

namespace clausedrift {

/**
 * Aligns the clauses of two versions and reports what changed.
 *
 * Greedy single pass over the new clauses: each one takes the most similar
 * old clause still unmatched (first one wins on ties). Similarity of at
 * least 0.95 is treated as unchanged, 0.6 as modified, 0.3 as rewritten;
 * anything lower leaves the old clause available and reports an addition.
 * Old clauses never matched are reported as removed.
 *
 * With a collaborator, each change asks for a summary on a best-effort basis.
 */
class DriftDetector
{
public:
    static constexpr double kIdenticalThreshold = 0.95;
    static constexpr double kModifiedThreshold = 0.6;
    static constexpr double kRewrittenThreshold = 0.3;

    explicit DriftDetector(AiCollaborator *collaborator = nullptr,
                           bool requestSemanticSimilarity = false);

    std::vector<Change> detect(const std::vector<FingerprintedClause> &oldClauses,
                               const std::vector<FingerprintedClause> &newClauses) const;

private:
    Change makeChange(ChangeKind kind,
                      const FingerprintedClause *oldClause,
                      const FingerprintedClause *newClause,
                      double similarity) const;

    AiCollaborator *m_collaborator;
    bool m_requestSemanticSimilarity;
};

} // namespace clausedrift
