#pragma once

#include <optional>

#include "common/models.hpp"
#include "engine/ai_collaborator.hpp"

namespace clausedrift {

class RiskClassifier
{
public:
    explicit RiskClassifier(AiCollaborator *collaborator = nullptr);

    // Scores one change against the clause it concerns. The explanation comes
    // from the collaborator when it answers, otherwise from explainChange().
    RiskAssessment classify(const Change &change, const Clause &clause) const;

    // round(categoryWeight * changeWeight * (1 + 2 * (1 - similarity)) * 3), capped at 100.
    static int riskScore(const std::optional<ClauseCategory> &category,
                         ChangeKind kind,
                         double similarity);
    static RiskLevel levelForScore(int score);

    static int categoryWeight(const std::optional<ClauseCategory> &category);
    static double changeWeight(ChangeKind kind);

    static bool shouldAlert(RiskLevel level, RiskLevel threshold = RiskLevel::High);

private:
    AiCollaborator *m_collaborator;
};

} // namespace clausedrift
