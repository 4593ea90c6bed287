#include "engine/risk_classifier.hpp"

#include <algorithm>
#include <cmath>
#include <exception>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/change_explainer.hpp"

namespace clausedrift {

namespace {

constexpr int kUncategorizedWeight = 2;
constexpr double kScoreScale = 3.0;
constexpr int kMaxScore = 100;

int levelRank(RiskLevel level)
{
    switch (level) {
    case RiskLevel::Low:
        return 0;
    case RiskLevel::Medium:
        return 1;
    case RiskLevel::High:
        return 2;
    case RiskLevel::Critical:
        return 3;
    }
    return 0;
}

} // namespace

RiskClassifier::RiskClassifier(AiCollaborator *collaborator)
    : m_collaborator(collaborator)
{
}

int RiskClassifier::categoryWeight(const std::optional<ClauseCategory> &category)
{
    if (!category.has_value()) {
        return kUncategorizedWeight;
    }
    switch (*category) {
    case ClauseCategory::Liability:
    case ClauseCategory::DataUsage:
        return 10;
    case ClauseCategory::IntellectualProperty:
        return 8;
    case ClauseCategory::Termination:
    case ClauseCategory::Payment:
        return 7;
    case ClauseCategory::Jurisdiction:
        return 6;
    case ClauseCategory::ServiceLevel:
        return 5;
    case ClauseCategory::Marketing:
        return 3;
    }
    return kUncategorizedWeight;
}

double RiskClassifier::changeWeight(ChangeKind kind)
{
    switch (kind) {
    case ChangeKind::Removed:
        return 1.5;
    case ChangeKind::Rewritten:
        return 1.3;
    case ChangeKind::Modified:
        return 1.0;
    case ChangeKind::Added:
        return 0.8;
    }
    return 1.0;
}

int RiskClassifier::riskScore(const std::optional<ClauseCategory> &category,
                              ChangeKind kind,
                              double similarity)
{
    // Lower similarity means a larger change.
    const double magnitude = 1.0 - std::clamp(similarity, 0.0, 1.0);
    const double raw = categoryWeight(category) * changeWeight(kind) * (1.0 + 2.0 * magnitude);
    const long scaled = std::lround(raw * kScoreScale);
    return static_cast<int>(std::clamp<long>(scaled, 0, kMaxScore));
}

RiskLevel RiskClassifier::levelForScore(int score)
{
    if (score >= 75) {
        return RiskLevel::Critical;
    }
    if (score >= 50) {
        return RiskLevel::High;
    }
    if (score >= 25) {
        return RiskLevel::Medium;
    }
    return RiskLevel::Low;
}

bool RiskClassifier::shouldAlert(RiskLevel level, RiskLevel threshold)
{
    return levelRank(level) >= levelRank(threshold);
}

RiskAssessment RiskClassifier::classify(const Change &change, const Clause &clause) const
{
    RiskAssessment assessment;
    assessment.score = riskScore(clause.category, change.kind, change.similarity);
    assessment.level = levelForScore(assessment.score);

    if (m_collaborator) {
        const std::string category = clause.category.has_value()
            ? toCategoryString(*clause.category)
            : std::string("other");
        const std::string changeSummary = change.summary.value_or(
            "The clause was " + toChangeKindString(change.kind) + ".");
        try {
            const auto explanation = m_collaborator->explain(clause.text, category, changeSummary);
            if (explanation.has_value() && !explanation->empty()) {
                assessment.explanation = *explanation;
            }
        } catch (const std::exception &error) {
            CDLOG_WARN(QStringLiteral("RiskClassifier"),
                       QStringLiteral("classify"),
                       QStringLiteral("ai_call_failed"),
                       QStringLiteral("collaborator_exception"),
                       QStringLiteral("rule_based_fallback"),
                       clausedrift::logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"method", "explain"}, {"error", error.what()}}));
        }
    }

    if (assessment.explanation.empty()) {
        assessment.explanation = explainChange(change.kind, clause.category, assessment.level);
    }

    CDLOG_DEBUG(QStringLiteral("RiskClassifier"),
                QStringLiteral("classify"),
                QStringLiteral("risk_classified"),
                QStringLiteral("comparison_run"),
                QStringLiteral("weighted_score"),
                clausedrift::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"kind", change.kind},
                                {"clause", clause.number},
                                {"score", assessment.score},
                                {"level", assessment.level}}));
    return assessment;
}

} // namespace clausedrift
