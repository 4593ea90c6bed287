#include "engine/change_explainer.hpp"

#include <sstream>

namespace clausedrift {

namespace {

std::string impactPhrase(const std::optional<ClauseCategory> &category)
{
    if (!category.has_value()) {
        return "This may affect your contract terms.";
    }
    switch (*category) {
    case ClauseCategory::Liability:
        return "This affects your legal liability and potential damages.";
    case ClauseCategory::DataUsage:
        return "This impacts how your data is collected, used, or shared.";
    case ClauseCategory::Termination:
        return "This changes the terms for ending the contract.";
    case ClauseCategory::Jurisdiction:
        return "This affects which laws apply and where disputes are resolved.";
    case ClauseCategory::Payment:
        return "This impacts pricing, billing, or refund terms.";
    case ClauseCategory::IntellectualProperty:
        return "This affects ownership and usage rights.";
    case ClauseCategory::ServiceLevel:
        return "This changes service guarantees and uptime commitments.";
    case ClauseCategory::Marketing:
        return "This affects marketing communications and promotional usage.";
    }
    return "This may affect your contract terms.";
}

std::string changePhrase(ChangeKind kind)
{
    switch (kind) {
    case ChangeKind::Added:
        return "A new clause was added";
    case ChangeKind::Removed:
        return "An existing clause was removed";
    case ChangeKind::Modified:
        return "A clause was modified";
    case ChangeKind::Rewritten:
        return "A clause was significantly rewritten";
    }
    return "A change was detected";
}

std::string urgencyPhrase(RiskLevel level)
{
    switch (level) {
    case RiskLevel::Critical:
    case RiskLevel::High:
        return "Review this change carefully before accepting.";
    case RiskLevel::Medium:
        return "Consider reviewing this change.";
    case RiskLevel::Low:
        break;
    }
    return "This is a minor change.";
}

} // namespace

std::string categoryLabel(const std::optional<ClauseCategory> &category)
{
    if (!category.has_value()) {
        return "contract";
    }
    switch (*category) {
    case ClauseCategory::Liability:
        return "liability";
    case ClauseCategory::DataUsage:
        return "data usage";
    case ClauseCategory::Termination:
        return "termination";
    case ClauseCategory::Jurisdiction:
        return "jurisdiction";
    case ClauseCategory::Payment:
        return "payment";
    case ClauseCategory::IntellectualProperty:
        return "intellectual property";
    case ClauseCategory::ServiceLevel:
        return "service level";
    case ClauseCategory::Marketing:
        return "marketing";
    }
    return "contract";
}

std::string explainChange(ChangeKind kind,
                          const std::optional<ClauseCategory> &category,
                          RiskLevel level)
{
    std::ostringstream explanation;
    explanation << changePhrase(kind) << " in the " << categoryLabel(category)
                << " section. " << impactPhrase(category) << " " << urgencyPhrase(level);
    return explanation.str();
}

} // namespace clausedrift
