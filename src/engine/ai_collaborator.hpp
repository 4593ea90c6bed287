#pragma once

#include <optional>
#include <string>

#include "common/enums.hpp"

namespace clausedrift {

/**
 * Optional language-model assistant for the detector and classifier.
 *
 * Every method reports unavailability by returning std::nullopt. Callers
 * still guard each call, since an implementation may throw, and always
 * keep a rule-based path that works without any result.
 */
class AiCollaborator
{
public:
    virtual ~AiCollaborator() = default;

    // Semantic closeness of two clauses in [0, 1].
    virtual std::optional<double> similarity(const std::string &textA,
                                             const std::string &textB) = 0;

    // One or two sentences on what changed between the versions of a clause.
    virtual std::optional<std::string> summarize(const std::string &oldText,
                                                 const std::string &newText,
                                                 ChangeKind kind) = 0;

    // Why the change matters to a business reader.
    virtual std::optional<std::string> explain(const std::string &clauseText,
                                               const std::string &category,
                                               const std::string &changeSummary) = 0;
};

} // namespace clausedrift
