#pragma once

#include <optional>
#include <string>

#include "common/enums.hpp"

namespace clausedrift {

// Deterministic explanation built from fixed phrases; never empty.
std::string explainChange(ChangeKind kind,
                          const std::optional<ClauseCategory> &category,
                          RiskLevel level);

// Human-readable section name, e.g. "data usage"; "contract" when uncategorized.
std::string categoryLabel(const std::optional<ClauseCategory> &category);

} // namespace clausedrift
