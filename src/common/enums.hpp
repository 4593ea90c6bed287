#pragma once

namespace clausedrift {

// Declaration order is the tie-break order for keyword classification.
enum class ClauseCategory {
    Liability,
    DataUsage,
    Termination,
    Jurisdiction,
    Payment,
    IntellectualProperty,
    ServiceLevel,
    Marketing
};

enum class ChangeKind {
    Added,
    Removed,
    Modified,
    Rewritten
};

enum class RiskLevel {
    Low,
    Medium,
    High,
    Critical
};

enum class ChangeMagnitude {
    Minor,
    Moderate,
    Major
};

} // namespace clausedrift
