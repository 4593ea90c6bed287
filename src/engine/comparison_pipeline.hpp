#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"
#include "engine/ai_collaborator.hpp"
#include "engine/fingerprint_engine.hpp"

namespace clausedrift {

struct ComparisonOutcome {
    std::optional<ComparisonResult> result;
    std::string error;
};

/**
 * Runs one old/new comparison end to end:
 * segment -> merge short clauses -> fingerprint -> detect -> classify.
 *
 * Both versions are fingerprinted against one vectorization session fitted
 * over the clauses of the pair, so their term vectors are comparable. Runs
 * share nothing mutable, so independent pairs may be compared concurrently;
 * only the collaborator, if any, is shared.
 */
class ComparisonPipeline
{
public:
    explicit ComparisonPipeline(PipelineConfig config,
                                std::shared_ptr<AiCollaborator> collaborator = nullptr);

    // Throws std::invalid_argument when a version has neither text nor sections.
    std::vector<Clause> segmentVersion(const DocumentVersion &version) const;

    // Throws std::invalid_argument on missing input or when neither version
    // yields a clause.
    ComparisonResult compare(const DocumentVersion &oldVersion,
                             const DocumentVersion &newVersion) const;

    // One outcome per pair, in input order; failures do not affect other pairs.
    std::vector<ComparisonOutcome> compareMany(
        const std::vector<std::pair<DocumentVersion, DocumentVersion>> &pairs) const;

    const PipelineConfig &config() const { return m_config; }
    const FingerprintEngine &fingerprintEngine() const { return m_fingerprints; }

private:
    PipelineConfig m_config;
    std::shared_ptr<AiCollaborator> m_collaborator;
    FingerprintEngine m_fingerprints;
};

// Builds the collaborator described by config: Gemini behind the process-wide
// rate gate, or nullptr when AI assistance is disabled or unconfigured.
std::shared_ptr<AiCollaborator> makeConfiguredCollaborator(const PipelineConfig &config);

} // namespace clausedrift
