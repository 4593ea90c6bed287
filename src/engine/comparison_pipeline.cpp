#include "engine/comparison_pipeline.hpp"

#include <algorithm>
#include <cctype>
#include <future>
#include <stdexcept>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "engine/ai_call_gate.hpp"
#include "engine/clause_segmenter.hpp"
#include "engine/drift_detector.hpp"
#include "engine/gemini_collaborator.hpp"
#include "engine/risk_classifier.hpp"

namespace clausedrift {

namespace {

bool isBlank(const std::string &text)
{
    return std::all_of(text.begin(), text.end(), [](char ch) {
        return std::isspace(static_cast<unsigned char>(ch)) != 0;
    });
}

std::vector<std::string> clauseTexts(const std::vector<Clause> &clauses)
{
    std::vector<std::string> texts;
    texts.reserve(clauses.size());
    for (const auto &clause : clauses) {
        texts.push_back(clause.text);
    }
    return texts;
}

std::vector<FingerprintedClause> attachFingerprints(const std::vector<Clause> &clauses,
                                                    const std::vector<Fingerprint> &fingerprints)
{
    std::vector<FingerprintedClause> result;
    result.reserve(clauses.size());
    for (std::size_t i = 0; i < clauses.size(); ++i) {
        result.push_back({clauses[i], fingerprints[i]});
    }
    return result;
}

void tally(ComparisonStats &stats, const Change &change)
{
    ++stats.changesDetected;
    switch (change.kind) {
    case ChangeKind::Added:
        ++stats.added;
        break;
    case ChangeKind::Removed:
        ++stats.removed;
        break;
    case ChangeKind::Modified:
        ++stats.modified;
        break;
    case ChangeKind::Rewritten:
        ++stats.rewritten;
        break;
    }
    if (change.alert) {
        ++stats.alerts;
    }
    if (change.riskLevel == RiskLevel::High || change.riskLevel == RiskLevel::Critical) {
        ++stats.highRiskChanges;
    }
}

} // namespace

ComparisonPipeline::ComparisonPipeline(PipelineConfig config,
                                       std::shared_ptr<AiCollaborator> collaborator)
    : m_config(std::move(config))
    , m_collaborator(std::move(collaborator))
    , m_fingerprints(m_config.keywordCount, m_config.maxVocabulary)
{
}

std::vector<Clause> ComparisonPipeline::segmentVersion(const DocumentVersion &version) const
{
    if (isBlank(version.text) && version.sections.empty()) {
        throw std::invalid_argument("version '" + version.id + "' has no text to segment");
    }

    std::vector<Clause> clauses = ClauseSegmenter::segment(version.text, version.sections);
    if (m_config.minClauseWords > 0) {
        clauses = ClauseSegmenter::mergeShortClauses(clauses, m_config.minClauseWords);
    }
    return clauses;
}

ComparisonResult ComparisonPipeline::compare(const DocumentVersion &oldVersion,
                                             const DocumentVersion &newVersion) const
{
    clausedrift::logging::ComparisonLogScope trace(
        oldVersion.id, newVersion.id, nlohmann::json{{"ai", m_collaborator != nullptr}});

    ComparisonResult result;
    result.oldVersionId = oldVersion.id;
    result.newVersionId = newVersion.id;
    result.oldClauses = segmentVersion(oldVersion);
    result.newClauses = segmentVersion(newVersion);

    if (result.oldClauses.empty() && result.newClauses.empty()) {
        throw std::invalid_argument("neither version contains a clause to compare");
    }

    const auto oldTexts = clauseTexts(result.oldClauses);
    const auto newTexts = clauseTexts(result.newClauses);
    std::vector<std::string> population = oldTexts;
    population.insert(population.end(), newTexts.begin(), newTexts.end());
    const VectorizationSession session = m_fingerprints.fitSession(population);

    const auto oldFingerprinted = attachFingerprints(
        result.oldClauses, m_fingerprints.fingerprintBatch(oldTexts, session));
    const auto newFingerprinted = attachFingerprints(
        result.newClauses, m_fingerprints.fingerprintBatch(newTexts, session));

    const DriftDetector detector(m_collaborator.get(), m_config.aiSemanticSimilarity);
    result.changes = detector.detect(oldFingerprinted, newFingerprinted);

    const RiskClassifier classifier(m_collaborator.get());
    for (auto &change : result.changes) {
        const Clause *subject = change.subjectClause();
        if (subject == nullptr) {
            continue;
        }
        const RiskAssessment assessment = classifier.classify(change, *subject);
        change.riskLevel = assessment.level;
        change.riskScore = assessment.score;
        change.explanation = assessment.explanation;
        change.alert = RiskClassifier::shouldAlert(assessment.level, m_config.alertThreshold);
    }

    result.stats.oldClauses = result.oldClauses.size();
    result.stats.newClauses = result.newClauses.size();
    for (const auto &change : result.changes) {
        tally(result.stats, change);
    }

    trace.complete(nlohmann::json{{"oldClauses", result.stats.oldClauses},
                                  {"newClauses", result.stats.newClauses},
                                  {"changes", result.stats.changesDetected},
                                  {"alerts", result.stats.alerts},
                                  {"vocabulary", session.vocabularySize()}});
    return result;
}

std::vector<ComparisonOutcome> ComparisonPipeline::compareMany(
    const std::vector<std::pair<DocumentVersion, DocumentVersion>> &pairs) const
{
    std::vector<ComparisonOutcome> outcomes(pairs.size());
    const std::size_t workers = static_cast<std::size_t>(std::max(1, m_config.workerCount));

    // Launch in waves of at most `workers` concurrent comparisons.
    for (std::size_t begin = 0; begin < pairs.size(); begin += workers) {
        const std::size_t end = std::min(pairs.size(), begin + workers);
        std::vector<std::future<ComparisonResult>> wave;
        wave.reserve(end - begin);
        for (std::size_t i = begin; i < end; ++i) {
            wave.push_back(std::async(std::launch::async, [this, &pairs, i]() {
                return compare(pairs[i].first, pairs[i].second);
            }));
        }
        for (std::size_t i = begin; i < end; ++i) {
            try {
                outcomes[i].result = wave[i - begin].get();
            } catch (const std::exception &error) {
                outcomes[i].error = error.what();
                CDLOG_WARN(QStringLiteral("ComparisonPipeline"),
                           QStringLiteral("compareMany"),
                           QStringLiteral("comparison_failed"),
                           QStringLiteral("version_pair"),
                           QStringLiteral("report_to_caller"),
                           clausedrift::logging::defaultWho(),
                           QString(),
                           (nlohmann::json{{"oldVersion", pairs[i].first.id},
                                           {"newVersion", pairs[i].second.id},
                                           {"error", error.what()}}));
            }
        }
    }
    return outcomes;
}

std::shared_ptr<AiCollaborator> makeConfiguredCollaborator(const PipelineConfig &config)
{
    if (!config.aiEnabled || config.geminiApiKey.empty()) {
        return nullptr;
    }

    GeminiSettings settings;
    settings.apiKey = config.geminiApiKey;
    settings.model = config.geminiModel;
    settings.endpoint = config.geminiEndpoint;
    settings.timeout = config.aiTimeout;

    AiCallGate &gate = AiCallGate::processGate();
    gate.setMinInterval(config.aiMinInterval);
    return std::make_shared<RateLimitedCollaborator>(
        std::make_shared<GeminiCollaborator>(std::move(settings)), gate);
}

} // namespace clausedrift
