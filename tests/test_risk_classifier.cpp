#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <optional>
#include <stdexcept>
#include <string>

#include "engine/ai_collaborator.hpp"
#include "engine/risk_classifier.hpp"

using clausedrift::ChangeKind;
using clausedrift::ClauseCategory;
using clausedrift::RiskClassifier;
using clausedrift::RiskLevel;

namespace {

class ScriptedCollaborator : public clausedrift::AiCollaborator
{
public:
    std::optional<std::string> explanation;
    bool fail = false;
    std::string lastCategory;
    std::string lastSummary;
    int explainCalls = 0;

    std::optional<double> similarity(const std::string &, const std::string &) override
    {
        return std::nullopt;
    }

    std::optional<std::string> summarize(const std::string &,
                                         const std::string &,
                                         ChangeKind) override
    {
        return std::nullopt;
    }

    std::optional<std::string> explain(const std::string &,
                                       const std::string &category,
                                       const std::string &changeSummary) override
    {
        ++explainCalls;
        lastCategory = category;
        lastSummary = changeSummary;
        if (fail) {
            throw std::runtime_error("service unavailable");
        }
        return explanation;
    }
};

clausedrift::Clause clauseIn(std::optional<ClauseCategory> category)
{
    clausedrift::Clause clause;
    clause.number = 3;
    clause.category = category;
    clause.text = "In no event shall the Provider be liable for consequential damages.";
    clause.wordCount = 11;
    return clause;
}

clausedrift::Change changeOf(ChangeKind kind, double similarity)
{
    clausedrift::Change change;
    change.kind = kind;
    change.similarity = similarity;
    return change;
}

} // namespace

class RiskClassifierTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testLiabilityModifiedIsHigh();
    void testMarketingAddedIsLow();
    void testScoreIsCapped();
    void testUncategorizedWeight();
    void testScoreMonotonicInSimilarity();
    void testLevelBands();
    void testShouldAlert();
    void testRuleBasedExplanation();
    void testCollaboratorExplanation();
    void testCollaboratorAbsentOrFailing();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void RiskClassifierTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void RiskClassifierTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void RiskClassifierTests::testLiabilityModifiedIsHigh()
{
    const int score = RiskClassifier::riskScore(ClauseCategory::Liability, ChangeKind::Modified, 0.5);
    QCOMPARE(score, 60);
    QCOMPARE(RiskClassifier::levelForScore(score), RiskLevel::High);

    const RiskClassifier classifier;
    const auto assessment = classifier.classify(changeOf(ChangeKind::Modified, 0.5),
                                                clauseIn(ClauseCategory::Liability));
    QCOMPARE(assessment.score, 60);
    QCOMPARE(assessment.level, RiskLevel::High);
}

void RiskClassifierTests::testMarketingAddedIsLow()
{
    const int score = RiskClassifier::riskScore(ClauseCategory::Marketing, ChangeKind::Added, 0.9);
    QCOMPARE(score, 9);
    QCOMPARE(RiskClassifier::levelForScore(score), RiskLevel::Low);
}

void RiskClassifierTests::testScoreIsCapped()
{
    const int score = RiskClassifier::riskScore(ClauseCategory::Liability, ChangeKind::Removed, 0.0);
    QCOMPARE(score, 100);
    QCOMPARE(RiskClassifier::levelForScore(score), RiskLevel::Critical);
    // 3 * 1.5 * 3 * 3 = 40.5 rounds half away from zero.
    QCOMPARE(RiskClassifier::riskScore(ClauseCategory::Marketing, ChangeKind::Removed, 0.0), 41);
}

void RiskClassifierTests::testUncategorizedWeight()
{
    QCOMPARE(RiskClassifier::categoryWeight(std::nullopt), 2);
    QCOMPARE(RiskClassifier::categoryWeight(ClauseCategory::IntellectualProperty), 8);
    QCOMPARE(RiskClassifier::riskScore(std::nullopt, ChangeKind::Modified, 1.0), 6);
}

void RiskClassifierTests::testScoreMonotonicInSimilarity()
{
    const ClauseCategory categories[] = {ClauseCategory::Liability, ClauseCategory::Payment,
                                         ClauseCategory::Marketing};
    const ChangeKind kinds[] = {ChangeKind::Added, ChangeKind::Removed, ChangeKind::Modified,
                                ChangeKind::Rewritten};
    for (const auto category : categories) {
        for (const auto kind : kinds) {
            int previous = RiskClassifier::riskScore(category, kind, 0.0);
            for (int step = 1; step <= 10; ++step) {
                const int score = RiskClassifier::riskScore(category, kind, step / 10.0);
                QVERIFY(score <= previous);
                QVERIFY(score >= 0 && score <= 100);
                previous = score;
            }
        }
    }
}

void RiskClassifierTests::testLevelBands()
{
    QCOMPARE(RiskClassifier::levelForScore(0), RiskLevel::Low);
    QCOMPARE(RiskClassifier::levelForScore(24), RiskLevel::Low);
    QCOMPARE(RiskClassifier::levelForScore(25), RiskLevel::Medium);
    QCOMPARE(RiskClassifier::levelForScore(49), RiskLevel::Medium);
    QCOMPARE(RiskClassifier::levelForScore(50), RiskLevel::High);
    QCOMPARE(RiskClassifier::levelForScore(74), RiskLevel::High);
    QCOMPARE(RiskClassifier::levelForScore(75), RiskLevel::Critical);
    QCOMPARE(RiskClassifier::levelForScore(100), RiskLevel::Critical);
}

void RiskClassifierTests::testShouldAlert()
{
    QVERIFY(!RiskClassifier::shouldAlert(RiskLevel::Low));
    QVERIFY(!RiskClassifier::shouldAlert(RiskLevel::Medium));
    QVERIFY(RiskClassifier::shouldAlert(RiskLevel::High));
    QVERIFY(RiskClassifier::shouldAlert(RiskLevel::Critical));
    QVERIFY(RiskClassifier::shouldAlert(RiskLevel::Medium, RiskLevel::Medium));
    QVERIFY(!RiskClassifier::shouldAlert(RiskLevel::High, RiskLevel::Critical));
    QVERIFY(RiskClassifier::shouldAlert(RiskLevel::Low, RiskLevel::Low));
}

void RiskClassifierTests::testRuleBasedExplanation()
{
    const RiskClassifier classifier;
    const auto removed = classifier.classify(changeOf(ChangeKind::Removed, 0.0),
                                             clauseIn(ClauseCategory::DataUsage));
    QVERIFY(!removed.explanation.empty());
    QVERIFY(QString::fromStdString(removed.explanation).contains("data usage"));

    const auto uncategorized = classifier.classify(changeOf(ChangeKind::Added, 0.0),
                                                   clauseIn(std::nullopt));
    QVERIFY(!uncategorized.explanation.empty());
}

void RiskClassifierTests::testCollaboratorExplanation()
{
    ScriptedCollaborator collaborator;
    collaborator.explanation = "Liability is no longer capped.";
    const RiskClassifier classifier(&collaborator);

    auto change = changeOf(ChangeKind::Modified, 0.7);
    change.summary = "The liability cap was removed.";
    const auto assessment = classifier.classify(change, clauseIn(ClauseCategory::Liability));

    QCOMPARE(assessment.explanation, std::string("Liability is no longer capped."));
    QCOMPARE(collaborator.lastCategory, std::string("liability"));
    QCOMPARE(collaborator.lastSummary, std::string("The liability cap was removed."));
    // The score never depends on the collaborator.
    QCOMPARE(assessment.score,
             RiskClassifier::riskScore(ClauseCategory::Liability, ChangeKind::Modified, 0.7));

    classifier.classify(changeOf(ChangeKind::Added, 0.0), clauseIn(std::nullopt));
    QCOMPARE(collaborator.lastCategory, std::string("other"));
    QCOMPARE(collaborator.lastSummary, std::string("The clause was added."));
}

void RiskClassifierTests::testCollaboratorAbsentOrFailing()
{
    const RiskClassifier plain;
    const auto expected = plain.classify(changeOf(ChangeKind::Rewritten, 0.4),
                                         clauseIn(ClauseCategory::Payment));

    ScriptedCollaborator silent;
    const RiskClassifier withSilent(&silent);
    const auto fromSilent = withSilent.classify(changeOf(ChangeKind::Rewritten, 0.4),
                                                clauseIn(ClauseCategory::Payment));
    QCOMPARE(silent.explainCalls, 1);
    QCOMPARE(fromSilent.explanation, expected.explanation);

    ScriptedCollaborator failing;
    failing.fail = true;
    const RiskClassifier withFailing(&failing);
    const auto fromFailing = withFailing.classify(changeOf(ChangeKind::Rewritten, 0.4),
                                                  clauseIn(ClauseCategory::Payment));
    QCOMPARE(fromFailing.explanation, expected.explanation);
    QCOMPARE(fromFailing.score, expected.score);
    QCOMPARE(fromFailing.level, expected.level);
}

QTEST_MAIN(RiskClassifierTests)
#include "test_risk_classifier.moc"
