#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <cmath>
#include <string>
#include <vector>

#include "engine/fingerprint_engine.hpp"

using clausedrift::Fingerprint;
using clausedrift::FingerprintEngine;

namespace {

const std::string kPaymentClause =
    "The Customer shall pay a monthly subscription fee of $100 to the Provider within "
    "thirty days of receiving each invoice, and late payments accrue interest at the "
    "statutory rate.";
const std::string kPaymentClauseEdited =
    "The Customer shall pay a monthly subscription fee of $50 to the Provider within "
    "thirty days of receiving each invoice, and late payments accrue interest at the "
    "statutory rate.";
const std::string kMarketingClause =
    "The Provider may send promotional newsletter email messages to the Customer about "
    "new product features at any time.";

} // namespace

class FingerprintTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testNormalize();
    void testContentHash();
    void testEditHashStability();
    void testHammingDistance();
    void testKeywordWeights();
    void testKeywordWordBoundaries();
    void testKeywordSimilarity();
    void testSingleFingerprintHasNoVector();
    void testIdenticalTextScoresOne();
    void testSmallEditStaysModified();
    void testSimilarityIsCommutative();
    void testDifferentSessionsAreIncomparable();
    void testDegenerateBatch();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void FingerprintTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void FingerprintTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void FingerprintTests::testNormalize()
{
    QCOMPARE(FingerprintEngine::normalize("  Hello,   WORLD!\n\tFoo-bar  "),
             std::string("hello world foobar"));
    QCOMPARE(FingerprintEngine::normalize("Caf\xc3\xa9 au lait"), std::string("caf au lait"));
    QCOMPARE(FingerprintEngine::normalize(" ... "), std::string());
}

void FingerprintTests::testContentHash()
{
    QCOMPARE(FingerprintEngine::contentHash(""),
             std::string("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"));
    QCOMPARE(FingerprintEngine::contentHash("abc").size(), static_cast<std::size_t>(64));
}

void FingerprintTests::testEditHashStability()
{
    const auto normalized = FingerprintEngine::normalize(kPaymentClause);
    QCOMPARE(FingerprintEngine::editHash(normalized), FingerprintEngine::editHash(normalized));
    QCOMPARE(FingerprintEngine::editHash(""), static_cast<std::uint64_t>(0));

    const auto edited = FingerprintEngine::normalize(kPaymentClauseEdited);
    QVERIFY(FingerprintEngine::hammingDistance(FingerprintEngine::editHash(normalized),
                                               FingerprintEngine::editHash(edited))
            <= 4);
}

void FingerprintTests::testHammingDistance()
{
    QCOMPARE(FingerprintEngine::hammingDistance(0, 0), 0);
    QCOMPARE(FingerprintEngine::hammingDistance(0, ~std::uint64_t{0}), 64);
    QCOMPARE(FingerprintEngine::hammingDistance(0b1010, 0b0110), 2);
    QCOMPARE(FingerprintEngine::editHashSimilarity(0, ~std::uint64_t{0}), 0.0);
    QCOMPARE(FingerprintEngine::editHashSimilarity(42, 42), 1.0);
}

void FingerprintTests::testKeywordWeights()
{
    const FingerprintEngine engine;
    const auto fingerprint = engine.fingerprint("Data data DATA privacy privacy notice is ok");
    QCOMPARE(fingerprint.keywords.size(), static_cast<std::size_t>(3));
    QCOMPARE(fingerprint.keywords.at("data"), 0.5);
    QVERIFY(std::abs(fingerprint.keywords.at("privacy") - 2.0 / 6.0) < 1e-12);

    const FingerprintEngine narrow(2);
    const auto top = narrow.fingerprint("Data data DATA privacy privacy notice is ok");
    QCOMPARE(top.keywords.size(), static_cast<std::size_t>(2));
    QCOMPARE(top.keywords.at("data"), 0.6);
    QVERIFY(top.keywords.count("notice") == 0);

    QVERIFY(engine.fingerprint("a b c 42").keywords.empty());
}

void FingerprintTests::testKeywordWordBoundaries()
{
    const FingerprintEngine engine;
    const std::string longWord(100000, 'a');
    const auto fingerprint = engine.fingerprint("gdpr2018 data_set Privacy " + longWord);
    QCOMPARE(fingerprint.keywords.size(), static_cast<std::size_t>(2));
    QCOMPARE(fingerprint.keywords.at("privacy"), 0.5);
    QCOMPARE(fingerprint.keywords.at(longWord), 0.5);
    QVERIFY(fingerprint.keywords.count("gdpr") == 0);
    QVERIFY(fingerprint.keywords.count("data") == 0);
}

void FingerprintTests::testKeywordSimilarity()
{
    const std::map<std::string, double> a = {{"alpha", 0.5}, {"beta", 0.5}};
    const std::map<std::string, double> b = {{"alpha", 0.5}, {"gamma", 0.5}};
    QVERIFY(std::abs(FingerprintEngine::keywordSimilarity(a, b) - 1.0 / 3.0) < 1e-12);
    QCOMPARE(FingerprintEngine::keywordSimilarity(a, a), 1.0);
    QCOMPARE(FingerprintEngine::keywordSimilarity(a, {}), 0.0);
}

void FingerprintTests::testSingleFingerprintHasNoVector()
{
    const FingerprintEngine engine;
    const Fingerprint fingerprint = engine.fingerprint(kPaymentClause);
    QVERIFY(!fingerprint.vector.has_value());
    QCOMPARE(fingerprint.textHash,
             FingerprintEngine::contentHash(FingerprintEngine::normalize(kPaymentClause)));
}

void FingerprintTests::testIdenticalTextScoresOne()
{
    const FingerprintEngine engine;
    const auto fingerprints = engine.fingerprintBatch(
        {kPaymentClause, "  the CUSTOMER shall pay a monthly subscription fee of 100 to the "
                         "provider within thirty days of receiving each invoice and late "
                         "payments accrue interest at the statutory rate "});
    QCOMPARE(fingerprints[0].textHash, fingerprints[1].textHash);
    QCOMPARE(FingerprintEngine::similarity(fingerprints[0], fingerprints[1]), 1.0);
    QCOMPARE(FingerprintEngine::similarity(fingerprints[0], fingerprints[0]), 1.0);
}

void FingerprintTests::testSmallEditStaysModified()
{
    const FingerprintEngine engine;
    const auto fingerprints = engine.fingerprintBatch({kPaymentClause, kPaymentClauseEdited});
    QVERIFY(fingerprints[0].vector.has_value());
    QCOMPARE(fingerprints[0].vector->sessionId, fingerprints[1].vector->sessionId);

    const double similarity = FingerprintEngine::similarity(fingerprints[0], fingerprints[1]);
    QVERIFY(similarity >= 0.6);
    QVERIFY(similarity < 0.95);
    QVERIFY(similarity > 0.85);
}

void FingerprintTests::testSimilarityIsCommutative()
{
    const FingerprintEngine engine;
    const auto fingerprints =
        engine.fingerprintBatch({kPaymentClause, kPaymentClauseEdited, kMarketingClause});
    for (const auto &a : fingerprints) {
        for (const auto &b : fingerprints) {
            const double forward = FingerprintEngine::similarity(a, b);
            QCOMPARE(forward, FingerprintEngine::similarity(b, a));
            QVERIFY(forward >= 0.0 && forward <= 1.0);
        }
    }
    QVERIFY(FingerprintEngine::similarity(fingerprints[0], fingerprints[2]) < 0.6);
}

void FingerprintTests::testDifferentSessionsAreIncomparable()
{
    const FingerprintEngine engine;
    const auto first = engine.fingerprintBatch({kPaymentClause});
    const auto second = engine.fingerprintBatch({kPaymentClauseEdited});
    QVERIFY(first[0].vector.has_value());
    QVERIFY(second[0].vector.has_value());
    QVERIFY(first[0].vector->sessionId != second[0].vector->sessionId);
    QCOMPARE(FingerprintEngine::vectorSimilarity(first[0].vector, second[0].vector), 0.0);

    // A shared session makes them comparable.
    const auto session = engine.fitSession({kPaymentClause, kPaymentClauseEdited});
    const auto shared = engine.fingerprintBatch({kPaymentClause, kPaymentClauseEdited}, session);
    QVERIFY(FingerprintEngine::vectorSimilarity(shared[0].vector, shared[1].vector) > 0.5);
}

void FingerprintTests::testDegenerateBatch()
{
    const FingerprintEngine engine;
    const auto fingerprints = engine.fingerprintBatch({"a I", "the of and"});
    QCOMPARE(fingerprints.size(), static_cast<std::size_t>(2));
    QVERIFY(!fingerprints[0].vector.has_value());
    QVERIFY(!fingerprints[1].vector.has_value());
    QVERIFY(!fingerprints[0].textHash.empty());

    const double similarity = FingerprintEngine::similarity(fingerprints[0], fingerprints[1]);
    QVERIFY(similarity >= 0.0 && similarity <= 0.5);
    QVERIFY(engine.fingerprintBatch({}).empty());
}

QTEST_MAIN(FingerprintTests)
#include "test_fingerprint.moc"
