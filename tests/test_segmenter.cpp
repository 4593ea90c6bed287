#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <string>
#include <vector>

#include "engine/clause_segmenter.hpp"

namespace {

const std::string kLiability =
    "1. Limitation of Liability\n"
    "In no event shall the Provider be liable for indirect, incidental or consequential "
    "damages, and the total liability of the Provider shall not exceed the fees paid.";
const std::string kTermination =
    "2. Term and Termination\n"
    "Either party may terminate this Agreement upon thirty days written notice, and the "
    "Agreement ends automatically upon expiration of the subscription period.";

clausedrift::Clause clauseOfWords(int number, int words)
{
    clausedrift::Clause clause;
    clause.number = number;
    std::string text;
    for (int i = 0; i < words; ++i) {
        text += (i == 0 ? "" : " ") + std::string("word");
    }
    clause.text = text;
    clause.wordCount = words;
    clause.spanStart = static_cast<std::size_t>(number) * 100;
    clause.spanEnd = clause.spanStart + text.size();
    return clause;
}

} // namespace

using clausedrift::Clause;
using clausedrift::ClauseCategory;
using clausedrift::ClauseSegmenter;
using clausedrift::SectionHint;

class SegmenterTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testEmptyText();
    void testParagraphSplitDropsShortFragments();
    void testNumberedLinesSplitWithoutBlankLine();
    void testHeadingDetection();
    void testSpansPointIntoText();
    void testSectionHints();
    void testSectionHintMissingFromText();
    void testMergeShortClauses();
    void testMergeKeepsSoleShortClause();
    void testClassifyCategory();
    void testLongNumberedFirstLine();
    void testLongBlankLineAndCrlfBoundaries();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void SegmenterTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void SegmenterTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void SegmenterTests::testEmptyText()
{
    QVERIFY(ClauseSegmenter::segment("").empty());
    QVERIFY(ClauseSegmenter::segment("   \n\n  \n").empty());
}

void SegmenterTests::testParagraphSplitDropsShortFragments()
{
    const std::string text = "MASTER SERVICES AGREEMENT\n\n" + kLiability + "\n\n"
        + "Signed below.\n\n" + kTermination + "\n";

    const auto clauses = ClauseSegmenter::segment(text);
    QCOMPARE(clauses.size(), static_cast<std::size_t>(2));
    QCOMPARE(clauses[0].number, 1);
    QCOMPARE(clauses[1].number, 2);
    QCOMPARE(clauses[0].text, kLiability);
    QCOMPARE(clauses[1].text, kTermination);
    QVERIFY(clauses[0].wordCount > 10);
}

void SegmenterTests::testNumberedLinesSplitWithoutBlankLine()
{
    const std::string text = kLiability + "\n" + kTermination;

    const auto clauses = ClauseSegmenter::segment(text);
    QCOMPARE(clauses.size(), static_cast<std::size_t>(2));
    QCOMPARE(clauses[0].text, kLiability);
    QCOMPARE(clauses[1].text, kTermination);
}

void SegmenterTests::testHeadingDetection()
{
    const auto clauses = ClauseSegmenter::segment(kLiability + "\n\n" + kTermination);
    QCOMPARE(clauses.size(), static_cast<std::size_t>(2));
    QVERIFY(clauses[0].heading.has_value());
    QCOMPARE(*clauses[0].heading, std::string("1. Limitation of Liability"));
    QCOMPARE(*clauses[1].heading, std::string("2. Term and Termination"));
    QCOMPARE(clauses[0].category, std::optional<ClauseCategory>(ClauseCategory::Liability));
    QCOMPARE(clauses[1].category, std::optional<ClauseCategory>(ClauseCategory::Termination));

    const std::string plain =
        "The parties agree that this document supersedes every prior understanding "
        "between them regarding its subject matter.";
    const auto plainClauses = ClauseSegmenter::segment(plain);
    QCOMPARE(plainClauses.size(), static_cast<std::size_t>(1));
    QVERIFY(!plainClauses[0].heading.has_value());
}

void SegmenterTests::testSpansPointIntoText()
{
    const std::string text = "\n\n  " + kLiability + "  \n\n\n" + kTermination + "\n\n";
    const auto clauses = ClauseSegmenter::segment(text);
    QCOMPARE(clauses.size(), static_cast<std::size_t>(2));
    for (const auto &clause : clauses) {
        QVERIFY(clause.spanEnd > clause.spanStart);
        QVERIFY(clause.spanEnd <= text.size());
        QCOMPARE(text.substr(clause.spanStart, clause.spanEnd - clause.spanStart), clause.text);
    }
    QVERIFY(clauses[0].spanEnd <= clauses[1].spanStart);
}

void SegmenterTests::testSectionHints()
{
    const std::string liabilityBody =
        "In no event shall the Provider be liable for consequential damages.";
    const std::string paymentBody = "Fees are payable monthly in advance.";
    const std::string text = "Preamble.\n" + liabilityBody + "\n" + paymentBody;

    const std::vector<SectionHint> hints = {
        {"Limitation of Liability", liabilityBody},
        {"", "  " + paymentBody + "  "},
    };
    const auto clauses = ClauseSegmenter::segment(text, hints);
    QCOMPARE(clauses.size(), static_cast<std::size_t>(2));

    QCOMPARE(clauses[0].number, 1);
    QCOMPARE(*clauses[0].heading, std::string("Limitation of Liability"));
    QCOMPARE(clauses[0].text, liabilityBody);
    QCOMPARE(clauses[0].spanStart, text.find(liabilityBody));
    QCOMPARE(clauses[0].category, std::optional<ClauseCategory>(ClauseCategory::Liability));

    // Short hint bodies are kept; only paragraph splitting drops fragments.
    QCOMPARE(clauses[1].number, 2);
    QVERIFY(!clauses[1].heading.has_value());
    QCOMPARE(clauses[1].text, paymentBody);
    QCOMPARE(clauses[1].spanStart, text.find(paymentBody));
    QCOMPARE(clauses[1].spanEnd, text.size());
    QCOMPARE(clauses[1].category, std::optional<ClauseCategory>(ClauseCategory::Payment));
}

void SegmenterTests::testSectionHintMissingFromText()
{
    const std::vector<SectionHint> hints = {
        {"Fees", "Fees are payable monthly in advance."},
        {"Term", "This agreement renews every year."},
    };
    const auto clauses = ClauseSegmenter::segment("", hints);
    QCOMPARE(clauses.size(), static_cast<std::size_t>(2));
    QCOMPARE(clauses[0].spanStart, static_cast<std::size_t>(0));
    QCOMPARE(clauses[0].spanEnd, hints[0].text.size());
    QCOMPARE(clauses[1].spanStart, clauses[0].spanEnd);
}

void SegmenterTests::testMergeShortClauses()
{
    const std::vector<Clause> clauses = {
        clauseOfWords(1, 3), clauseOfWords(2, 20), clauseOfWords(3, 30), clauseOfWords(4, 4)};

    const auto merged = ClauseSegmenter::mergeShortClauses(clauses, 5);
    QCOMPARE(merged.size(), static_cast<std::size_t>(2));
    QCOMPARE(merged[0].number, 1);
    QCOMPARE(merged[0].wordCount, 23);
    QCOMPARE(merged[0].spanStart, clauses[0].spanStart);
    QCOMPARE(merged[0].spanEnd, clauses[1].spanEnd);
    QCOMPARE(merged[1].number, 2);
    QCOMPARE(merged[1].wordCount, 34);
    QCOMPARE(merged[1].spanEnd, clauses[3].spanEnd);
    for (const auto &clause : merged) {
        QVERIFY(clause.wordCount >= 5);
        QCOMPARE(ClauseSegmenter::countWords(clause.text), clause.wordCount);
    }

    const auto unchanged = ClauseSegmenter::mergeShortClauses(clauses, 0);
    QCOMPARE(unchanged.size(), clauses.size());
    QVERIFY(ClauseSegmenter::mergeShortClauses({}, 5).empty());
}

void SegmenterTests::testMergeKeepsSoleShortClause()
{
    const auto merged = ClauseSegmenter::mergeShortClauses({clauseOfWords(7, 2)}, 10);
    QCOMPARE(merged.size(), static_cast<std::size_t>(1));
    QCOMPARE(merged[0].number, 1);
    QCOMPARE(merged[0].wordCount, 2);

    const auto allShort = ClauseSegmenter::mergeShortClauses(
        {clauseOfWords(1, 2), clauseOfWords(2, 2), clauseOfWords(3, 2)}, 10);
    QCOMPARE(allShort.size(), static_cast<std::size_t>(1));
    QCOMPARE(allShort[0].wordCount, 6);
}

void SegmenterTests::testClassifyCategory()
{
    QCOMPARE(ClauseSegmenter::classifyCategory(
                 "The Provider may terminate this agreement upon expiration", std::nullopt),
             std::optional<ClauseCategory>(ClauseCategory::Termination));
    QCOMPARE(ClauseSegmenter::classifyCategory(
                 "The quick brown fox jumps over the lazy dog", std::nullopt),
             std::optional<ClauseCategory>());
    // Equal scores go to the category listed first.
    QCOMPARE(ClauseSegmenter::classifyCategory("damages and fees", std::nullopt),
             std::optional<ClauseCategory>(ClauseCategory::Liability));
    // The heading counts towards the score.
    QCOMPARE(ClauseSegmenter::classifyCategory(
                 "The quick brown fox", std::optional<std::string>("Newsletter")),
             std::optional<ClauseCategory>(ClauseCategory::Marketing));
}

void SegmenterTests::testLongNumberedFirstLine()
{
    std::string firstLine = "1. Definitions";
    firstLine.reserve(100 * 1024);
    while (firstLine.size() < 100 * 1024) {
        firstLine += " word";
    }
    const std::string clauseText =
        firstLine + "\nThe definitions above apply throughout this agreement.";
    const std::string text = clauseText + "\n" + kTermination;

    const auto clauses = ClauseSegmenter::segment(text);
    QCOMPARE(clauses.size(), static_cast<std::size_t>(2));
    QCOMPARE(clauses[0].text, clauseText);
    QVERIFY(!clauses[0].heading.has_value());
    QCOMPARE(*clauses[1].heading, std::string("2. Term and Termination"));
}

void SegmenterTests::testLongBlankLineAndCrlfBoundaries()
{
    const std::string spaced =
        kLiability + "\n" + std::string(100000, ' ') + "\n" + kTermination;
    const auto spacedClauses = ClauseSegmenter::segment(spaced);
    QCOMPARE(spacedClauses.size(), static_cast<std::size_t>(2));
    QCOMPARE(spacedClauses[0].text, kLiability);
    QCOMPARE(spacedClauses[1].text, kTermination);
    QCOMPARE(spacedClauses[1].spanStart, spaced.size() - kTermination.size());

    const auto crlfClauses = ClauseSegmenter::segment(kLiability + "\r\n\r\n" + kTermination);
    QCOMPARE(crlfClauses.size(), static_cast<std::size_t>(2));
    QCOMPARE(crlfClauses[0].text, kLiability);
    QCOMPARE(crlfClauses[1].text, kTermination);
}

QTEST_MAIN(SegmenterTests)
#include "test_segmenter.moc"
