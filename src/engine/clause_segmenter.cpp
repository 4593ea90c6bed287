#include "engine/clause_segmenter.hpp"

#include <array>
#include <cctype>
#include <regex>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace clausedrift {

namespace {

// Fragments must have more than this many words to count as a clause.
constexpr int kMinFragmentWords = 10;
constexpr int kMaxHeadingWords = 12;
constexpr std::size_t kMaxHeadingChars = 200;

struct CategoryKeywords {
    ClauseCategory category;
    std::vector<std::string> keywords;
};

// Order matters: equal scores resolve to the earlier entry.
const std::array<CategoryKeywords, 8> &categoryTable()
{
    static const std::array<CategoryKeywords, 8> table = {{
        {ClauseCategory::Liability,
         {"liability", "indemnification", "damages", "limitation of liability",
          "warranty", "warranties", "disclaimer", "limitation", "cap"}},
        {ClauseCategory::DataUsage,
         {"data", "privacy", "personal information", "data processing",
          "data protection", "gdpr", "ccpa", "confidential", "confidentiality"}},
        {ClauseCategory::Termination,
         {"termination", "terminate", "cancellation", "cancel", "end",
          "expiration", "expire", "renewal", "term"}},
        {ClauseCategory::Jurisdiction,
         {"jurisdiction", "governing law", "venue", "arbitration",
          "dispute resolution", "legal", "court", "forum"}},
        {ClauseCategory::Payment,
         {"payment", "fees", "pricing", "billing", "subscription", "refund",
          "charge", "cost", "price"}},
        {ClauseCategory::IntellectualProperty,
         {"intellectual property", "copyright", "trademark", "patent", "ip",
          "proprietary", "ownership", "license"}},
        {ClauseCategory::ServiceLevel,
         {"sla", "service level", "uptime", "availability", "performance",
          "guarantee", "commitment"}},
        {ClauseCategory::Marketing,
         {"marketing", "promotional", "communication", "newsletter",
          "advertising", "email"}},
    }};
    return table;
}

std::string toLower(std::string value)
{
    for (auto &ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return value;
}

bool isSpace(char ch)
{
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

// Returns [start, end) of value with surrounding whitespace removed.
std::pair<std::size_t, std::size_t> trimmedBounds(const std::string &value,
                                                  std::size_t start,
                                                  std::size_t end)
{
    while (start < end && isSpace(value[start])) {
        ++start;
    }
    while (end > start && isSpace(value[end - 1])) {
        --end;
    }
    return {start, end};
}

std::string trim(const std::string &value)
{
    const auto [start, end] = trimmedBounds(value, 0, value.size());
    return value.substr(start, end - start);
}

// "4. Governing Law" / "12.3 Fees" / "Section 7 - Term" followed by a body.
std::optional<std::string> detectHeading(const std::string &fragment)
{
    const auto newline = fragment.find('\n');
    if (newline == std::string::npos) {
        return std::nullopt;
    }

    const std::string firstLine = trim(fragment.substr(0, newline));
    // std::regex recurses per character, so only short lines reach it.
    if (firstLine.size() > kMaxHeadingChars
        || ClauseSegmenter::countWords(firstLine) > kMaxHeadingWords) {
        return std::nullopt;
    }
    static const std::regex headingPattern(
        R"(^(?:(?:section|article|clause)\s+)?\d+(?:\.\d+)*\.?\s+\S)",
        std::regex::icase);
    if (!std::regex_search(firstLine, headingPattern)) {
        return std::nullopt;
    }

    std::string heading = firstLine;
    while (!heading.empty() && (heading.back() == '.' || heading.back() == ':')) {
        heading.pop_back();
    }
    return heading;
}

Clause makeClause(int number,
                  std::optional<std::string> heading,
                  std::string text,
                  std::size_t spanStart,
                  std::size_t spanEnd)
{
    Clause clause;
    clause.number = number;
    clause.category = ClauseSegmenter::classifyCategory(text, heading);
    clause.heading = std::move(heading);
    clause.wordCount = ClauseSegmenter::countWords(text);
    clause.text = std::move(text);
    clause.spanStart = spanStart;
    clause.spanEnd = spanEnd;
    return clause;
}

std::vector<Clause> segmentBySections(const std::string &text,
                                      const std::vector<SectionHint> &sections)
{
    std::vector<Clause> clauses;
    clauses.reserve(sections.size());

    // Hints do not carry offsets; locate each body in the document, scanning
    // forward. Bodies that cannot be found get spans that continue from the
    // previous clause.
    std::size_t cursor = 0;
    for (const auto &section : sections) {
        std::string body = trim(section.text);
        std::optional<std::string> heading;
        const std::string trimmedHeading = trim(section.heading);
        if (!trimmedHeading.empty()) {
            heading = trimmedHeading;
        }

        std::size_t start = body.empty() ? std::string::npos : text.find(body, cursor);
        if (start == std::string::npos) {
            start = cursor;
        }
        const std::size_t end = start + body.size();
        cursor = end;

        clauses.push_back(makeClause(static_cast<int>(clauses.size()) + 1,
                                     std::move(heading), std::move(body), start, end));
    }
    return clauses;
}

// Length of the line break at pos ("\n" or "\r\n"), 0 if there is none.
std::size_t lineBreakAt(const std::string &text, std::size_t pos)
{
    if (pos < text.size() && text[pos] == '\n') {
        return 1;
    }
    if (pos + 1 < text.size() && text[pos] == '\r' && text[pos + 1] == '\n') {
        return 2;
    }
    return 0;
}

bool isDigit(char ch)
{
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

// Splits on blank-line runs, or on a line break right before a numbered
// section ("\n12. ..."). The break before a number stays out of both
// fragments; the number starts the next one.
std::vector<std::pair<std::size_t, std::size_t>> splitFragments(const std::string &text)
{
    std::vector<std::pair<std::size_t, std::size_t>> fragments;
    std::size_t fragmentStart = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t breakLength = lineBreakAt(text, pos);
        if (breakLength == 0) {
            ++pos;
            continue;
        }

        std::size_t end = pos + breakLength;
        bool blankRun = false;
        for (;;) {
            std::size_t next = end;
            while (next < text.size() && (text[next] == ' ' || text[next] == '\t')) {
                ++next;
            }
            const std::size_t blankBreak = lineBreakAt(text, next);
            if (blankBreak == 0) {
                break;
            }
            end = next + blankBreak;
            blankRun = true;
        }

        bool numbered = false;
        if (!blankRun) {
            std::size_t digits = end;
            while (digits < text.size() && isDigit(text[digits])) {
                ++digits;
            }
            numbered = digits > end && digits < text.size() && text[digits] == '.';
        }

        if (blankRun || numbered) {
            fragments.emplace_back(fragmentStart, pos);
            fragmentStart = end;
        }
        pos = end;
    }
    fragments.emplace_back(fragmentStart, text.size());
    return fragments;
}

std::vector<Clause> segmentByParagraphs(const std::string &text)
{
    const auto fragments = splitFragments(text);

    std::vector<Clause> clauses;
    for (const auto &[rawStart, rawEnd] : fragments) {
        const auto [start, end] = trimmedBounds(text, rawStart, rawEnd);
        if (start >= end) {
            continue;
        }
        std::string fragment = text.substr(start, end - start);
        if (ClauseSegmenter::countWords(fragment) <= kMinFragmentWords) {
            continue;
        }
        auto heading = detectHeading(fragment);
        clauses.push_back(makeClause(static_cast<int>(clauses.size()) + 1,
                                     std::move(heading), std::move(fragment), start, end));
    }
    return clauses;
}

} // namespace

std::vector<Clause> ClauseSegmenter::segment(const std::string &text,
                                             const std::vector<SectionHint> &sections)
{
    std::vector<Clause> clauses = sections.empty()
        ? segmentByParagraphs(text)
        : segmentBySections(text, sections);

    CDLOG_DEBUG(QStringLiteral("ClauseSegmenter"),
                QStringLiteral("segment"),
                QStringLiteral("segment_complete"),
                QStringLiteral("comparison_input"),
                sections.empty() ? QStringLiteral("paragraph_split")
                                 : QStringLiteral("section_hints"),
                clausedrift::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"chars", text.size()},
                                {"sections", sections.size()},
                                {"clauses", clauses.size()}}));
    return clauses;
}

std::vector<Clause> ClauseSegmenter::mergeShortClauses(const std::vector<Clause> &clauses,
                                                       int minWords)
{
    if (clauses.empty()) {
        return {};
    }

    auto absorb = [](Clause &target, const Clause &next) {
        target.text += " " + next.text;
        target.wordCount += next.wordCount;
        target.spanEnd = next.spanEnd;
        if (!target.heading.has_value() && next.heading.has_value()) {
            target.heading = next.heading;
        }
        target.category = classifyCategory(target.text, target.heading);
    };

    std::vector<Clause> merged;
    Clause current = clauses.front();
    for (std::size_t i = 1; i < clauses.size(); ++i) {
        if (current.wordCount < minWords) {
            absorb(current, clauses[i]);
        } else {
            merged.push_back(std::move(current));
            current = clauses[i];
        }
    }

    if (current.wordCount < minWords && !merged.empty()) {
        absorb(merged.back(), current);
    } else {
        merged.push_back(std::move(current));
    }

    for (std::size_t i = 0; i < merged.size(); ++i) {
        merged[i].number = static_cast<int>(i) + 1;
    }
    return merged;
}

std::optional<ClauseCategory> ClauseSegmenter::classifyCategory(
    const std::string &text, const std::optional<std::string> &heading)
{
    const std::string combined = toLower(heading.value_or("") + " " + text);

    std::optional<ClauseCategory> best;
    int bestScore = 0;
    for (const auto &entry : categoryTable()) {
        int score = 0;
        for (const auto &keyword : entry.keywords) {
            if (combined.find(keyword) != std::string::npos) {
                ++score;
            }
        }
        if (score > bestScore) {
            bestScore = score;
            best = entry.category;
        }
    }
    return best;
}

int ClauseSegmenter::countWords(const std::string &text)
{
    std::istringstream stream(text);
    std::string word;
    int count = 0;
    while (stream >> word) {
        ++count;
    }
    return count;
}

} // namespace clausedrift
