#include "engine/fingerprint_engine.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <cctype>
#include <cmath>
#include <sstream>
#include <unordered_map>
#include <utility>

#include <QByteArray>
#include <QCryptographicHash>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace clausedrift {

namespace {

bool isWordChar(char ch)
{
    const auto byte = static_cast<unsigned char>(ch);
    return byte < 0x80 && (std::isalnum(byte) || ch == '_');
}

// Whole words of four or more lowercase letters. A run of word characters
// that contains a digit or underscore does not count.
std::vector<std::string> keywordCandidates(const std::string &lowered)
{
    std::vector<std::string> words;
    std::size_t pos = 0;
    while (pos < lowered.size()) {
        if (!isWordChar(lowered[pos])) {
            ++pos;
            continue;
        }
        const std::size_t start = pos;
        bool lettersOnly = true;
        while (pos < lowered.size() && isWordChar(lowered[pos])) {
            if (lowered[pos] < 'a' || lowered[pos] > 'z') {
                lettersOnly = false;
            }
            ++pos;
        }
        if (lettersOnly && pos - start >= 4) {
            words.push_back(lowered.substr(start, pos - start));
        }
    }
    return words;
}

} // namespace

FingerprintEngine::FingerprintEngine(std::size_t keywordCount, std::size_t maxVocabulary)
    : m_keywordCount(keywordCount)
    , m_maxVocabulary(maxVocabulary)
{
}

std::string FingerprintEngine::normalize(const std::string &text)
{
    std::string normalized;
    normalized.reserve(text.size());
    bool pendingSpace = false;
    for (const char raw : text) {
        const auto ch = static_cast<unsigned char>(raw);
        if (std::isspace(ch)) {
            pendingSpace = true;
            continue;
        }
        if (ch >= 0x80 || !std::isalnum(ch)) {
            continue;
        }
        if (pendingSpace && !normalized.empty()) {
            normalized.push_back(' ');
        }
        pendingSpace = false;
        normalized.push_back(static_cast<char>(std::tolower(ch)));
    }
    return normalized;
}

std::string FingerprintEngine::contentHash(const std::string &normalized)
{
    const QByteArray digest = QCryptographicHash::hash(
        QByteArray::fromStdString(normalized), QCryptographicHash::Sha256);
    return digest.toHex().toStdString();
}

std::uint64_t FingerprintEngine::editHash(const std::string &normalized)
{
    std::array<int, kEditHashBits> counters{};

    std::istringstream stream(normalized);
    std::string token;
    while (stream >> token) {
        // Low 64 bits of the 128-bit MD5 digest read as a big-endian integer.
        const QByteArray digest = QCryptographicHash::hash(
            QByteArray::fromStdString(token), QCryptographicHash::Md5);
        std::uint64_t tokenHash = 0;
        for (int i = 8; i < 16; ++i) {
            tokenHash = (tokenHash << 8) | static_cast<unsigned char>(digest.at(i));
        }

        for (int bit = 0; bit < kEditHashBits; ++bit) {
            if (tokenHash & (std::uint64_t{1} << bit)) {
                ++counters[bit];
            } else {
                --counters[bit];
            }
        }
    }

    std::uint64_t hash = 0;
    for (int bit = 0; bit < kEditHashBits; ++bit) {
        if (counters[bit] > 0) {
            hash |= std::uint64_t{1} << bit;
        }
    }
    return hash;
}

std::map<std::string, double> FingerprintEngine::keywordWeights(const std::string &text) const
{
    std::string lowered = text;
    for (auto &ch : lowered) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }

    // Counts in first-seen order, so equal counts keep document order.
    std::vector<std::pair<std::string, int>> counts;
    std::unordered_map<std::string, std::size_t> position;
    for (const auto &word : keywordCandidates(lowered)) {
        const auto found = position.find(word);
        if (found == position.end()) {
            position.emplace(word, counts.size());
            counts.emplace_back(word, 1);
        } else {
            ++counts[found->second].second;
        }
    }

    std::stable_sort(counts.begin(), counts.end(),
                     [](const auto &a, const auto &b) { return a.second > b.second; });
    if (counts.size() > m_keywordCount) {
        counts.resize(m_keywordCount);
    }

    int total = 0;
    for (const auto &entry : counts) {
        total += entry.second;
    }

    std::map<std::string, double> weights;
    if (total == 0) {
        return weights;
    }
    for (const auto &[word, count] : counts) {
        weights[word] = static_cast<double>(count) / static_cast<double>(total);
    }
    return weights;
}

Fingerprint FingerprintEngine::baseFingerprint(const std::string &text,
                                               const std::string &normalized) const
{
    Fingerprint fingerprint;
    fingerprint.textHash = contentHash(normalized);
    fingerprint.editHash = editHash(normalized);
    fingerprint.keywords = keywordWeights(text);
    return fingerprint;
}

Fingerprint FingerprintEngine::fingerprint(const std::string &text) const
{
    return baseFingerprint(text, normalize(text));
}

VectorizationSession FingerprintEngine::fitSession(const std::vector<std::string> &texts) const
{
    std::vector<std::string> normalized;
    normalized.reserve(texts.size());
    for (const auto &text : texts) {
        normalized.push_back(normalize(text));
    }
    return VectorizationSession::fit(normalized, m_maxVocabulary);
}

std::vector<Fingerprint> FingerprintEngine::fingerprintBatch(
    const std::vector<std::string> &texts) const
{
    return fingerprintBatch(texts, fitSession(texts));
}

std::vector<Fingerprint> FingerprintEngine::fingerprintBatch(
    const std::vector<std::string> &texts, const VectorizationSession &session) const
{
    if (session.isDegenerate()) {
        CDLOG_DEBUG(QStringLiteral("FingerprintEngine"),
                    QStringLiteral("fingerprintBatch"),
                    QStringLiteral("vectorization_degenerate"),
                    QStringLiteral("empty_vocabulary"),
                    QStringLiteral("vectors_omitted"),
                    clausedrift::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"texts", texts.size()}, {"session", session.id()}}));
    }

    std::vector<Fingerprint> fingerprints;
    fingerprints.reserve(texts.size());
    for (const auto &text : texts) {
        const std::string normalized = normalize(text);
        Fingerprint fingerprint = baseFingerprint(text, normalized);
        fingerprint.vector = session.transform(normalized);
        fingerprints.push_back(std::move(fingerprint));
    }

    CDLOG_DEBUG(QStringLiteral("FingerprintEngine"),
                QStringLiteral("fingerprintBatch"),
                QStringLiteral("fingerprint_batch_complete"),
                QStringLiteral("comparison_run"),
                QStringLiteral("batch"),
                clausedrift::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"texts", texts.size()},
                                {"session", session.id()},
                                {"vocabulary", session.vocabularySize()}}));
    return fingerprints;
}

int FingerprintEngine::hammingDistance(std::uint64_t a, std::uint64_t b)
{
    return std::popcount(a ^ b);
}

double FingerprintEngine::editHashSimilarity(std::uint64_t a, std::uint64_t b)
{
    return 1.0 - static_cast<double>(hammingDistance(a, b)) / kEditHashBits;
}

double FingerprintEngine::vectorSimilarity(const std::optional<TermVector> &a,
                                           const std::optional<TermVector> &b)
{
    if (!a.has_value() || !b.has_value()) {
        return 0.0;
    }
    if (a->sessionId != b->sessionId || a->weights.size() != b->weights.size()) {
        return 0.0;
    }

    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (std::size_t i = 0; i < a->weights.size(); ++i) {
        dot += a->weights[i] * b->weights[i];
        normA += a->weights[i] * a->weights[i];
        normB += b->weights[i] * b->weights[i];
    }
    if (normA <= 0.0 || normB <= 0.0) {
        return 0.0;
    }
    return dot / (std::sqrt(normA) * std::sqrt(normB));
}

double FingerprintEngine::keywordSimilarity(const std::map<std::string, double> &a,
                                            const std::map<std::string, double> &b)
{
    if (a.empty() || b.empty()) {
        return 0.0;
    }

    double overlap = 0.0;
    double total = 0.0;
    auto itA = a.begin();
    auto itB = b.begin();
    // Both maps are ordered; walk them together over the union of terms.
    while (itA != a.end() || itB != b.end()) {
        if (itB == b.end() || (itA != a.end() && itA->first < itB->first)) {
            total += itA->second;
            ++itA;
        } else if (itA == a.end() || itB->first < itA->first) {
            total += itB->second;
            ++itB;
        } else {
            overlap += std::min(itA->second, itB->second);
            total += std::max(itA->second, itB->second);
            ++itA;
            ++itB;
        }
    }
    return total > 0.0 ? overlap / total : 0.0;
}

double FingerprintEngine::similarity(const Fingerprint &a, const Fingerprint &b)
{
    if (a.textHash == b.textHash) {
        return 1.0;
    }

    const double combined = kEditHashWeight * editHashSimilarity(a.editHash, b.editHash)
        + kVectorWeight * vectorSimilarity(a.vector, b.vector)
        + kKeywordWeight * keywordSimilarity(a.keywords, b.keywords);
    return std::clamp(combined, 0.0, 1.0);
}

} // namespace clausedrift
