#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "engine/vectorization_session.hpp"

namespace clausedrift {

/**
 * Computes clause fingerprints and compares them.
 *
 * A fingerprint combines an exact-duplicate key (SHA-256 of the normalized
 * text), a 64-bit SimHash, an optional TF-IDF vector and locally normalized
 * keyword weights. Vectors only exist for batch fingerprints, since they
 * need a VectorizationSession fitted over the whole clause population.
 */
class FingerprintEngine
{
public:
    static constexpr int kEditHashBits = 64;
    static constexpr std::size_t kDefaultKeywordCount = 10;

    static constexpr double kEditHashWeight = 0.3;
    static constexpr double kVectorWeight = 0.5;
    static constexpr double kKeywordWeight = 0.2;

    explicit FingerprintEngine(std::size_t keywordCount = kDefaultKeywordCount,
                               std::size_t maxVocabulary = VectorizationSession::kDefaultMaxFeatures);

    // Single clause, no term vector.
    Fingerprint fingerprint(const std::string &text) const;

    // Fits a fresh session over texts and fingerprints each of them.
    std::vector<Fingerprint> fingerprintBatch(const std::vector<std::string> &texts) const;

    // Fingerprints texts against a session fitted elsewhere, e.g. over the
    // combined clauses of two versions being compared.
    std::vector<Fingerprint> fingerprintBatch(const std::vector<std::string> &texts,
                                              const VectorizationSession &session) const;

    VectorizationSession fitSession(const std::vector<std::string> &texts) const;

    // Weighted blend in [0, 1]; 1.0 for identical normalized text. Commutative.
    static double similarity(const Fingerprint &a, const Fingerprint &b);

    static std::string normalize(const std::string &text);
    static std::string contentHash(const std::string &normalized);
    static std::uint64_t editHash(const std::string &normalized);
    std::map<std::string, double> keywordWeights(const std::string &text) const;

    static int hammingDistance(std::uint64_t a, std::uint64_t b);
    static double editHashSimilarity(std::uint64_t a, std::uint64_t b);
    static double vectorSimilarity(const std::optional<TermVector> &a,
                                   const std::optional<TermVector> &b);
    static double keywordSimilarity(const std::map<std::string, double> &a,
                                    const std::map<std::string, double> &b);

private:
    Fingerprint baseFingerprint(const std::string &text, const std::string &normalized) const;

    std::size_t m_keywordCount;
    std::size_t m_maxVocabulary;
};

} // namespace clausedrift
