#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/models.hpp"

namespace clausedrift {

/**
 * TF-IDF model fitted over one clause population.
 *
 * Terms are unigrams and bigrams of normalized text after stopword removal;
 * the vocabulary keeps the maxFeatures most frequent terms. Vectors are
 * L2-normalized and tagged with the session id, so vectors produced by
 * different sessions are never compared with each other.
 *
 * A session fitted over a population without any usable term is degenerate:
 * transform() then returns no vector.
 */
class VectorizationSession
{
public:
    static constexpr std::size_t kDefaultMaxFeatures = 100;

    // documents are expected in normalized form (see FingerprintEngine::normalize).
    static VectorizationSession fit(const std::vector<std::string> &documents,
                                    std::size_t maxFeatures = kDefaultMaxFeatures);

    std::optional<TermVector> transform(const std::string &document) const;

    std::uint64_t id() const { return m_id; }
    bool isDegenerate() const { return m_vocabulary.empty(); }
    std::size_t vocabularySize() const { return m_vocabulary.size(); }
    const std::vector<std::string> &vocabulary() const { return m_vocabulary; }

    static std::vector<std::string> extractTerms(const std::string &document);

private:
    VectorizationSession() = default;

    std::uint64_t m_id = 0;
    std::vector<std::string> m_vocabulary;
    std::unordered_map<std::string, std::size_t> m_termIndex;
    std::vector<double> m_idf;
};

} // namespace clausedrift
