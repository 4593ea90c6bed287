#include "engine/vectorization_session.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <sstream>
#include <unordered_set>

namespace clausedrift {

namespace {

std::atomic<std::uint64_t> g_nextSessionId{1};

const std::unordered_set<std::string> &stopwords()
{
    static const std::unordered_set<std::string> words = {
        "a", "about", "above", "after", "again", "against", "all", "also", "am",
        "an", "and", "any", "are", "as", "at", "be", "because", "been", "before",
        "being", "below", "between", "both", "but", "by", "can", "could", "did",
        "do", "does", "doing", "down", "during", "each", "etc", "few", "for",
        "from", "further", "had", "has", "have", "having", "he", "her", "here",
        "hers", "herself", "him", "himself", "his", "how", "i", "if", "in",
        "into", "is", "it", "its", "itself", "just", "may", "me", "might",
        "more", "most", "must", "my", "myself", "no", "nor", "not", "now", "of",
        "off", "on", "once", "only", "or", "other", "our", "ours", "ourselves",
        "out", "over", "own", "per", "same", "shall", "she", "should", "so",
        "some", "such", "than", "that", "the", "their", "theirs", "them",
        "themselves", "then", "there", "these", "they", "this", "those",
        "through", "to", "too", "under", "until", "up", "upon", "very", "via",
        "was", "we", "were", "what", "when", "where", "which", "while", "who",
        "whom", "why", "will", "with", "within", "without", "would", "you",
        "your", "yours", "yourself", "yourselves",
    };
    return words;
}

} // namespace

std::vector<std::string> VectorizationSession::extractTerms(const std::string &document)
{
    std::vector<std::string> tokens;
    std::istringstream stream(document);
    std::string token;
    while (stream >> token) {
        if (token.size() < 2 || stopwords().count(token) > 0) {
            continue;
        }
        tokens.push_back(token);
    }

    std::vector<std::string> terms = tokens;
    for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
        terms.push_back(tokens[i] + " " + tokens[i + 1]);
    }
    return terms;
}

VectorizationSession VectorizationSession::fit(const std::vector<std::string> &documents,
                                               std::size_t maxFeatures)
{
    VectorizationSession session;
    session.m_id = g_nextSessionId.fetch_add(1);

    std::unordered_map<std::string, std::size_t> termFrequency;
    std::unordered_map<std::string, std::size_t> documentFrequency;
    for (const auto &document : documents) {
        const auto terms = extractTerms(document);
        std::unordered_set<std::string> seen;
        for (const auto &term : terms) {
            ++termFrequency[term];
            if (seen.insert(term).second) {
                ++documentFrequency[term];
            }
        }
    }

    std::vector<std::string> candidates;
    candidates.reserve(termFrequency.size());
    for (const auto &entry : termFrequency) {
        candidates.push_back(entry.first);
    }
    std::sort(candidates.begin(), candidates.end(),
              [&termFrequency](const std::string &a, const std::string &b) {
                  const auto fa = termFrequency.at(a);
                  const auto fb = termFrequency.at(b);
                  if (fa != fb) {
                      return fa > fb;
                  }
                  return a < b;
              });
    if (candidates.size() > maxFeatures) {
        candidates.resize(maxFeatures);
    }
    std::sort(candidates.begin(), candidates.end());

    // Smoothed idf: ln((1 + n) / (1 + df)) + 1.
    const double n = static_cast<double>(documents.size());
    session.m_vocabulary = std::move(candidates);
    session.m_idf.reserve(session.m_vocabulary.size());
    for (std::size_t i = 0; i < session.m_vocabulary.size(); ++i) {
        const auto &term = session.m_vocabulary[i];
        session.m_termIndex.emplace(term, i);
        const double df = static_cast<double>(documentFrequency.at(term));
        session.m_idf.push_back(std::log((1.0 + n) / (1.0 + df)) + 1.0);
    }

    return session;
}

std::optional<TermVector> VectorizationSession::transform(const std::string &document) const
{
    if (isDegenerate()) {
        return std::nullopt;
    }

    TermVector vector;
    vector.sessionId = m_id;
    vector.weights.assign(m_vocabulary.size(), 0.0);

    for (const auto &term : extractTerms(document)) {
        const auto it = m_termIndex.find(term);
        if (it != m_termIndex.end()) {
            vector.weights[it->second] += 1.0;
        }
    }

    double norm = 0.0;
    for (std::size_t i = 0; i < vector.weights.size(); ++i) {
        vector.weights[i] *= m_idf[i];
        norm += vector.weights[i] * vector.weights[i];
    }
    norm = std::sqrt(norm);
    if (norm > 0.0) {
        for (auto &weight : vector.weights) {
            weight /= norm;
        }
    }
    return vector;
}

} // namespace clausedrift
