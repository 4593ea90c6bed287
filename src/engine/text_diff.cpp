#include "engine/text_diff.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <sstream>
#include <vector>

namespace clausedrift {

namespace {

std::vector<std::string> splitWords(const std::string &text)
{
    std::vector<std::string> words;
    std::istringstream stream(text);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

} // namespace

WordDiff wordDiff(const std::string &oldText, const std::string &newText)
{
    const auto oldWords = splitWords(oldText);
    const auto newWords = splitWords(newText);
    const std::set<std::string> oldSet(oldWords.begin(), oldWords.end());
    const std::set<std::string> newSet(newWords.begin(), newWords.end());

    WordDiff diff;
    std::set_difference(newSet.begin(), newSet.end(), oldSet.begin(), oldSet.end(),
                        std::back_inserter(diff.addedWords));
    std::set_difference(oldSet.begin(), oldSet.end(), newSet.begin(), newSet.end(),
                        std::back_inserter(diff.removedWords));
    diff.wordCountChange =
        static_cast<int>(newWords.size()) - static_cast<int>(oldWords.size());
    return diff;
}

ChangeMagnitude changeMagnitude(double similarity)
{
    if (similarity >= 0.8) {
        return ChangeMagnitude::Minor;
    }
    if (similarity >= 0.5) {
        return ChangeMagnitude::Moderate;
    }
    return ChangeMagnitude::Major;
}

} // namespace clausedrift
