#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace clausedrift {

/**
 * Splits contract text into numbered clause candidates.
 *
 * - With section hints: one clause per hint, in hint order.
 * - Without: split on blank lines and on lines that start a numbered
 *   section ("3. ..."), dropping fragments of ten words or fewer.
 *
 * Every clause gets a keyword-based category. The segmenter holds no state;
 * the same input always yields the same clauses.
 */
class ClauseSegmenter
{
public:
    static std::vector<Clause> segment(const std::string &text,
                                       const std::vector<SectionHint> &sections = {});

    // Folds clauses shorter than minWords into their successor and renumbers 1..n.
    // A short trailing clause is folded into its predecessor instead.
    static std::vector<Clause> mergeShortClauses(const std::vector<Clause> &clauses,
                                                 int minWords);

    static std::optional<ClauseCategory> classifyCategory(
        const std::string &text, const std::optional<std::string> &heading);

    static int countWords(const std::string &text);
};

} // namespace clausedrift
