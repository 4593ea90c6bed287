#pragma once

#include <string>

#include "common/models.hpp"

namespace clausedrift {

// Word-level set difference between two versions of a clause.
WordDiff wordDiff(const std::string &oldText, const std::string &newText);

// minor >= 0.8 > moderate >= 0.5 > major
ChangeMagnitude changeMagnitude(double similarity);

} // namespace clausedrift
