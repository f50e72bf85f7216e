#pragma once

#include <string>
#include <unordered_set>

#include "language_detector.hpp"

namespace summarizer {

using StopwordSet = std::unordered_set<std::string>;

/**
 * Built-in stopword sets. The returned references point to immutable
 * function-local statics and stay valid for the whole program.
 */
const StopwordSet& default_stopwords(Language language);

/**
 * Reads one word per line. Blank lines and lines starting with '#' are
 * skipped, words are trimmed and lowercased.
 * @throws std::runtime_error if the file cannot be opened
 */
StopwordSet load_stopwords(const std::string& path);

}
