#pragma once

#include <string>
#include <vector>

namespace summarizer {

// . ! ? and the Arabic question mark and ellipsis
bool is_sentence_terminator(char32_t cp);

/**
 * Splits text into sentences in order of appearance.
 * A boundary is a whitespace run right after a terminator, or a run of
 * newlines anywhere. Fragments are trimmed and empty ones dropped.
 */
std::vector<std::string> split_sentences(const std::string& text);

}
