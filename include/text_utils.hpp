#pragma once

#include <string>

namespace summarizer {

/**
 * UTF-8 helpers shared by the normalizer, segmenter and tokenizer.
 * All character lengths in the summarizer are counted in code points.
 */

// Invalid sequences decode to U+FFFD, decoding never throws
std::u32string decode_utf8(const std::string& text);
std::string encode_utf8(const std::u32string& text);
void append_utf8(std::string& out, char32_t cp);

size_t utf8_length(const std::string& text);

bool is_whitespace(char32_t cp);

// ASCII and Latin-1 upper case letters, plus the Kelvin and Angstrom signs
char32_t to_lower(char32_t cp);
std::string to_lower(const std::string& text);

/**
 * Collapses every whitespace run (newlines included) into one space
 * and trims both ends. Whitespace-only input gives an empty string.
 */
std::string normalize_whitespace(const std::string& text);

std::string trim(const std::string& text);

}
