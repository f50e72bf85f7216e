#pragma once

#include <string>

namespace summarizer {

enum class Language {
    ARABIC,
    ENGLISH
};

// "ar" or "en"
std::string language_code(Language language);

bool is_arabic_codepoint(char32_t cp);

/**
 * Arabic if the text holds at least one code point of the Arabic block
 * (U+0600..U+06FF), English otherwise. Empty text is English.
 */
Language detect_language(const std::string& text);

}
