#include "language_detector.hpp"
#include "text_utils.hpp"

namespace summarizer {

std::string language_code(Language language) {
    switch (language) {
        case Language::ARABIC: return "ar";
        case Language::ENGLISH: return "en";
    }
    return "en";
}

bool is_arabic_codepoint(char32_t cp) {
    return cp >= 0x0600 && cp <= 0x06FF;
}

Language detect_language(const std::string& text) {
    for (char32_t cp : decode_utf8(text)) {
        if (is_arabic_codepoint(cp)) {
            return Language::ARABIC;
        }
    }
    return Language::ENGLISH;
}

}
