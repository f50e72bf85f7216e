#include "sentence_segmenter.hpp"
#include "text_utils.hpp"

namespace summarizer {

bool is_sentence_terminator(char32_t cp) {
    switch (cp) {
        case U'.':
        case U'!':
        case U'?':
        case 0x061F:  // ؟
        case 0x2026:  // …
            return true;
        default:
            return false;
    }
}

static void flush_sentence(std::u32string& current, std::vector<std::string>& sentences) {
    std::string sentence = trim(encode_utf8(current));
    if (!sentence.empty()) {
        sentences.push_back(std::move(sentence));
    }
    current.clear();
}

std::vector<std::string> split_sentences(const std::string& text) {
    std::u32string decoded = decode_utf8(text);
    std::vector<std::string> sentences;
    std::u32string current;

    size_t i = 0;
    while (i < decoded.size()) {
        char32_t cp = decoded[i];

        bool after_terminator = i > 0 && is_sentence_terminator(decoded[i - 1]);

        if (after_terminator && is_whitespace(cp)) {
            while (i < decoded.size() && is_whitespace(decoded[i])) {
                ++i;
            }
            flush_sentence(current, sentences);
            continue;
        }

        if (cp == U'\n') {
            while (i < decoded.size() && decoded[i] == U'\n') {
                ++i;
            }
            flush_sentence(current, sentences);
            continue;
        }

        current += cp;
        ++i;
    }

    flush_sentence(current, sentences);
    return sentences;
}

}
