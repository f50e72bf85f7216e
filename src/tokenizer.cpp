#include "tokenizer.hpp"
#include "language_detector.hpp"
#include "text_utils.hpp"

namespace summarizer {

Tokenizer::Tokenizer(std::shared_ptr<const StopwordSet> stop_words)
    : Tokenizer(std::move(stop_words), Config{}) {
}

Tokenizer::Tokenizer(std::shared_ptr<const StopwordSet> stop_words, const Config& config)
    : config_(config), stop_words_(std::move(stop_words)) {
}

bool Tokenizer::is_word_char(char32_t cp) {
    if (cp >= '0' && cp <= '9') return true;
    if ((cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z')) return true;

    // Latin-1 letters without × and ÷
    if (cp >= 0xC0 && cp <= 0xFF && cp != 0xD7 && cp != 0xF7) return true;

    return is_arabic_codepoint(cp);
}

bool Tokenizer::is_stop_word(const std::string& word) const {
    return stop_words_ && stop_words_->find(word) != stop_words_->end();
}

bool Tokenizer::keep(const std::u32string& word) const {
    if (word.size() < config_.min_length) {
        return false;
    }
    if (config_.remove_stopwords && is_stop_word(encode_utf8(word))) {
        return false;
    }
    return true;
}

std::vector<std::string> Tokenizer::tokenize(const std::string& text) const {
    std::vector<std::string> tokens;
    std::u32string current;

    auto flush = [&]() {
        if (!current.empty()) {
            if (keep(current)) {
                tokens.push_back(encode_utf8(current));
            }
            current.clear();
        }
    };

    for (char32_t cp : decode_utf8(text)) {
        if (config_.lowercase) {
            cp = to_lower(cp);
        }

        if (is_word_char(cp)) {
            current += cp;
        } else {
            flush();
        }
    }
    flush();

    return tokens;
}

}
