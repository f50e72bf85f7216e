#pragma once

#include <memory>
#include <string>
#include <vector>

#include "stopwords.hpp"

namespace summarizer {

class Tokenizer {
public:
    struct Config {
        size_t min_length = 3;  // code points
        bool lowercase = true;
        bool remove_stopwords = true;
    };

    explicit Tokenizer(std::shared_ptr<const StopwordSet> stop_words);
    Tokenizer(std::shared_ptr<const StopwordSet> stop_words, const Config& config);

    // Words that pass the length and stopword filters
    std::vector<std::string> tokenize(const std::string& text) const;

    bool is_stop_word(const std::string& word) const;

    static bool is_word_char(char32_t cp);

private:
    Config config_;
    std::shared_ptr<const StopwordSet> stop_words_;

    bool keep(const std::u32string& word) const;
};

}
