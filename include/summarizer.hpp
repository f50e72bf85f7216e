#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "language_detector.hpp"
#include "stopwords.hpp"
#include "term_frequency.hpp"
#include "tokenizer.hpp"

namespace summarizer {

// Documents with at most this many sentences are returned whole
constexpr size_t SHORT_DOCUMENT_SENTENCES = 2;
// Documents shorter than this (in code points) are returned whole
constexpr size_t SHORT_DOCUMENT_LENGTH = 200;

struct SummaryOptions {
    int max_sentences = 3;
    double ratio = 0.25;
    int min_sentence_len = 30;
};

struct SummaryResult {
    std::string summary;
    Language language = Language::ENGLISH;
    std::vector<size_t> selected_indices;  // ascending
    size_t sentences_count = 0;

    std::string language_code() const { return summarizer::language_code(language); }
};

/**
 * Frequency-based extractive summarizer for Arabic and English text.
 *
 * Picks the sentences whose filtered words are the most frequent in the
 * document and returns them in document order. Holds only immutable
 * stopword sets, so one instance may serve concurrent callers.
 */
class Summarizer {
public:
    struct Config {
        // An unset set falls back to the built-in list of that language
        std::optional<StopwordSet> stopwords_ar;
        std::optional<StopwordSet> stopwords_en;
    };

    Summarizer();
    explicit Summarizer(const Config& config);

    SummaryResult summarize(const std::string& text,
                            const SummaryOptions& options = SummaryOptions{}) const;

    // nullptr is handled as missing input and yields an empty result
    SummaryResult summarize(const char* text,
                            const SummaryOptions& options = SummaryOptions{}) const;

    // Frequency table of the normalized text, as used for ranking
    TermFrequencyTable term_frequencies(const std::string& text) const;

    const StopwordSet& stopwords(Language language) const;

    /**
     * Number of sentences to select out of sentence_count:
     * max(1, min(max_sentences, ceil(sentence_count * ratio))),
     * never more than sentence_count when sentence_count > 0.
     */
    static size_t target_sentence_count(size_t sentence_count, const SummaryOptions& options);

private:
    std::shared_ptr<const StopwordSet> stopwords_ar_;
    std::shared_ptr<const StopwordSet> stopwords_en_;
    Tokenizer arabic_tokenizer_;
    Tokenizer english_tokenizer_;

    const Tokenizer& tokenizer_for(Language language) const;

    std::vector<std::vector<std::string>> tokenize_sentences(
        const std::vector<std::string>& sentences, Language language) const;

    std::vector<size_t> rank_sentences(
        const std::vector<std::string>& sentences,
        const std::vector<std::vector<std::string>>& sentence_tokens,
        const SummaryOptions& options) const;
};

}
