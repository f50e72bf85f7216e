#include "summarizer.hpp"
#include "sentence_segmenter.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace summarizer {

static std::shared_ptr<const StopwordSet> make_stopwords(
    const std::optional<StopwordSet>& custom, Language language) {
    if (custom) {
        return std::make_shared<StopwordSet>(*custom);
    }
    return std::make_shared<StopwordSet>(default_stopwords(language));
}

Summarizer::Summarizer() : Summarizer(Config{}) {
}

Summarizer::Summarizer(const Config& config)
    : stopwords_ar_(make_stopwords(config.stopwords_ar, Language::ARABIC)),
      stopwords_en_(make_stopwords(config.stopwords_en, Language::ENGLISH)),
      arabic_tokenizer_(stopwords_ar_),
      english_tokenizer_(stopwords_en_) {
}

const StopwordSet& Summarizer::stopwords(Language language) const {
    return language == Language::ARABIC ? *stopwords_ar_ : *stopwords_en_;
}

const Tokenizer& Summarizer::tokenizer_for(Language language) const {
    return language == Language::ARABIC ? arabic_tokenizer_ : english_tokenizer_;
}

size_t Summarizer::target_sentence_count(size_t sentence_count, const SummaryOptions& options) {
    size_t max_sentences = options.max_sentences < 1
        ? 1 : static_cast<size_t>(options.max_sentences);

    size_t by_ratio = 0;
    if (options.ratio > 0.0) {
        // 1e-9 keeps 30 * 0.1 at 3 instead of 4
        double scaled = static_cast<double>(sentence_count) * options.ratio;
        if (scaled >= static_cast<double>(sentence_count)) {
            by_ratio = sentence_count;
        } else {
            by_ratio = static_cast<size_t>(std::ceil(scaled - 1e-9));
        }
    }

    size_t k = std::max<size_t>(1, std::min(max_sentences, by_ratio));
    if (sentence_count > 0) {
        k = std::min(k, sentence_count);
    }
    return k;
}

std::vector<std::vector<std::string>> Summarizer::tokenize_sentences(
    const std::vector<std::string>& sentences, Language language) const {

    const Tokenizer& tokenizer = tokenizer_for(language);

    std::vector<std::vector<std::string>> sentence_tokens;
    sentence_tokens.reserve(sentences.size());
    for (const auto& sentence : sentences) {
        sentence_tokens.push_back(tokenizer.tokenize(sentence));
    }
    return sentence_tokens;
}

std::vector<size_t> Summarizer::rank_sentences(
    const std::vector<std::string>& sentences,
    const std::vector<std::vector<std::string>>& sentence_tokens,
    const SummaryOptions& options) const {

    size_t k = target_sentence_count(sentences.size(), options);

    std::vector<size_t> first_k(k);
    std::iota(first_k.begin(), first_k.end(), size_t(0));

    auto table = TermFrequencyTable::build(sentence_tokens);
    if (table.empty()) {
        return first_k;
    }

    size_t min_len = options.min_sentence_len < 0
        ? 0 : static_cast<size_t>(options.min_sentence_len);

    std::vector<std::pair<size_t, double>> scores;
    for (size_t idx = 0; idx < sentences.size(); ++idx) {
        if (utf8_length(sentences[idx]) < min_len) continue;

        auto score = table.sentence_score(sentence_tokens[idx]);
        if (!score) continue;

        scores.emplace_back(idx, *score);
    }

    if (scores.empty()) {
        return first_k;
    }

    // Equal scores keep the earlier sentence first
    std::stable_sort(scores.begin(), scores.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    std::vector<size_t> selected;
    for (size_t i = 0; i < std::min(k, scores.size()); ++i) {
        selected.push_back(scores[i].first);
    }
    std::sort(selected.begin(), selected.end());

    return selected;
}

SummaryResult Summarizer::summarize(const char* text, const SummaryOptions& options) const {
    return summarize(text ? std::string(text) : std::string(), options);
}

SummaryResult Summarizer::summarize(const std::string& text, const SummaryOptions& options) const {
    SummaryResult result;

    std::string cleaned = normalize_whitespace(text);
    if (cleaned.empty()) {
        result.language = detect_language(text);
        return result;
    }

    result.language = detect_language(cleaned);

    auto sentences = split_sentences(cleaned);
    if (sentences.empty()) {
        return result;
    }

    result.sentences_count = sentences.size();

    if (sentences.size() <= SHORT_DOCUMENT_SENTENCES || utf8_length(cleaned) < SHORT_DOCUMENT_LENGTH) {
        result.summary = cleaned;
        result.selected_indices.resize(sentences.size());
        std::iota(result.selected_indices.begin(), result.selected_indices.end(), size_t(0));
        return result;
    }

    auto sentence_tokens = tokenize_sentences(sentences, result.language);
    result.selected_indices = rank_sentences(sentences, sentence_tokens, options);

    std::string summary;
    for (size_t idx : result.selected_indices) {
        if (!summary.empty()) summary += ' ';
        summary += sentences[idx];
    }
    result.summary = trim(summary);

    return result;
}

TermFrequencyTable Summarizer::term_frequencies(const std::string& text) const {
    std::string cleaned = normalize_whitespace(text);
    auto sentences = split_sentences(cleaned);
    return TermFrequencyTable::build(tokenize_sentences(sentences, detect_language(cleaned)));
}

}
