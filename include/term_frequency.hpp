#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace summarizer {

/**
 * Term counts over all sentences of one document, with weights
 * normalized by the most frequent term (weight of the top term is 1.0).
 * Built in one pass and read-only afterwards.
 */
class TermFrequencyTable {
public:
    static TermFrequencyTable build(const std::vector<std::vector<std::string>>& sentence_tokens);

    bool empty() const { return counts_.empty(); }
    size_t size() const { return counts_.size(); }
    size_t max_count() const { return max_count_; }
    size_t total_tokens() const { return total_tokens_; }

    size_t count(const std::string& term) const;
    double weight(const std::string& term) const;

    // Mean weight of the tokens, nullopt for an empty list
    std::optional<double> sentence_score(const std::vector<std::string>& tokens) const;

    // By count descending, equal counts by term
    std::vector<std::pair<std::string, size_t>> top_terms(size_t n) const;

private:
    std::unordered_map<std::string, size_t> counts_;
    std::unordered_map<std::string, double> weights_;
    size_t max_count_ = 0;
    size_t total_tokens_ = 0;
};

}
