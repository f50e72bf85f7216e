#include "term_frequency.hpp"
#include <algorithm>

namespace summarizer {

TermFrequencyTable TermFrequencyTable::build(
    const std::vector<std::vector<std::string>>& sentence_tokens) {

    TermFrequencyTable table;

    for (const auto& tokens : sentence_tokens) {
        for (const auto& token : tokens) {
            size_t c = ++table.counts_[token];
            table.max_count_ = std::max(table.max_count_, c);
            ++table.total_tokens_;
        }
    }

    if (table.max_count_ == 0) {
        return table;
    }

    table.weights_.reserve(table.counts_.size());
    for (const auto& [term, c] : table.counts_) {
        table.weights_[term] = static_cast<double>(c) / static_cast<double>(table.max_count_);
    }

    return table;
}

size_t TermFrequencyTable::count(const std::string& term) const {
    auto it = counts_.find(term);
    return it == counts_.end() ? 0 : it->second;
}

double TermFrequencyTable::weight(const std::string& term) const {
    auto it = weights_.find(term);
    return it == weights_.end() ? 0.0 : it->second;
}

std::optional<double> TermFrequencyTable::sentence_score(
    const std::vector<std::string>& tokens) const {

    if (tokens.empty()) {
        return std::nullopt;
    }

    double sum = 0.0;
    for (const auto& token : tokens) {
        sum += weight(token);
    }
    return sum / static_cast<double>(tokens.size());
}

std::vector<std::pair<std::string, size_t>> TermFrequencyTable::top_terms(size_t n) const {
    std::vector<std::pair<std::string, size_t>> sorted_terms(counts_.begin(), counts_.end());
    std::sort(sorted_terms.begin(), sorted_terms.end(),
              [](const auto& a, const auto& b) {
                  if (a.second != b.second) return a.second > b.second;
                  return a.first < b.first;
              });

    if (sorted_terms.size() > n) {
        sorted_terms.resize(n);
    }
    return sorted_terms;
}

}
