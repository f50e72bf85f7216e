#pragma once

#include <string>

#include "summarizer.hpp"

namespace summarizer {

struct CorpusDocument {
    std::string url;
    std::string title;
    std::string text;
};

struct CorpusStats {
    size_t total_documents = 0;
    size_t skipped_documents = 0;
    size_t summarized_documents = 0;
    size_t total_sentences = 0;
    size_t selected_sentences = 0;
    size_t input_chars = 0;
    size_t summary_chars = 0;
    size_t documents_by_language[2] = {0, 0};  // ar, en
    double processing_time_sec = 0.0;

    double docs_per_second() const;
    // Summary length over input length, 0 when nothing was summarized
    double compression_ratio() const;
};

/**
 * Summarizes documents one at a time and keeps running statistics.
 * HTML content is reduced to its text before summarizing.
 */
class CorpusSummarizer {
public:
    CorpusSummarizer(const Summarizer& summarizer, const SummaryOptions& options);

    // Fills doc with the extracted title and text
    SummaryResult process(const std::string& url, const std::string& content, CorpusDocument& doc);

    const CorpusStats& stats() const { return stats_; }
    CorpusStats& stats() { return stats_; }

private:
    const Summarizer& summarizer_;
    SummaryOptions options_;
    CorpusStats stats_;
};

}
