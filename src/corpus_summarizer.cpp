#include "corpus_summarizer.hpp"
#include "html_text.hpp"
#include "text_utils.hpp"

namespace summarizer {

double CorpusStats::docs_per_second() const {
    if (processing_time_sec <= 0) return 0;
    return total_documents / processing_time_sec;
}

double CorpusStats::compression_ratio() const {
    if (input_chars == 0) return 0;
    return static_cast<double>(summary_chars) / static_cast<double>(input_chars);
}

CorpusSummarizer::CorpusSummarizer(const Summarizer& summarizer, const SummaryOptions& options)
    : summarizer_(summarizer), options_(options) {
}

SummaryResult CorpusSummarizer::process(const std::string& url,
                                        const std::string& content,
                                        CorpusDocument& doc) {
    ++stats_.total_documents;

    doc.url = url;
    if (looks_like_html(content)) {
        doc.title = extract_title(content);
        doc.text = extract_text(content);
    } else {
        doc.title = url.empty() ? "Untitled" : url;
        doc.text = normalize_whitespace(content);
    }

    if (doc.text.empty()) {
        ++stats_.skipped_documents;
        return SummaryResult{};
    }

    auto result = summarizer_.summarize(doc.text, options_);

    ++stats_.summarized_documents;
    stats_.total_sentences += result.sentences_count;
    stats_.selected_sentences += result.selected_indices.size();
    stats_.input_chars += utf8_length(doc.text);
    stats_.summary_chars += utf8_length(result.summary);
    ++stats_.documents_by_language[result.language == Language::ARABIC ? 0 : 1];

    return result;
}

}
