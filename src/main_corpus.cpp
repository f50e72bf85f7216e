#include "config.hpp"
#include "corpus_summarizer.hpp"
#include "mongodb_client.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>

using namespace summarizer;

static void print_usage() {
    std::cout << "Usage:\n";
    std::cout << "  ./summarize_corpus <config.yaml>              - summarize the whole collection\n";
    std::cout << "  ./summarize_corpus <config.yaml> --limit 100  - summarize 100 documents\n";
    std::cout << "  ./summarize_corpus <config.yaml> --test       - test mode (10 documents)\n";
    std::cout << "  ./summarize_corpus <config.yaml> --quiet      - statistics only\n";
}

static void print_document(size_t n, const CorpusDocument& doc, const SummaryResult& result) {
    std::cout << "\n[" << n << "] " << doc.title << "\n";
    if (!doc.url.empty()) {
        std::cout << "    " << doc.url << "\n";
    }
    std::cout << "    language: " << result.language_code()
              << ", sentences: " << result.selected_indices.size()
              << "/" << result.sentences_count << "\n";
    std::cout << "    " << result.summary << "\n";
}

static void print_statistics(const CorpusStats& stats) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "SUMMARIZATION STATISTICS\n";
    std::cout << std::string(60, '=') << "\n";

    std::cout << "\nDocuments:\n";
    std::cout << "   Processed: " << stats.total_documents << "\n";
    std::cout << "   Summarized: " << stats.summarized_documents << "\n";
    std::cout << "   Skipped (no text): " << stats.skipped_documents << "\n";
    std::cout << "   Arabic: " << stats.documents_by_language[0]
              << ", English: " << stats.documents_by_language[1] << "\n";

    std::cout << "\nSentences:\n";
    std::cout << "   Total: " << stats.total_sentences << "\n";
    std::cout << "   Selected: " << stats.selected_sentences << "\n";
    std::cout << "   Compression: " << std::fixed << std::setprecision(2)
              << (stats.compression_ratio() * 100.0) << "% of input characters\n";

    std::cout << "\nPerformance:\n";
    std::cout << "   Time: " << std::fixed << std::setprecision(2)
              << stats.processing_time_sec << " sec\n";
    std::cout << "   Speed: " << std::fixed << std::setprecision(1)
              << stats.docs_per_second() << " docs/sec\n";

    std::cout << std::string(60, '=') << "\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string config_path = argv[1];
    size_t limit = 0;
    bool quiet = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--limit" && i + 1 < argc) {
            try {
                limit = std::stoul(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: --limit expects a number\n";
                return 1;
            }
        } else if (arg == "--test") {
            limit = 10;
        } else if (arg == "--quiet") {
            quiet = true;
        }
    }

    std::cout << std::string(60, '=') << "\n";
    std::cout << "CORPUS SUMMARIZATION\n";
    std::cout << std::string(60, '=') << "\n";

    try {
        AppConfig config = load_config(config_path);
        config.validate();

        MongoDBClient db_client(config.db);
        if (!db_client.connect()) {
            return 1;
        }

        size_t total_docs = db_client.count_documents();
        if (limit > 0) {
            total_docs = std::min(total_docs, limit);
        }

        std::cout << "\nSummarizing " << total_docs << " documents...\n";
        std::cout << std::string(60, '=') << "\n";

        Summarizer summarizer(make_summarizer_config(config));
        CorpusSummarizer corpus(summarizer, config.summary);

        auto start_time = std::chrono::high_resolution_clock::now();

        db_client.for_each_document([&](const Document& doc) {
            CorpusDocument processed;
            auto result = corpus.process(doc.url, doc.content, processed);

            const auto& stats = corpus.stats();
            if (!quiet && !processed.text.empty()) {
                print_document(stats.total_documents, processed, result);
            }

            if (stats.total_documents % 100 == 0) {
                auto now = std::chrono::high_resolution_clock::now();
                double elapsed = std::chrono::duration<double>(now - start_time).count();

                std::cout << "  [" << stats.total_documents << "/" << total_docs << "] "
                          << std::fixed << std::setprecision(1)
                          << (elapsed > 0 ? stats.total_documents / elapsed : 0.0)
                          << " docs/sec\n";
            }
        }, limit);

        auto end_time = std::chrono::high_resolution_clock::now();
        corpus.stats().processing_time_sec =
            std::chrono::duration<double>(end_time - start_time).count();

        print_statistics(corpus.stats());

        std::cout << "\nDone.\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
