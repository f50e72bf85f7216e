#include "config.hpp"
#include "result_format.hpp"
#include "summarizer.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace summarizer;

static void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] [FILE]\n\n"
              << "Reads FILE (or stdin) and prints an extractive summary.\n\n"
              << "Options:\n"
              << "  --config PATH        YAML config with defaults and stopwords\n"
              << "  --max-sentences N    Sentences to keep at most (default: 3)\n"
              << "  --ratio R            Share of sentences to keep, (0, 1] (default: 0.25)\n"
              << "  --min-len N          Shortest sentence that can be ranked (default: 30)\n"
              << "  --json               Print the result as JSON\n"
              << "  --terms N            Also print the N most frequent terms\n"
              << "  --help               Show this help\n";
}

static std::string read_input(const std::string& path) {
    if (path.empty() || path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

static void print_terms(const TermFrequencyTable& table, size_t n) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "Top terms (" << table.size() << " distinct, "
              << table.total_tokens() << " total)\n";
    std::cout << std::string(60, '=') << "\n";

    auto terms = table.top_terms(n);
    for (size_t i = 0; i < terms.size(); ++i) {
        std::cout << "  " << std::setw(2) << (i + 1) << ". " << terms[i].first
                  << ": " << terms[i].second
                  << " (" << std::fixed << std::setprecision(3)
                  << table.weight(terms[i].first) << ")\n";
    }
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string input_path;
    bool json = false;
    size_t top_terms = 0;

    // name -> value, applied on top of the config file
    std::vector<std::pair<std::string, std::string>> overrides;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--max-sentences" && i + 1 < argc) {
            overrides.emplace_back("max_sentences", argv[++i]);
        } else if (arg == "--ratio" && i + 1 < argc) {
            overrides.emplace_back("ratio", argv[++i]);
        } else if (arg == "--min-len" && i + 1 < argc) {
            overrides.emplace_back("min_sentence_len", argv[++i]);
        } else if (arg == "--terms" && i + 1 < argc) {
            try {
                top_terms = std::stoul(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: --terms expects a number\n";
                return 1;
            }
        } else if (arg == "--json") {
            json = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            std::cerr << "Error: unknown option " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            input_path = arg;
        }
    }

    try {
        AppConfig config = config_path.empty() ? AppConfig{} : load_config(config_path);
        for (const auto& [name, value] : overrides) {
            set_summary_option(config.summary, name, value);
        }
        config.validate();

        Summarizer summarizer(make_summarizer_config(config));

        std::string text = read_input(input_path);
        auto result = summarizer.summarize(text, config.summary);

        if (json) {
            std::cout << to_json(result) << "\n";
        } else {
            std::cout << result.summary << "\n";
            std::cerr << "[" << result.language_code() << "] selected "
                      << result.selected_indices.size() << " of "
                      << result.sentences_count << " sentences\n";
        }

        if (top_terms > 0) {
            print_terms(summarizer.term_frequencies(text), top_terms);
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
