#pragma once

#include <optional>
#include <string>

#include "summarizer.hpp"

namespace summarizer {

struct DbConfig {
    std::string host = "localhost";
    int port = 27017;
    std::string database;
    std::string collection;
    std::string text_field = "html_content";
    std::string username;
    std::string password;
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    size_t max_text_bytes = 1024 * 1024;
};

struct StopwordConfig {
    std::string ar_file;
    std::string en_file;
    // Inline lists win over files
    std::optional<StopwordSet> ar;
    std::optional<StopwordSet> en;
};

struct AppConfig {
    SummaryOptions summary;
    StopwordConfig stopwords;
    ServerConfig server;
    DbConfig db;

    // @throws std::invalid_argument on out-of-range values
    void validate() const;
};

/**
 * Loads a YAML config. Missing sections and keys keep their defaults.
 * Parse errors are printed to stderr and rethrown.
 */
AppConfig load_config(const std::string& config_path);
AppConfig parse_config(const std::string& yaml_text);

/**
 * Sets one summary option from its text form. Names are max_sentences,
 * ratio and min_sentence_len; values are checked like validate().
 * @throws std::invalid_argument for unknown names or bad values
 */
void set_summary_option(SummaryOptions& options, const std::string& name, const std::string& value);

// @throws std::invalid_argument unless value is an integer in 1..65535
int parse_port(const std::string& value);

// Reads stopword files where no inline list is given
Summarizer::Config make_summarizer_config(const AppConfig& config);

}
