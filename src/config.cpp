#include "config.hpp"
#include "text_utils.hpp"

#include <yaml-cpp/yaml.h>
#include <iostream>
#include <stdexcept>

namespace summarizer {

static StopwordSet read_word_list(const YAML::Node& node) {
    StopwordSet words;
    for (const auto& item : node) {
        std::string word = trim(item.as<std::string>());
        if (!word.empty()) {
            words.insert(to_lower(word));
        }
    }
    return words;
}

static AppConfig from_yaml(const YAML::Node& yaml) {
    AppConfig config;

    if (yaml["summarizer"]) {
        auto node = yaml["summarizer"];
        config.summary.max_sentences = node["max_sentences"].as<int>(config.summary.max_sentences);
        config.summary.ratio = node["ratio"].as<double>(config.summary.ratio);
        config.summary.min_sentence_len = node["min_sentence_len"].as<int>(config.summary.min_sentence_len);
    }

    if (yaml["stopwords"]) {
        auto node = yaml["stopwords"];
        config.stopwords.ar_file = node["ar_file"].as<std::string>("");
        config.stopwords.en_file = node["en_file"].as<std::string>("");
        if (node["ar"]) config.stopwords.ar = read_word_list(node["ar"]);
        if (node["en"]) config.stopwords.en = read_word_list(node["en"]);
    }

    if (yaml["server"]) {
        auto node = yaml["server"];
        config.server.host = node["host"].as<std::string>(config.server.host);
        config.server.port = node["port"].as<int>(config.server.port);
        config.server.max_text_bytes = node["max_text_bytes"].as<size_t>(config.server.max_text_bytes);
    }

    if (yaml["db"]) {
        auto db = yaml["db"];
        config.db.host = db["host"].as<std::string>("localhost");
        config.db.port = db["port"].as<int>(27017);
        config.db.database = db["database"].as<std::string>("");
        config.db.collection = db["collection"].as<std::string>("");
        config.db.text_field = db["text_field"].as<std::string>("html_content");
        config.db.username = db["username"].as<std::string>("");
        config.db.password = db["password"].as<std::string>("");
    }

    return config;
}

AppConfig load_config(const std::string& config_path) {
    try {
        return from_yaml(YAML::LoadFile(config_path));
    } catch (const std::exception& e) {
        std::cerr << "Error loading config " << config_path << ": " << e.what() << std::endl;
        throw;
    }
}

AppConfig parse_config(const std::string& yaml_text) {
    return from_yaml(YAML::Load(yaml_text));
}

void AppConfig::validate() const {
    if (summary.max_sentences < 1) {
        throw std::invalid_argument("summarizer.max_sentences must be at least 1");
    }
    if (!(summary.ratio > 0.0 && summary.ratio <= 1.0)) {
        throw std::invalid_argument("summarizer.ratio must be in (0, 1]");
    }
    if (summary.min_sentence_len < 0) {
        throw std::invalid_argument("summarizer.min_sentence_len must not be negative");
    }
    if (server.port < 1 || server.port > 65535) {
        throw std::invalid_argument("server.port must be in 1..65535");
    }
}

static int parse_int(const std::string& name, const std::string& value) {
    size_t pos = 0;
    int result = 0;
    try {
        result = std::stoi(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(name + ": not an integer: '" + value + "'");
    }
    if (pos != value.size()) {
        throw std::invalid_argument(name + ": not an integer: '" + value + "'");
    }
    return result;
}

static double parse_double(const std::string& name, const std::string& value) {
    size_t pos = 0;
    double result = 0.0;
    try {
        result = std::stod(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(name + ": not a number: '" + value + "'");
    }
    if (pos != value.size()) {
        throw std::invalid_argument(name + ": not a number: '" + value + "'");
    }
    return result;
}

int parse_port(const std::string& value) {
    int port = parse_int("port", value);
    if (port < 1 || port > 65535) {
        throw std::invalid_argument("port must be in 1..65535");
    }
    return port;
}

void set_summary_option(SummaryOptions& options, const std::string& name, const std::string& value) {
    if (name == "max_sentences") {
        int n = parse_int(name, value);
        if (n < 1) throw std::invalid_argument("max_sentences must be at least 1");
        options.max_sentences = n;
    } else if (name == "ratio") {
        double r = parse_double(name, value);
        if (!(r > 0.0 && r <= 1.0)) throw std::invalid_argument("ratio must be in (0, 1]");
        options.ratio = r;
    } else if (name == "min_sentence_len") {
        int n = parse_int(name, value);
        if (n < 0) throw std::invalid_argument("min_sentence_len must not be negative");
        options.min_sentence_len = n;
    } else {
        throw std::invalid_argument("unknown option: " + name);
    }
}

Summarizer::Config make_summarizer_config(const AppConfig& config) {
    Summarizer::Config result;

    if (config.stopwords.ar) {
        result.stopwords_ar = config.stopwords.ar;
    } else if (!config.stopwords.ar_file.empty()) {
        result.stopwords_ar = load_stopwords(config.stopwords.ar_file);
    }

    if (config.stopwords.en) {
        result.stopwords_en = config.stopwords.en;
    } else if (!config.stopwords.en_file.empty()) {
        result.stopwords_en = load_stopwords(config.stopwords.en_file);
    }

    return result;
}

}
