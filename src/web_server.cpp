#include "web_server.hpp"
#include "result_format.hpp"

#include "httplib.h"

#include <iostream>
#include <sstream>
#include <stdexcept>

namespace summarizer {

static const char* const OPTION_NAMES[] = {"max_sentences", "ratio", "min_sentence_len"};
static const char* const FORM_FIELDS[] = {"text", "max_sentences", "ratio", "min_sentence_len"};

static const char* const PAGE_STYLE = R"(<style>
*{box-sizing:border-box;margin:0;padding:0}
body{font-family:sans-serif;background:#f5f5f5;line-height:1.6}
.container{max-width:900px;margin:0 auto;padding:20px}
h1{font-size:2rem;margin-bottom:20px}
h1 a{color:inherit;text-decoration:none}
textarea{width:100%;min-height:260px;padding:15px;font-size:16px;border:2px solid #ddd;border-radius:8px;outline:none}
textarea:focus{border-color:#4a90d9}
.options{display:flex;gap:20px;margin:15px 0}
.options input{width:80px;padding:5px}
button{padding:12px 30px;font-size:18px;background:#4a90d9;color:white;border:none;border-radius:25px;cursor:pointer}
button:hover{background:#357abd}
.summary{background:white;padding:20px;margin-bottom:15px;border-radius:8px;box-shadow:0 1px 5px rgba(0,0,0,0.1)}
.stats{color:#666;margin-bottom:20px}
.error{background:#fdecea;color:#a12622;padding:20px;border-radius:8px}
</style>)";

static bool is_form(const std::string& content_type) {
    return content_type.find("application/x-www-form-urlencoded") != std::string::npos
        || content_type.find("multipart/form-data") != std::string::npos;
}

static std::string find_param(const RequestParams& params, const std::string& name) {
    auto it = params.find(name);
    return it == params.end() ? std::string() : it->second;
}

// Multipart fields arrive as files in httplib, not in req.params
static RequestParams request_params(const httplib::Request& req) {
    RequestParams fields;
    if (req.is_multipart_form_data()) {
        for (const char* name : FORM_FIELDS) {
            if (req.has_file(name)) {
                fields.emplace(name, req.get_file_value(name).content);
            }
        }
    }
    return WebServer::merge_form_fields(req.params, fields);
}

WebServer::WebServer(const AppConfig& config) : config_(config) {
    summarizer_ = std::make_unique<Summarizer>(make_summarizer_config(config_));
}

WebServer::~WebServer() = default;

RequestParams WebServer::merge_form_fields(const RequestParams& params,
                                           const RequestParams& multipart_fields) {
    RequestParams merged = params;
    for (const char* name : FORM_FIELDS) {
        if (merged.count(name) > 0) continue;

        auto it = multipart_fields.find(name);
        if (it != multipart_fields.end()) {
            merged.emplace(name, it->second);
        }
    }
    return merged;
}

SummaryOptions WebServer::read_options(const RequestParams& params) const {
    SummaryOptions options = config_.summary;
    for (const char* name : OPTION_NAMES) {
        auto it = params.find(name);
        if (it != params.end() && !it->second.empty()) {
            set_summary_option(options, name, it->second);
        }
    }
    return options;
}

ApiResponse WebServer::handle_api_summarize(const RequestParams& params,
                                            const std::string& body,
                                            const std::string& content_type) const {
    ApiResponse response;

    std::string text;
    if (params.count("text") > 0) {
        text = find_param(params, "text");
    } else if (!is_form(content_type)) {
        text = body;
    }

    if (text.size() > config_.server.max_text_bytes) {
        response.status = 413;
        response.body = error_json("text exceeds " + std::to_string(config_.server.max_text_bytes) + " bytes");
        return response;
    }

    SummaryOptions options;
    try {
        options = read_options(params);
    } catch (const std::invalid_argument& e) {
        response.status = 400;
        response.body = error_json(e.what());
        return response;
    }

    response.body = to_json(summarizer_->summarize(text, options));
    return response;
}

std::string WebServer::render_index_page() const {
    std::ostringstream html;
    html << R"(<!DOCTYPE html>
<html>
<head>
<meta charset="UTF-8">
<meta name="viewport" content="width=device-width, initial-scale=1.0">
<title>Summarizer</title>
)" << PAGE_STYLE << R"(
</head>
<body>
<div class="container">
<h1>Summarizer</h1>
<form action="/summarize" method="post">
<textarea name="text" dir="auto" placeholder="Paste Arabic or English text..." autofocus></textarea>
<div class="options">
<label>Sentences <input type="number" name="max_sentences" min="1" value=")" << config_.summary.max_sentences << R"("></label>
<label>Ratio <input type="number" name="ratio" step="0.05" min="0.05" max="1" value=")" << config_.summary.ratio << R"("></label>
<label>Min length <input type="number" name="min_sentence_len" min="0" value=")" << config_.summary.min_sentence_len << R"("></label>
</div>
<button type="submit">Summarize</button>
</form>
</div>
</body>
</html>)";
    return html.str();
}

std::string WebServer::render_result_page(const std::string& text,
                                          const SummaryResult& result) const {
    std::ostringstream html;
    html << R"(<!DOCTYPE html>
<html>
<head>
<meta charset="UTF-8">
<meta name="viewport" content="width=device-width, initial-scale=1.0">
<title>Summary</title>
)" << PAGE_STYLE << R"(
</head>
<body>
<div class="container">
<h1><a href="/">Summarizer</a></h1>
<div class="stats">
Language: <strong>)" << result.language_code() << R"(</strong>,
selected <strong>)" << result.selected_indices.size() << R"(</strong>
of <strong>)" << result.sentences_count << R"(</strong> sentences
</div>
<div class="summary" dir="auto">)" << html_escape(result.summary) << R"(</div>
<details><summary>Original text</summary>
<div class="summary" dir="auto">)" << html_escape(text) << R"(</div>
</details>
</div>
</body>
</html>)";
    return html.str();
}

std::string WebServer::render_error_page(const std::string& message) const {
    std::ostringstream html;
    html << R"(<!DOCTYPE html>
<html>
<head>
<meta charset="UTF-8">
<title>Error</title>
)" << PAGE_STYLE << R"(
</head>
<body>
<div class="container">
<h1><a href="/">Summarizer</a></h1>
<div class="error">)" << html_escape(message) << R"(</div>
</div>
</body>
</html>)";
    return html.str();
}

void WebServer::run() {
    std::cout << "Starting web server on http://" << config_.server.host
              << ":" << config_.server.port << "\n";
    std::cout << "Defaults: max_sentences=" << config_.summary.max_sentences
              << ", ratio=" << config_.summary.ratio
              << ", min_sentence_len=" << config_.summary.min_sentence_len << "\n";

    httplib::Server server;
    // Room for form encoding overhead, the text itself is checked per request
    server.set_payload_max_length(config_.server.max_text_bytes * 4);

    server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::cout << req.method << " " << req.path << " -> " << res.status << "\n";
    });

    server.Get("/", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(render_index_page(), "text/html; charset=utf-8");
    });

    server.Get("/api/status", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("{\"message\":\"summarizer is running\"}", "application/json; charset=utf-8");
    });

    server.Post("/summarize", [this](const httplib::Request& req, httplib::Response& res) {
        RequestParams params = request_params(req);
        std::string text = find_param(params, "text");

        if (text.size() > config_.server.max_text_bytes) {
            res.status = 413;
            res.set_content(render_error_page("Text is too long"), "text/html; charset=utf-8");
            return;
        }

        try {
            auto options = read_options(params);
            auto result = summarizer_->summarize(text, options);
            res.set_content(render_result_page(text, result), "text/html; charset=utf-8");
        } catch (const std::invalid_argument& e) {
            res.status = 400;
            res.set_content(render_error_page(e.what()), "text/html; charset=utf-8");
        }
    });

    server.Post("/api/summarize", [this](const httplib::Request& req, httplib::Response& res) {
        auto response = handle_api_summarize(request_params(req), req.body,
                                             req.get_header_value("Content-Type"));
        res.status = response.status;
        res.set_content(response.body, "application/json; charset=utf-8");
    });

    if (!server.listen(config_.server.host.c_str(), config_.server.port)) {
        throw std::runtime_error("Cannot listen on " + config_.server.host + ":" +
                                 std::to_string(config_.server.port));
    }
}

}
