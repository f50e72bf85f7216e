#pragma once

#include <map>
#include <memory>
#include <string>

#include "config.hpp"
#include "summarizer.hpp"

namespace summarizer {

// Same layout as httplib::Params
using RequestParams = std::multimap<std::string, std::string>;

struct ApiResponse {
    int status = 200;
    std::string body;
};

class WebServer {
public:
    explicit WebServer(const AppConfig& config);
    ~WebServer();

    void run();

    /**
     * Handles POST /api/summarize. The text comes from the "text" field,
     * or from the raw body for non-form requests.
     */
    ApiResponse handle_api_summarize(const RequestParams& params,
                                     const std::string& body,
                                     const std::string& content_type) const;

    // Adds the text and option fields of a multipart body to the query params
    static RequestParams merge_form_fields(const RequestParams& params,
                                           const RequestParams& multipart_fields);

private:
    AppConfig config_;
    std::unique_ptr<Summarizer> summarizer_;

    SummaryOptions read_options(const RequestParams& params) const;

    std::string render_index_page() const;
    std::string render_result_page(const std::string& text,
                                   const SummaryResult& result) const;
    std::string render_error_page(const std::string& message) const;
};

}
