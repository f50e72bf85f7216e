#pragma once

#include <string>

#include "summarizer.hpp"

namespace summarizer {

std::string json_escape(const std::string& s);

// {"summary":...,"language":...,"selected_indices":[...],"sentences_count":N}
std::string to_json(const SummaryResult& result);

std::string error_json(const std::string& message);

std::string html_escape(const std::string& s);

}
