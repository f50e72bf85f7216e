#pragma once

#include <string>

namespace summarizer {

// Plain text of an HTML page: tags dropped, script and style bodies skipped
std::string extract_text(const std::string& html);

// <title> without a " - Site" suffix, else the first <h1>, else "Untitled"
std::string extract_title(const std::string& html);

// True when the text starts with a tag after leading whitespace
bool looks_like_html(const std::string& text);

}
