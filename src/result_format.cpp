#include "result_format.hpp"

#include <iomanip>
#include <sstream>

namespace summarizer {

std::string json_escape(const std::string& s) {
    std::ostringstream out;
    for (char ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            case '\b': out << "\\b"; break;
            case '\f': out << "\\f"; break;
            default:
                if (c < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec << std::setfill(' ');
                } else {
                    out << ch;
                }
        }
    }
    return out.str();
}

std::string to_json(const SummaryResult& result) {
    std::ostringstream json;
    json << "{\"summary\":\"" << json_escape(result.summary) << "\","
         << "\"language\":\"" << result.language_code() << "\","
         << "\"selected_indices\":[";

    for (size_t i = 0; i < result.selected_indices.size(); ++i) {
        if (i > 0) json << ",";
        json << result.selected_indices[i];
    }

    json << "],\"sentences_count\":" << result.sentences_count << "}";
    return json.str();
}

std::string error_json(const std::string& message) {
    return "{\"error\":\"" + json_escape(message) + "\"}";
}

std::string html_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '&': result += "&amp;"; break;
            case '"': result += "&quot;"; break;
            default: result += c;
        }
    }
    return result;
}

}
