#include "text_utils.hpp"

namespace summarizer {

static constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;

static size_t sequence_length(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 0;
}

std::u32string decode_utf8(const std::string& text) {
    std::u32string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t len = sequence_length(c);

        if (len == 0 || i + len > text.size()) {
            result += REPLACEMENT_CHAR;
            ++i;
            continue;
        }

        if (len == 1) {
            result += static_cast<char32_t>(c);
            ++i;
            continue;
        }

        char32_t cp = c & (0xFF >> (len + 1));
        bool valid = true;
        for (size_t j = 1; j < len; ++j) {
            unsigned char cc = static_cast<unsigned char>(text[i + j]);
            if ((cc & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (!valid) {
            result += REPLACEMENT_CHAR;
            ++i;
            continue;
        }

        result += cp;
        i += len;
    }

    return result;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string encode_utf8(const std::u32string& text) {
    std::string result;
    result.reserve(text.size());
    for (char32_t cp : text) {
        append_utf8(result, cp);
    }
    return result;
}

size_t utf8_length(const std::string& text) {
    return decode_utf8(text).size();
}

bool is_whitespace(char32_t cp) {
    if (cp == ' ' || (cp >= 0x09 && cp <= 0x0D)) return true;
    if (cp >= 0x1C && cp <= 0x1F) return true;
    if (cp < 0x80) return false;

    switch (cp) {
        case 0x0085:
        case 0x00A0:
        case 0x1680:
        case 0x2028:
        case 0x2029:
        case 0x202F:
        case 0x205F:
        case 0x3000:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

char32_t to_lower(char32_t cp) {
    if (cp >= 'A' && cp <= 'Z') {
        return cp + 0x20;
    }
    // Latin-1 capitals À..Þ, × is not a letter
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) {
        return cp + 0x20;
    }
    // Kelvin and Angstrom signs fold to the letters they look like
    if (cp == 0x212A) return U'k';
    if (cp == 0x212B) return 0xE5;
    return cp;
}

std::string to_lower(const std::string& text) {
    std::u32string decoded = decode_utf8(text);
    for (auto& cp : decoded) {
        cp = to_lower(cp);
    }
    return encode_utf8(decoded);
}

std::string normalize_whitespace(const std::string& text) {
    std::u32string decoded = decode_utf8(text);

    std::u32string normalized;
    normalized.reserve(decoded.size());

    bool pending_space = false;
    for (char32_t cp : decoded) {
        if (is_whitespace(cp)) {
            pending_space = !normalized.empty();
            continue;
        }
        if (pending_space) {
            normalized += U' ';
            pending_space = false;
        }
        normalized += cp;
    }

    return encode_utf8(normalized);
}

std::string trim(const std::string& text) {
    std::u32string decoded = decode_utf8(text);

    size_t start = 0;
    while (start < decoded.size() && is_whitespace(decoded[start])) {
        ++start;
    }

    size_t end = decoded.size();
    while (end > start && is_whitespace(decoded[end - 1])) {
        --end;
    }

    return encode_utf8(decoded.substr(start, end - start));
}

}
