#include "html_text.hpp"
#include "text_utils.hpp"

namespace summarizer {

static char32_t ascii_lower(char32_t cp) {
    return (cp >= 'A' && cp <= 'Z') ? cp + 0x20 : cp;
}

// Case-insensitive search for an ASCII needle
static size_t find_ci(const std::u32string& text, const std::u32string& needle, size_t from) {
    if (needle.empty() || text.size() < needle.size()) return std::u32string::npos;

    for (size_t i = from; i + needle.size() <= text.size(); ++i) {
        size_t j = 0;
        while (j < needle.size() && ascii_lower(text[i + j]) == needle[j]) {
            ++j;
        }
        if (j == needle.size()) return i;
    }
    return std::u32string::npos;
}

// Finds "<name" followed by '>', '/' or whitespace
static size_t find_tag(const std::u32string& text, const std::u32string& name, size_t from) {
    std::u32string open = U"<" + name;
    size_t pos = find_ci(text, open, from);
    while (pos != std::u32string::npos) {
        size_t after = pos + open.size();
        if (after >= text.size()) return std::u32string::npos;
        char32_t next = text[after];
        if (next == U'>' || next == U'/' || is_whitespace(next)) return pos;
        pos = find_ci(text, open, after);
    }
    return pos;
}

static std::u32string tag_name(const std::u32string& text, size_t start, size_t end) {
    size_t i = start + 1;
    if (i < end && text[i] == U'/') ++i;

    std::u32string name;
    while (i < end && text[i] != U'>' && text[i] != U'/' && !is_whitespace(text[i])) {
        name += ascii_lower(text[i]);
        ++i;
    }
    return name;
}

/**
 * Decodes the entity starting at text[pos] == '&'. On success appends the
 * code point and returns the index just past ';', otherwise returns pos.
 */
static size_t decode_entity(const std::u32string& text, size_t pos, std::u32string& out) {
    size_t semi = text.find(U';', pos);
    if (semi == std::u32string::npos || semi - pos > 10) return pos;

    std::u32string name;
    for (size_t i = pos + 1; i < semi; ++i) {
        name += ascii_lower(text[i]);
    }

    char32_t cp = 0;
    if (name == U"amp") cp = U'&';
    else if (name == U"lt") cp = U'<';
    else if (name == U"gt") cp = U'>';
    else if (name == U"quot") cp = U'"';
    else if (name == U"apos") cp = U'\'';
    else if (name == U"nbsp") cp = 0xA0;
    else if (name.size() > 1 && name[0] == U'#') {
        bool hex = name[1] == U'x';
        size_t i = hex ? 2 : 1;
        if (i >= name.size()) return pos;

        for (; i < name.size(); ++i) {
            char32_t c = name[i];
            int digit;
            if (c >= U'0' && c <= U'9') digit = static_cast<int>(c - U'0');
            else if (hex && c >= U'a' && c <= U'f') digit = static_cast<int>(c - U'a') + 10;
            else return pos;
            cp = cp * (hex ? 16 : 10) + static_cast<char32_t>(digit);
        }
        if (cp == 0 || cp > 0x10FFFF) return pos;
    } else {
        return pos;
    }

    out += cp;
    return semi + 1;
}

static std::u32string strip_markup(const std::u32string& html) {
    std::u32string out;
    out.reserve(html.size());

    size_t i = 0;
    while (i < html.size()) {
        char32_t cp = html[i];

        if (cp == U'<') {
            size_t close = html.find(U'>', i);
            if (close == std::u32string::npos) break;

            std::u32string name = tag_name(html, i, close);
            bool closing = i + 1 < close && html[i + 1] == U'/';
            out += U' ';

            if (!closing && (name == U"script" || name == U"style")) {
                size_t end = find_ci(html, U"</" + name, close);
                if (end == std::u32string::npos) break;
                i = end;
            } else {
                i = close + 1;
            }
            continue;
        }

        if (cp == U'&') {
            size_t next = decode_entity(html, i, out);
            if (next != i) {
                i = next;
                continue;
            }
        }

        out += cp;
        ++i;
    }

    return out;
}

std::string extract_text(const std::string& html) {
    return normalize_whitespace(encode_utf8(strip_markup(decode_utf8(html))));
}

// Text between <name ...> and </name>, empty when either side is missing
static bool element_text(const std::u32string& html, const std::u32string& name, std::string& text) {
    size_t start = find_tag(html, name, 0);
    if (start == std::u32string::npos) return false;

    size_t open_end = html.find(U'>', start);
    if (open_end == std::u32string::npos) return false;

    size_t end = find_ci(html, U"</" + name, open_end + 1);
    if (end == std::u32string::npos) return false;

    text = normalize_whitespace(encode_utf8(
        strip_markup(html.substr(open_end + 1, end - open_end - 1))));
    return true;
}

std::string extract_title(const std::string& html) {
    std::u32string decoded = decode_utf8(html);
    std::string title;

    if (element_text(decoded, U"title", title)) {
        // Drop a " - Site name" suffix
        for (const char* separator : {" \xE2\x80\x94 ", " - "}) {
            size_t cut = title.find(separator);
            if (cut != std::string::npos) {
                title.erase(cut);
            }
        }
        return title;
    }

    if (element_text(decoded, U"h1", title)) {
        return title;
    }

    return "Untitled";
}

bool looks_like_html(const std::string& text) {
    for (char32_t cp : decode_utf8(text)) {
        if (is_whitespace(cp)) continue;
        return cp == U'<';
    }
    return false;
}

}
