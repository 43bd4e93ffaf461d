#include "cascade/text_cleanup.h"
#include "cascade/text_normalizer.h"

namespace cascade {

namespace {

bool is_emoji(char32_t c) {
    return (c >= 0x1F600 && c <= 0x1F64F) ||   // Emoticons
           (c >= 0x1F300 && c <= 0x1F5FF) ||   // Symbols & pictographs
           (c >= 0x1F680 && c <= 0x1F6FF) ||   // Transport & map
           (c >= 0x1F1E0 && c <= 0x1F1FF) ||   // Flags
           (c >= 0x2702 && c <= 0x27B0) ||
           (c >= 0x1F900 && c <= 0x1F9FF) ||   // Supplemental symbols
           (c >= 0x1FA00 && c <= 0x1FAFF) ||   // Extended symbols
           (c >= 0x2600 && c <= 0x27BF);       // Misc symbols & dingbats
}

// Python's str.isspace() set restricted to what engines actually emit
bool is_space(char32_t c) {
    return c == U' ' || c == U'\t' || c == U'\n' || c == U'\r' || c == 0x0B || c == 0x0C ||
           c == 0x85 || c == 0xA0 || c == 0x3000 || (c >= 0x2000 && c <= 0x200A) ||
           c == 0x2028 || c == 0x2029 || c == 0x202F || c == 0x205F || c == 0x1680 ||
           (c >= 0x1C && c <= 0x1F);
}

// Length of a "<|...|>" tag starting at pos, or 0 if there is none
size_t tag_length(const std::u32string& text, size_t pos) {
    const size_t n = text.size();
    if (pos >= n || text[pos] != U'<') return 0;

    size_t i = pos + 1;
    while (i < n && is_space(text[i])) ++i;
    if (i >= n || text[i] != U'|') return 0;
    ++i;

    while (i < n && text[i] != U'|') ++i;
    if (i >= n) return 0;
    ++i;

    while (i < n && is_space(text[i])) ++i;
    if (i >= n || text[i] != U'>') return 0;

    return i + 1 - pos;
}

} // anonymous namespace

std::string remove_emoji(const std::string& text) {
    const std::u32string chars = utf8_decode(text);
    std::u32string kept;
    kept.reserve(chars.size());

    for (char32_t c : chars) {
        if (!is_emoji(c)) {
            kept.push_back(c);
        }
    }

    return utf8_encode(trim(kept));
}

std::string remove_engine_tags(const std::string& text) {
    if (text.empty()) {
        return "";
    }

    const std::u32string chars = utf8_decode(text);
    std::u32string stripped;
    stripped.reserve(chars.size());

    for (size_t i = 0; i < chars.size();) {
        size_t len = tag_length(chars, i);
        if (len > 0) {
            i += len;
        } else {
            stripped.push_back(chars[i++]);
        }
    }

    // Collapse whitespace runs
    std::u32string collapsed;
    collapsed.reserve(stripped.size());
    bool in_space = false;
    for (char32_t c : stripped) {
        if (is_space(c)) {
            if (!in_space) {
                collapsed.push_back(U' ');
            }
            in_space = true;
        } else {
            collapsed.push_back(c);
            in_space = false;
        }
    }

    return utf8_encode(trim(collapsed));
}

std::string clean_transcript(const std::string& text) {
    return remove_emoji(remove_engine_tags(text));
}

} // namespace cascade
