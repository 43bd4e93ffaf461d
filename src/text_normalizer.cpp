#include "cascade/text_normalizer.h"
#include <algorithm>

namespace cascade {

namespace {

constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

bool is_unicode_space(char32_t c) {
    switch (c) {
        case U' ': case U'\t': case U'\n': case U'\r': case 0x0B: case 0x0C:
        case 0x1C: case 0x1D: case 0x1E: case 0x1F:
        case 0x85: case 0xA0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return c >= 0x2000 && c <= 0x200A;
    }
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// UTF-8 Helpers
// ═══════════════════════════════════════════════════════════

std::u32string utf8_decode(const std::string& text) {
    std::u32string out;
    out.reserve(text.size());

    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        unsigned char lead = static_cast<unsigned char>(text[i]);

        if (lead < 0x80) {
            out.push_back(lead);
            ++i;
            continue;
        }

        size_t extra = 0;
        char32_t cp = 0;
        char32_t min_cp = 0;
        if ((lead & 0xE0) == 0xC0) {
            extra = 1; cp = lead & 0x1F; min_cp = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2; cp = lead & 0x0F; min_cp = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3; cp = lead & 0x07; min_cp = 0x10000;
        } else {
            out.push_back(REPLACEMENT_CHAR);
            ++i;
            continue;
        }

        bool valid = true;
        for (size_t k = 1; k <= extra; ++k) {
            if (i + k >= n || !is_continuation(static_cast<unsigned char>(text[i + k]))) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (static_cast<unsigned char>(text[i + k]) & 0x3F);
        }

        // Reject overlong forms, surrogates and out-of-range values
        if (!valid || cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            out.push_back(REPLACEMENT_CHAR);
            ++i;
            continue;
        }

        out.push_back(cp);
        i += extra + 1;
    }

    return out;
}

std::string utf8_encode(const std::u32string& text, size_t begin, size_t end) {
    end = std::min(end, text.size());
    begin = std::min(begin, end);

    std::string out;
    out.reserve((end - begin) * 3);

    for (size_t i = begin; i < end; ++i) {
        char32_t cp = text[i];
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            cp = REPLACEMENT_CHAR;
        }

        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    return out;
}

std::string utf8_encode(const std::u32string& text) {
    return utf8_encode(text, 0, text.size());
}

size_t utf8_length(const std::string& text) {
    return utf8_decode(text).size();
}

std::u32string trim(const std::u32string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_unicode_space(text[begin])) ++begin;
    while (end > begin && is_unicode_space(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

std::string trim(const std::string& text) {
    return utf8_encode(trim(utf8_decode(text)));
}

// ═══════════════════════════════════════════════════════════
// Normalization
// ═══════════════════════════════════════════════════════════

bool is_ignorable(char32_t c) {
    if (is_unicode_space(c)) {
        return true;
    }

    // C0/C1 controls, DEL, zero-width and BOM format characters
    if (c < 0x20 || (c >= 0x7F && c <= 0x9F) ||
        (c >= 0x200B && c <= 0x200D) || c == 0xFEFF) {
        return true;
    }

    switch (c) {
        // Latin sentence punctuation, quotes and brackets
        case U',': case U'.': case U'!': case U'?': case U';': case U':':
        case U'\'': case U'"': case U'(': case U')': case U'[': case U']':
        case U'{': case U'}':
        // CJK punctuation: ，。！？、：；（）【】《》…—
        case 0xFF0C: case 0x3002: case 0xFF01: case 0xFF1F: case 0x3001:
        case 0xFF1A: case 0xFF1B: case 0xFF08: case 0xFF09: case 0x3010:
        case 0x3011: case 0x300A: case 0x300B: case 0x2026: case 0x2014:
        // Typographic quotes: “”‘’
        case 0x201C: case 0x201D: case 0x2018: case 0x2019:
            return true;
        default:
            return false;
    }
}

char32_t fold_case(char32_t c) {
    if (c >= U'A' && c <= U'Z') return c + 0x20;
    if (c < 0xC0) return c;

    // Latin-1 capitals (× is not a letter)
    if (c <= 0xDE && c != 0xD7) return c + 0x20;

    // Latin Extended-A: capitals pair with the following code point.
    // U+0130 lowers to "i" plus a combining dot; only the "i" is kept.
    if (c == 0x0130) return U'i';
    if ((c >= 0x0100 && c <= 0x0137) || (c >= 0x014A && c <= 0x0177)) {
        return (c % 2 == 0) ? c + 1 : c;
    }
    if ((c >= 0x0139 && c <= 0x0148) || (c >= 0x0179 && c <= 0x017E)) {
        return (c % 2 == 1) ? c + 1 : c;
    }
    if (c == 0x0178) return 0xFF;

    // Greek capitals (U+03A2 is unassigned)
    if (c >= 0x0391 && c <= 0x03A9 && c != 0x03A2) return c + 0x20;

    // Cyrillic
    if (c >= 0x0410 && c <= 0x042F) return c + 0x20;
    if (c >= 0x0400 && c <= 0x040F) return c + 0x50;

    // Fullwidth Latin
    if (c >= 0xFF21 && c <= 0xFF3A) return c + 0x20;

    return c;
}

NormalizedText normalize_text(const std::u32string& text) {
    NormalizedText result;
    result.original_length = text.size();
    result.text.reserve(text.size());
    result.index_map.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        if (is_ignorable(text[i])) {
            continue;
        }
        result.text.push_back(fold_case(text[i]));
        result.index_map.push_back(i);
    }

    return result;
}

NormalizedText normalize_text(const std::string& text) {
    return normalize_text(utf8_decode(text));
}

std::string normalized_string(const std::string& text) {
    return utf8_encode(normalize_text(text).text);
}

size_t normalized_length(const std::string& text) {
    return normalize_text(text).size();
}

} // namespace cascade
