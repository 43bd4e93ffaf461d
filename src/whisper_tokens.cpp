#include "cascade/whisper_tokens.h"
#include "cascade/text_normalizer.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace cascade {

namespace {

// Inverse of GPT-2's bytes_to_unicode(): printable bytes map to themselves,
// the remaining 68 bytes are assigned code points 256, 257, ... in order.
struct ByteDecoder {
    std::array<int, 512> byte_for_code;

    ByteDecoder() {
        byte_for_code.fill(-1);
        int extra = 0;
        for (int b = 0; b < 256; ++b) {
            const bool printable = (b >= 33 && b <= 126) || (b >= 161 && b <= 172) || (b >= 174 && b <= 255);
            if (printable) {
                byte_for_code[b] = b;
            } else {
                byte_for_code[256 + extra] = b;
                ++extra;
            }
        }
    }
};

const ByteDecoder& byte_decoder() {
    static const ByteDecoder decoder;
    return decoder;
}

} // anonymous namespace

float parse_timestamp_token(const std::string& token) {
    if (!is_special_token(token)) {
        return -1.0f;
    }

    const std::string inner = token.substr(2, token.size() - 4);
    bool has_dot = false;
    for (char c : inner) {
        if (c == '.') {
            if (has_dot) return -1.0f;
            has_dot = true;
        } else if (!std::isdigit(static_cast<unsigned char>(c))) {
            return -1.0f;
        }
    }
    if (!has_dot) {
        return -1.0f;
    }
    return std::strtof(inner.c_str(), nullptr);
}

bool is_special_token(const std::string& token) {
    return token.size() >= 4 &&
           token.compare(0, 2, "<|") == 0 &&
           token.compare(token.size() - 2, 2, "|>") == 0;
}

std::string token_to_bytes(const std::string& token) {
    const auto& decoder = byte_decoder();
    std::string bytes;
    bytes.reserve(token.size());

    for (char32_t cp : utf8_decode(token)) {
        const int b = cp < decoder.byte_for_code.size() ? decoder.byte_for_code[cp] : -1;
        if (b >= 0) {
            bytes.push_back(static_cast<char>(b));
        } else {
            // Not a byte-level symbol, keep the character as-is
            bytes += utf8_encode(std::u32string(1, cp));
        }
    }
    return bytes;
}

std::string decode_tokens(const std::vector<std::string>& tokens) {
    std::string bytes;
    for (const auto& token : tokens) {
        if (is_special_token(token)) continue;
        bytes += token_to_bytes(token);
    }
    // Invalid byte sequences become U+FFFD
    return trim(utf8_encode(utf8_decode(bytes)));
}

std::vector<TimedText> split_timestamped_tokens(const std::vector<std::string>& tokens,
                                                int64_t offset_ms,
                                                int64_t chunk_end_ms) {
    std::vector<TimedText> spans;

    int64_t current_start = -1;
    std::string bytes;

    auto flush = [&](int64_t end_ms) {
        std::string text = trim(utf8_encode(utf8_decode(bytes)));
        bytes.clear();
        if (text.empty()) return;
        TimedText span;
        span.start = current_start < 0 ? offset_ms : current_start;
        span.end = std::max(end_ms, span.start);
        span.text = std::move(text);
        spans.push_back(std::move(span));
    };

    for (const auto& token : tokens) {
        const float seconds = parse_timestamp_token(token);
        if (seconds >= 0.0f) {
            const int64_t absolute = offset_ms + static_cast<int64_t>(std::lround(seconds * 1000.0f));
            // Text ahead of the first timestamp opens at offset_ms
            if (!bytes.empty()) {
                flush(absolute);
            }
            current_start = absolute;
            continue;
        }
        if (is_special_token(token)) continue;
        bytes += token_to_bytes(token);
    }

    if (!bytes.empty()) {
        flush(chunk_end_ms);
    }

    return spans;
}

} // namespace cascade
