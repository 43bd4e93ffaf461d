/**
 * @file test_whisper_tokens.cpp
 * @brief Byte-level BPE decoding and timestamp splitting
 */

#include "cascade/whisper_tokens.h"
#include "test_common.h"
#include <string>
#include <vector>

using namespace cascade;

int main() {
    cascade_test::banner("Cascade - Whisper Token Test");

    // "你" = E4 BD A0, "好" = E5 A5 BD in byte-level symbols
    const std::string ni_head = "ä½";
    const std::string ni_tail = "ł";
    const std::string hao = "å¥½";

    cascade_test::step(1, "Control and timestamp tokens");
    {
        CHECK_NEAR(parse_timestamp_token("<|2.50|>"), 2.5, 1e-6);
        CHECK_NEAR(parse_timestamp_token("<|0.00|>"), 0.0, 1e-6);
        CHECK_NEAR(parse_timestamp_token("<|zh|>"), -1.0, 1e-6);
        CHECK_NEAR(parse_timestamp_token("<|30|>"), -1.0, 1e-6);
        CHECK_NEAR(parse_timestamp_token("<|1.2.3|>"), -1.0, 1e-6);
        CHECK_NEAR(parse_timestamp_token("2.50"), -1.0, 1e-6);

        CHECK(is_special_token("<|startoftranscript|>"));
        CHECK(is_special_token("<|notimestamps|>"));
        CHECK(!is_special_token("<|"));
        CHECK(!is_special_token("hello"));
    }

    cascade_test::step(2, "Byte symbols decode to UTF-8");
    {
        CHECK_EQ(token_to_bytes("ĠHello"), std::string(" Hello"));
        CHECK_EQ(token_to_bytes(ni_head + ni_tail), std::string("你"));
        CHECK_EQ(token_to_bytes("Ċ"), std::string("\n"));
        CHECK_EQ(token_to_bytes("abc"), std::string("abc"));
    }

    cascade_test::step(3, "Characters split across tokens");
    {
        const std::vector<std::string> tokens = {
            "<|startoftranscript|>", "<|zh|>", "<|transcribe|>", "<|notimestamps|>",
            ni_head, ni_tail + hao, "<|endoftext|>",
        };
        CHECK_EQ(decode_tokens(tokens), std::string("你好"));
        CHECK_EQ(decode_tokens({"ĠGood", "Ġmorning"}), std::string("Good morning"));
        CHECK_EQ(decode_tokens({}), std::string());

        // A dangling lead byte becomes a replacement character
        const std::string broken = decode_tokens({"a", ni_head});
        CHECK_EQ(broken.find("a"), 0u);
        CHECK(broken.find("\xEF\xBF\xBD") != std::string::npos);
    }

    cascade_test::step(4, "Timestamped spans");
    {
        const std::vector<std::string> tokens = {
            "<|startoftranscript|>", "<|zh|>", "<|transcribe|>",
            "<|0.00|>", ni_head, ni_tail, hao, "<|1.50|>",
            "<|2.00|>", "ĠGood", "Ġmorning",
        };
        const std::vector<TimedText> spans = split_timestamped_tokens(tokens, 30000, 45000);
        CHECK_EQ(spans.size(), 2u);
        CHECK_EQ(spans[0].start, 30000);
        CHECK_EQ(spans[0].end, 31500);
        CHECK_EQ(spans[0].text, std::string("你好"));
        CHECK_EQ(spans[1].start, 32000);
        CHECK_EQ(spans[1].end, 45000);
        CHECK_EQ(spans[1].text, std::string("Good morning"));
    }

    cascade_test::step(5, "Whitespace-only spans are dropped");
    {
        const std::vector<std::string> tokens = {
            "<|0.00|>", "Ġ", "<|1.00|>", "<|1.00|>", "ĠYes", "<|2.00|>",
        };
        const std::vector<TimedText> spans = split_timestamped_tokens(tokens, 0, 30000);
        CHECK_EQ(spans.size(), 1u);
        CHECK_EQ(spans[0].start, 1000);
        CHECK_EQ(spans[0].end, 2000);
        CHECK_EQ(spans[0].text, std::string("Yes"));

        CHECK(split_timestamped_tokens({"<|0.00|>", "<|endoftext|>"}, 0, 30000).empty());
    }

    cascade_test::step(6, "Text before the first timestamp keeps its own span");
    {
        const std::vector<std::string> tokens = {
            "ĠHi", "<|2.00|>", "Ġthere", "<|3.00|>",
        };
        const std::vector<TimedText> spans = split_timestamped_tokens(tokens, 60000, 90000);
        CHECK_EQ(spans.size(), 2u);
        CHECK_EQ(spans[0].start, 60000);
        CHECK_EQ(spans[0].end, 62000);
        CHECK_EQ(spans[0].text, std::string("Hi"));
        CHECK_EQ(spans[1].start, 62000);
        CHECK_EQ(spans[1].end, 63000);
        CHECK_EQ(spans[1].text, std::string("there"));
    }

    return cascade_test::report();
}
