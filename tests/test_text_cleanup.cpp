/**
 * @file test_text_cleanup.cpp
 * @brief Emoji and engine markup removal
 */

#include "cascade/text_cleanup.h"
#include "test_common.h"
#include <string>

using namespace cascade;

int main() {
    cascade_test::banner("Cascade - Text Cleanup Test");

    cascade_test::step(1, "Engine tags");
    {
        CHECK_EQ(remove_engine_tags("<|zh|><|NEUTRAL|><|Speech|>你好"), std::string("你好"));
        CHECK_EQ(remove_engine_tags("< |en| > hello   world <|withitn|>"), std::string("hello world"));
        CHECK_EQ(remove_engine_tags("a<|x|>b"), std::string("ab"));
        CHECK_EQ(remove_engine_tags(""), std::string());

        // Incomplete markup is left alone
        CHECK_EQ(remove_engine_tags("a <|open b"), std::string("a <|open b"));
        CHECK_EQ(remove_engine_tags("x < y | z"), std::string("x < y | z"));
    }

    cascade_test::step(2, "Emoji");
    {
        CHECK_EQ(remove_emoji("今天天气很好😀"), std::string("今天天气很好"));
        CHECK_EQ(remove_emoji("🚗 出发 ✈"), std::string("出发"));
        CHECK_EQ(remove_emoji("☀晴天"), std::string("晴天"));
        CHECK_EQ(remove_emoji("你好，世界！"), std::string("你好，世界！"));
        CHECK_EQ(remove_emoji("🎉🎉"), std::string());
    }

    cascade_test::step(3, "Full cleanup");
    {
        CHECK_EQ(clean_transcript("<|zh|><|HAPPY|><|Speech|>太好了😊 "), std::string("太好了"));
        CHECK_EQ(clean_transcript("plain text"), std::string("plain text"));
        const std::string once = clean_transcript("<|en|> Good morning 👍");
        CHECK_EQ(clean_transcript(once), once);
    }

    return cascade_test::report();
}
