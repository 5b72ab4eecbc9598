#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "utils/my_utils.hpp"

namespace fs = std::filesystem;
using namespace summ;


TEST(stringmanipTest, breaks_sentence_into_words){
    auto words = stringmanip::break_to_words("police  arrested the man .");
    EXPECT_EQ(words, (std::vector<std::string>{"police", "arrested", "the", "man", "."}));
    EXPECT_EQ(stringmanip::break_to_words("a|b", '|'), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(stringmanip::break_to_words("").empty());
}


TEST(stringmanipTest, strips_start_and_everything_after_stop){
    EXPECT_EQ(stringmanip::strip_decoded({2, 10, 11, 3, 12}, 3), (std::vector<tokenId>{10, 11}));
    EXPECT_EQ(stringmanip::strip_decoded({2, 10, 11}, 3), (std::vector<tokenId>{10, 11}));
    EXPECT_TRUE(stringmanip::strip_decoded({2, 3}, 3).empty());
    EXPECT_TRUE(stringmanip::strip_decoded({}, 3).empty());
}


TEST(stringmanipTest, breaks_words_into_sentences){
    std::vector<std::string> words{"the", "storm", "hit", ".", "two", "died", ".", "more", "feared"};
    auto sentences = stringmanip::break_into_sentences(words);
    ASSERT_EQ(sentences.size(), 3u);
    EXPECT_EQ(sentences[0], "the storm hit .");
    EXPECT_EQ(sentences[1], "two died .");
    EXPECT_EQ(sentences[2], "more feared");
    EXPECT_TRUE(stringmanip::break_into_sentences({}).empty());
}


TEST(stringmanipTest, escapes_angle_brackets){
    EXPECT_EQ(stringmanip::make_html_safe("<s> a > b"), "&lt;s&gt; a &gt; b");
    EXPECT_EQ(stringmanip::make_html_safe("plain"), "plain");
}


TEST(myfstTest, handles_missing_symbol_table){
    fs::path missing = fs::current_path() / "does_not_exist.syms";
    EXPECT_EQ(myfst::load_symbol_table(missing), nullptr);
    EXPECT_EQ(myfst::load_symbol_table(fs::path()), nullptr);
}


TEST(myfstTest, reads_text_symbol_table){
    fs::path table_path = fs::temp_directory_path() / "summ_beam_vocab_test.txt";
    {
        std::ofstream table_file(table_path);
        table_file << "[PAD]\t0\n[UNK]\t1\n[START]\t2\n[STOP]\t3\nthe\t4\n";
    }
    auto table = myfst::load_symbol_table(table_path);
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(table->Find("the"), 4);
    EXPECT_EQ(table->NumSymbols(), 5u);
    fs::remove(table_path);
}
