#include <gtest/gtest.h>
#include "utils/vocab.hpp"

using namespace summ;


class vocabTest : public testing::Test{
protected:
    vocabTest(){
        for (const auto& word : {vocab::PAD_TOKEN, vocab::UNK_TOKEN, vocab::START_TOKEN, vocab::STOP_TOKEN,
                                 std::string("."), std::string("the"), std::string("a"), 
                                 std::string("he"), std::string("we"), std::string("storm"), 
                                 std::string("hit")}){
            table.AddSymbol(word);
        }
    };

    fst::SymbolTable table{"vocab"};
};


TEST_F(vocabTest, looks_up_words){
    EXPECT_EQ(vocab::word_to_id(table, "storm"), std::optional<tokenId>(9));
    EXPECT_FALSE(vocab::word_to_id(table, "hurricane").has_value());
    EXPECT_EQ(vocab::required_id(table, vocab::STOP_TOKEN), 3);
    EXPECT_THROW(vocab::required_id(table, "hurricane"), std::runtime_error);
}


TEST_F(vocabTest, builds_lexical_sets_from_known_words){
    auto sets = vocab::make_lexical_sets(table);
    EXPECT_EQ(sets.start_sent_ids, (std::unordered_set<tokenId>{2, 4}));
    EXPECT_EQ(sets.stopword_ids, (std::unordered_set<tokenId>{5, 6}));
    EXPECT_EQ(sets.pronoun_ids, (std::unordered_set<tokenId>{7, 8}));
}


TEST_F(vocabTest, numbers_article_oovs_after_the_vocabulary){
    auto article = vocab::article_to_ids(table, {"the", "storm", "battered", "miami", "battered"});
    EXPECT_EQ(article.ids, (std::vector<tokenId>{5, 9, 1, 1, 1}));
    EXPECT_EQ(article.ids_extended, (std::vector<tokenId>{5, 9, 11, 12, 11}));
    EXPECT_EQ(article.oov_words, (std::vector<std::string>{"battered", "miami"}));

    auto oov_map = vocab::make_oov_map(article, 1);
    EXPECT_EQ(oov_map.size(), 2u);
    EXPECT_EQ(oov_map.at(11), 1);
    EXPECT_EQ(oov_map.at(12), 1);
}


TEST_F(vocabTest, renders_ids_with_article_oovs){
    std::vector<std::string> oov_words{"miami"};
    auto words = vocab::ids_to_words(table, {9, 10, 11, 4}, oov_words);
    EXPECT_EQ(words, (std::vector<std::string>{"storm", "hit", "miami", "."}));
    EXPECT_THROW(vocab::ids_to_words(table, {12}, oov_words), std::out_of_range);
}
