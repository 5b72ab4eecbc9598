#include <algorithm>
#include <stdexcept>
#include <unordered_set>
#include "utils/vocab.hpp"


namespace summ {
    namespace vocab {

namespace {

const std::vector<std::string> SENTENCE_START_WORDS = {START_TOKEN, "."};
const std::vector<std::string> STOPWORDS = {
    "the", "a", "an", "it", "its", "this", "that", "these", "those"
};
const std::vector<std::string> PRONOUNS = {"he", "she", "him", "her", "i", "we"};

void insert_known(const SymbolTable& table, const std::vector<std::string>& words, 
                  std::unordered_set<tokenId>& target){
    for (const auto& word : words){
        auto id = word_to_id(table, word);
        if (!id.has_value()){
            VLOG(2) << "[vocab/make_lexical_sets]: " << word << " is not in the vocabulary";
            continue;
        }
        target.insert(id.value());
    }
}

} // namespace


std::optional<tokenId> word_to_id(const SymbolTable& table, const std::string& word){
    auto key = table.Find(word);
    if (key == fst::kNoSymbol){
        return std::nullopt;
    }
    return static_cast<tokenId>(key);
}


tokenId required_id(const SymbolTable& table, const std::string& word){
    auto id = word_to_id(table, word);
    if (!id.has_value()){
        LOG(WARNING) << "[vocab/required_id]: " << word << " is missing from the vocabulary";
        throw std::runtime_error("vocabulary has no " + word + " symbol");
    }
    return id.value();
}


LexicalSets make_lexical_sets(const SymbolTable& table){
    LexicalSets lexical_sets;
    insert_known(table, SENTENCE_START_WORDS, lexical_sets.start_sent_ids);
    insert_known(table, STOPWORDS, lexical_sets.stopword_ids);
    insert_known(table, PRONOUNS, lexical_sets.pronoun_ids);
    VLOG(1) << "[vocab/make_lexical_sets]: " << lexical_sets.start_sent_ids.size() << " sentence start ids, "
            << lexical_sets.stopword_ids.size() << " stopword ids, " 
            << lexical_sets.pronoun_ids.size() << " pronoun ids";
    return lexical_sets;
}


articleIds article_to_ids(const SymbolTable& table, const std::vector<std::string>& words){
    tokenId unknown_token_id = required_id(table, UNK_TOKEN);
    tokenId vocab_size = static_cast<tokenId>(table.AvailableKey());

    articleIds article;
    for (const auto& word : words){
        auto id = word_to_id(table, word);
        if (id.has_value()){
            article.ids.push_back(id.value());
            article.ids_extended.push_back(id.value());
            continue;
        }

        article.ids.push_back(unknown_token_id);
        auto it = std::find(article.oov_words.begin(), article.oov_words.end(), word);
        if (it == article.oov_words.end()){
            article.oov_words.push_back(word);
            it = article.oov_words.end() - 1;
        }
        article.ids_extended.push_back(vocab_size + static_cast<tokenId>(it - article.oov_words.begin()));
    }
    return article;
}


std::unordered_map<tokenId, tokenId> make_oov_map(const articleIds& article, tokenId unknown_token_id){
    std::unordered_map<tokenId, tokenId> oov_map;
    for (size_t i = 0; i < article.ids.size(); ++i){
        if (article.ids[i] != article.ids_extended[i]){
            oov_map[article.ids_extended[i]] = unknown_token_id;
        }
    }
    return oov_map;
}


std::vector<std::string> ids_to_words(const SymbolTable& table, 
                                      const std::vector<tokenId>& ids,
                                      const std::vector<std::string>& oov_words){
    tokenId vocab_size = static_cast<tokenId>(table.AvailableKey());
    std::vector<std::string> words;
    words.reserve(ids.size());
    for (tokenId id : ids){
        if (id < vocab_size){
            std::string word = table.Find(id);
            if (word.empty()){
                LOG(WARNING) << "[vocab/ids_to_words]: id " << id << " has no symbol";
                word = UNK_TOKEN;
            }
            words.push_back(word);
            continue;
        }
        size_t oov_index = static_cast<size_t>(id - vocab_size);
        if (oov_index >= oov_words.size()){
            throw std::out_of_range("id " + std::to_string(id) + " is past the article OOV words");
        }
        words.push_back(oov_words[oov_index]);
    }
    return words;
}

    } // namespace vocab
} // namespace summ
