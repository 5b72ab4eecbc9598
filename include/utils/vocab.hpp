#ifndef _SUMM_BEAM_VOCAB
#define _SUMM_BEAM_VOCAB

#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include "decoders/decoding_types.hpp"
#include "decoders/scoring.hpp"
#include "utils/my_utils.hpp"

namespace summ {
    namespace vocab {

// special symbols of the summarization vocabulary
const std::string PAD_TOKEN   = "[PAD]";
const std::string UNK_TOKEN   = "[UNK]";
const std::string START_TOKEN = "[START]";
const std::string STOP_TOKEN  = "[STOP]";

typedef myfst::SymbolTable SymbolTable;


// an article in ids, with words outside the vocabulary numbered after it
struct articleIds{
    std::vector<tokenId> ids;            // OOV words as the unknown id
    std::vector<tokenId> ids_extended;   // OOV words as vocab_size + position in oov_words
    std::vector<std::string> oov_words;
};


std::optional<tokenId> word_to_id(const SymbolTable& table, const std::string& word);

// throws std::runtime_error when the word is missing, for the special symbols
tokenId required_id(const SymbolTable& table, const std::string& word);

/*
start of sentence: [START] and "."
stopwords: the a an it its this that these those
pronouns: he she him her i we
Words missing from the table are left out.
*/
LexicalSets make_lexical_sets(const SymbolTable& table);

articleIds article_to_ids(const SymbolTable& table, const std::vector<std::string>& words);

// article specific id -> unknown id, the mapping the search applies before each model call
std::unordered_map<tokenId, tokenId> make_oov_map(const articleIds& article, tokenId unknown_token_id);

// ids past the vocabulary are looked up in oov_words
std::vector<std::string> ids_to_words(const SymbolTable& table, 
                                      const std::vector<tokenId>& ids,
                                      const std::vector<std::string>& oov_words);

    } // namespace vocab
} // namespace summ

#endif // _SUMM_BEAM_VOCAB
