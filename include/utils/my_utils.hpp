#ifndef _SUMM_BEAM_MY_UTILS
#define _SUMM_BEAM_MY_UTILS

#include <vector>
#include <string>
#include <memory>
#include <filesystem>
#include "decoders/decoding_types.hpp"
#include "utils/fst_glog_safe_log.hpp"

namespace fs = std::filesystem;


namespace summ{
    namespace stringmanip{
        std::vector<std::string> break_to_words(const std::string& sentence, char word_delimiter);
        std::vector<std::string> break_to_words(const std::string& sentence);
        std::string join_words(const std::vector<std::string>& words, char word_delimiter = ' ');

        // drop the start token and everything from the first stop token on
        std::vector<tokenId> strip_decoded(const std::vector<tokenId>& ids, tokenId stop_token_id);

        // sentences end with "." (kept); trailing words without one form the last sentence
        std::vector<std::string> break_into_sentences(const std::vector<std::string>& words);

        std::string make_html_safe(const std::string& sequence);
    } //namespace stringmanip

    namespace myfst{
        typedef fst::SymbolTable SymbolTable;
        // text tables (.txt) or OpenFST binary symbol tables, nullptr on failure
        std::unique_ptr<SymbolTable> load_symbol_table(const fs::path& symbols_path);
    } //namespace myfst
} //namespace summ


#endif // _SUMM_BEAM_MY_UTILS
