#include <algorithm>
#include "utils/my_utils.hpp"
#include "utils/fst_glog_safe_log.hpp"


namespace summ {
    namespace stringmanip{
        std::vector<std::string> break_to_words(const std::string& sentence, const char word_delimiter){
            std::vector<std::string> result;
            std::string word;
            for (const auto& letter : sentence){
                if (letter != word_delimiter){
                    word += letter;
                    continue;
                }
                if (!word.empty()) result.push_back(word); // repeated delimiters
                word.clear();
            }
            if (!word.empty()) result.push_back(word);
            return result;
        }

        std::vector<std::string> break_to_words(const std::string& sentence){
            return break_to_words(sentence, ' ');  // use empty space if no delimiter is set
        }

        std::string join_words(const std::vector<std::string>& words, char word_delimiter){
            std::string result;
            for (size_t i = 0; i < words.size(); ++i){
                if (i > 0) result += word_delimiter;
                result += words[i];
            }
            return result;
        }

        std::vector<tokenId> strip_decoded(const std::vector<tokenId>& ids, tokenId stop_token_id){
            if (ids.empty()){
                return {};
            }
            auto first = ids.begin() + 1; // start token
            auto stop  = std::find(first, ids.end(), stop_token_id);
            return std::vector<tokenId>(first, stop);
        }

        std::vector<std::string> break_into_sentences(const std::vector<std::string>& words){
            std::vector<std::string> sentences;
            std::vector<std::string> sentence;
            for (const auto& word : words){
                sentence.push_back(word);
                if (word == "."){
                    sentences.push_back(join_words(sentence));
                    sentence.clear();
                }
            }
            if (!sentence.empty()){
                sentences.push_back(join_words(sentence));
            }
            return sentences;
        }

        std::string make_html_safe(const std::string& sequence){
            std::string result;
            result.reserve(sequence.size());
            for (char c : sequence){
                if (c == '<')      result += "&lt;";
                else if (c == '>') result += "&gt;";
                else               result += c;
            }
            return result;
        }
    } // stringmanip


    namespace myfst {
        std::unique_ptr<SymbolTable> load_symbol_table(const fs::path& symbols_path){
            if (symbols_path.empty() || !fs::exists(symbols_path)){
                LOG(WARNING) << "[myfst/load_symbol_table]: " << symbols_path << " does not exist";
                return nullptr;
            }

            SymbolTable* loaded_table = nullptr;
            if (symbols_path.extension() == ".txt"){
                loaded_table = fst::SymbolTable::ReadText(symbols_path.string());
            }
            else{
                loaded_table = fst::SymbolTable::Read(symbols_path.string());
            }
            if (!loaded_table){
                LOG(WARNING) << "[myfst/load_symbol_table]: " << symbols_path 
                             << " could not be read as a symbol table";
                return nullptr;
            }

            LOG(INFO) << "[myfst/load_symbol_table]: loaded " << loaded_table->NumSymbols() 
                      << " symbols from " << symbols_path;
            return std::unique_ptr<SymbolTable>(loaded_table);
        }
    } // namespace myfst
} //namespace summ
