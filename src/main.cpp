#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include "decoders/decode_session.hpp"
#include "models/torch_script_decoder.hpp"
#include "utils/my_utils.hpp"
#include "utils/vocab.hpp"

using namespace summ;


void print_usage(){
    std::cout << "[main]: You need to pass: " << std::endl <<
    "1- Path of the torch script model." << std::endl <<
    "2- Path of the vocabulary symbol table." << std::endl <<
    "3- Path of the articles file (one tokenized article per line)." << std::endl <<
    "Optional key=value overrides: beam_size, max_dec_steps, min_dec_steps, "
    "scoring=plain|smart, threshold, pronoun_penalty" << std::endl;
}


int main(int argc, char** argv){
    google::InitGoogleLogging(argv[0]);
    if (argc < 4){
        print_usage();
        return 1;
    }

    // vocabulary
    auto table = myfst::load_symbol_table(argv[2]);
    if (!table){
        LOG(ERROR) << "[main]: failed to load the vocabulary from " << argv[2];
        return 1;
    }

    // configuration
    beam::DecodingConfig config;
    try{
        config.start_token_id                       = vocab::required_id(*table, vocab::START_TOKEN);
        config.unknown_token_id                     = vocab::required_id(*table, vocab::UNK_TOKEN);
        config.scoring_info.stop_token_id           = vocab::required_id(*table, vocab::STOP_TOKEN);
        config.scoring_info.lexical_sets            = vocab::make_lexical_sets(*table);
    }
    catch (const std::runtime_error& e){
        LOG(ERROR) << "[main]: " << e.what();
        return 1;
    }
    for (int i = 4; i < argc; ++i){
        if (!config.set_from_string(argv[i])){
            print_usage();
            return 1;
        }
    }

    // model
    models::torchScriptDecoder model;
    if (!model.load_model(argv[1])){
        LOG(ERROR) << "[main]: failed to load the model from " << argv[1];
        return 1;
    }

    std::ifstream articles_file(argv[3]);
    if (!articles_file.is_open()){
        LOG(ERROR) << "[main]: failed to open the articles file at " << argv[3];
        return 1;
    }

    std::unique_ptr<beam::decodeSession> session;
    try{
        session = std::make_unique<beam::decodeSession>(config);
    }
    catch (const invalidConfigError& e){
        LOG(ERROR) << "[main]: " << e.what();
        return 1;
    }

    std::string line;
    size_t article_index = 0;
    while (std::getline(articles_file, line)){
        ++article_index;
        auto article = vocab::article_to_ids(*table, stringmanip::break_to_words(line));
        auto encoded = model.encode(article, config.unknown_token_id);
        if (!encoded.has_value()){
            LOG(WARNING) << "[main]: skipping article " << article_index;
            continue;
        }

        auto result = session->decode_next(encoded->input, model.as_decode_step(encoded.value()));
        if (!result.has_value()){
            continue;
        }

        // render the summary
        auto decoded_ids = stringmanip::strip_decoded(result->best_hyp.get_tokens(), config.stop_token_id());
        std::vector<std::string> decoded_words;
        try{
            decoded_words = vocab::ids_to_words(*table, decoded_ids, article.oov_words);
        }
        catch (const std::out_of_range& e){
            LOG(ERROR) << "[main]: could not render article " << article_index << ": " << e.what();
            continue;
        }
        LOG(INFO) << "[main]: GENERATED SUMMARY: " << stringmanip::join_words(decoded_words);
        LOG(INFO) << "[main]: SCORE: " << result->score;
        for (const auto& sentence : stringmanip::break_into_sentences(decoded_words)){
            std::cout << stringmanip::make_html_safe(sentence) << std::endl;
        }
        std::cout << std::endl;
    }

    const auto& stats = session->get_stats();
    LOG(INFO) << "[main]: decoded " << stats.num_decoded << " articles, " 
              << stats.num_failed << " failed";
    if (auto mean_score = stats.mean_score()){
        LOG(INFO) << "[main]: mean score: " << mean_score.value();
    }
    return 0;
}
