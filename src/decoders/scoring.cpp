#include <set>
#include <numeric>
#include <algorithm>
#include <sstream>
#include <glog/logging.h>
#include "decoders/scoring.hpp"
#include "utils/errors.hpp"


namespace summ {
    namespace scoring {

bool has_unknown_token(const std::vector<tokenId>& tokens, 
                       tokenId stop_token_id, 
                       tokenId unknown_token_threshold){
    if (tokens.empty()){
        return false;
    }

    // interior tokens (not the start token, not the latest one)
    for (size_t i = 1; i + 1 < tokens.size(); ++i){
        if (tokens[i] < unknown_token_threshold) return true;
    }

    // the latest token may legitimately be the stop token
    tokenId latest_token = tokens.back();
    return (latest_token < unknown_token_threshold && latest_token != stop_token_id);
}


double avg_log_prob(const std::vector<tokenId>& tokens,
                    const std::vector<float>& log_probs,
                    tokenId stop_token_id,
                    tokenId unknown_token_threshold){
    if (has_unknown_token(tokens, stop_token_id, unknown_token_threshold)){
        return DISQUALIFIED_SCORE;
    }
    if (tokens.empty()){
        throw malformedHypothesisError("average log prob of an empty sequence");
    }
    double sum = std::accumulate(log_probs.begin(), log_probs.end(), 0.0);
    return sum / static_cast<double>(tokens.size());
}


double repeated_n_gram_loss(const std::vector<tokenId>& tokens, size_t n){
    if (n == 0 || tokens.size() < n){
        return 0.;
    }

    std::set<std::vector<tokenId>> seen_n_grams;
    for (size_t i = 0; i + n <= tokens.size(); ++i){
        std::vector<tokenId> n_gram(tokens.begin() + i, tokens.begin() + i + n);
        if (!seen_n_grams.insert(std::move(n_gram)).second){
            VLOG(6) << "[scoring/repeated_n_gram_loss]: repeated " << n 
                    << "-gram starting at position " << i;
            return REPEATED_NGRAM_PENALTY;
        }
    }
    return 0.;
}


double coverage_loss(const std::vector<const attnDist*>& attn_dists){
    if (attn_dists.empty()){
        return 0.;
    }

    size_t attn_length = attn_dists.front()->size();
    std::vector<double> coverage(attn_length, 0.);
    double total_loss = 0.;
    for (const attnDist* attn_dist : attn_dists){
        if (attn_dist->size() != attn_length){
            std::ostringstream oss;
            oss << "attention distributions of different lengths (" 
                << attn_dist->size() << " vs " << attn_length << ")";
            throw malformedHypothesisError(oss.str());
        }
        double step_loss = 0.;
        for (size_t k = 0; k < attn_length; ++k){
            step_loss  += std::min(static_cast<double>((*attn_dist)[k]), coverage[k]);
            coverage[k] += (*attn_dist)[k];
        }
        total_loss += step_loss;
    }
    return total_loss / static_cast<double>(attn_dists.size());
}


double coverage_loss(const std::vector<attnDist>& attn_dists){
    std::vector<const attnDist*> views;
    views.reserve(attn_dists.size());
    for (const auto& attn_dist : attn_dists){
        views.push_back(&attn_dist);
    }
    return coverage_loss(views);
}


double avg_top_attention(const std::vector<attnDist>& attn_dists){
    if (attn_dists.empty()){
        throw malformedHypothesisError("no attention distributions to average");
    }

    double sum = 0.;
    for (const auto& attn_dist : attn_dists){
        if (attn_dist.empty()){
            throw malformedHypothesisError("empty attention distribution");
        }
        sum += *std::max_element(attn_dist.begin(), attn_dist.end());
    }
    return sum / static_cast<double>(attn_dists.size());
}


double smart_avg_log_prob(const std::vector<tokenId>& tokens,
                          const std::vector<float>& log_probs,
                          const LexicalSets& lexical_sets,
                          float pronoun_penalty){
    if (tokens.size() != log_probs.size()){
        throw malformedHypothesisError("tokens and log probs differ in length");
    }

    size_t num_tokens = tokens.size();
    std::vector<double> sentence_start_weights(num_tokens, 0.);
    std::vector<double> working_log_probs(log_probs.begin(), log_probs.end());

    for (size_t i = 0; i < num_tokens; ++i){
        tokenId token = tokens[i];
        if (lexical_sets.start_sent_ids.count(token)){
            // the four positions after a sentence start, closer ones weigh more.
            // a later sentence start overwrites the weights of an earlier one
            size_t window_end = std::min(num_tokens, i + 5);
            for (size_t j = i + 1; j < window_end; ++j){
                if (!lexical_sets.stopword_ids.count(tokens[j])){
                    sentence_start_weights[j] = 1. / static_cast<double>(j - i + 5);
                }
            }
        }

        if (lexical_sets.pronoun_ids.count(token)){
            working_log_probs[i] -= pronoun_penalty;
        }
    }

    double weights_sum = std::accumulate(sentence_start_weights.begin(), 
                                         sentence_start_weights.end(), 0.);
    if (!(weights_sum > 0.)){
        throw degenerateScoringError("no content token follows a sentence start");
    }

    double sentence_start_log_prob = 0.;
    for (size_t i = 0; i < num_tokens; ++i){
        // 0 * -inf would poison the sum with NaN
        if (sentence_start_weights[i] == 0.){
            continue;
        }
        sentence_start_log_prob += sentence_start_weights[i] / weights_sum * working_log_probs[i];
    }

    double mean_log_prob = std::accumulate(working_log_probs.begin(), 
                                           working_log_probs.end(), 0.) / static_cast<double>(num_tokens);

    VLOG(6) << "[scoring/smart_avg_log_prob]: mean log prob: " << mean_log_prob
            << ", sentence start log prob: " << sentence_start_log_prob;
    return .75 * mean_log_prob + .25 * sentence_start_log_prob;
}

    } // namespace scoring
} // namespace summ
