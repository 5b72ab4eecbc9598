#include <sstream>
#include <algorithm>
#include <glog/logging.h>
#include "decoders/hypothesis.hpp"
#include "utils/errors.hpp"


namespace summ {
    namespace beam {

// constructors
Hypothesis::Hypothesis(nodePtr latest, size_t num_tokens, 
                       decoderState state, std::shared_ptr<const coverageVec> coverage)
    : _latest(std::move(latest)), _num_tokens(num_tokens), 
      _state(std::move(state)), _coverage(std::move(coverage)){}


Hypothesis::Hypothesis(tokenId start_token, decoderState state, coverageVec coverage)
    : _num_tokens(1), _state(std::move(state)){
    _latest = std::make_shared<const stepNode>(stepNode{start_token, 0.f, nullptr, std::nullopt, nullptr});
    _coverage = std::make_shared<const coverageVec>(std::move(coverage));
}


Hypothesis::Hypothesis(const std::vector<tokenId>& tokens,
                       const std::vector<float>& log_probs,
                       decoderState state,
                       const std::vector<attnDist>& attn_dists,
                       const std::vector<pGen>& p_gens,
                       coverageVec coverage)
    : _num_tokens(tokens.size()), _state(std::move(state)){
    if (tokens.empty() || 
        tokens.size() != log_probs.size() ||
        tokens.size() != attn_dists.size() + 1 ||
        tokens.size() != p_gens.size() + 1){
        std::ostringstream oss;
        oss << "tokens: " << tokens.size() << ", log probs: " << log_probs.size()
            << ", attention distributions: " << attn_dists.size() 
            << ", p_gens: " << p_gens.size();
        throw malformedHypothesisError(oss.str());
    }
    for (const auto& attn_dist : attn_dists){
        if (attn_dist.size() != coverage.size()){
            throw malformedHypothesisError("attention and coverage lengths differ");
        }
    }

    nodePtr node = std::make_shared<const stepNode>(
        stepNode{tokens[0], log_probs[0], nullptr, std::nullopt, nullptr});
    for (size_t i = 1; i < tokens.size(); ++i){
        node = std::make_shared<const stepNode>(
            stepNode{tokens[i], log_probs[i], 
                     std::make_shared<const attnDist>(attn_dists[i - 1]), 
                     p_gens[i - 1], node});
    }
    _latest = std::move(node);
    _coverage = std::make_shared<const coverageVec>(std::move(coverage));
}


// extension
Hypothesis Hypothesis::extend(tokenId token, float log_prob, decoderState state,
                              attnDist attn_dist, pGen p_gen, coverageVec coverage) const {
    return extend(token, log_prob, std::move(state), 
                  std::make_shared<const attnDist>(std::move(attn_dist)), p_gen, 
                  std::make_shared<const coverageVec>(std::move(coverage)));
}


Hypothesis Hypothesis::extend(tokenId token, float log_prob, decoderState state,
                              std::shared_ptr<const attnDist> attn_dist, pGen p_gen,
                              std::shared_ptr<const coverageVec> coverage) const {
    if (!attn_dist || !coverage){
        throw malformedHypothesisError("extension without attention or coverage");
    }
    if (attn_dist->size() != coverage->size()){
        std::ostringstream oss;
        oss << "attention length " << attn_dist->size() 
            << " does not match coverage length " << coverage->size();
        throw malformedHypothesisError(oss.str());
    }
    auto node = std::make_shared<const stepNode>(
        stepNode{token, log_prob, std::move(attn_dist), p_gen, _latest});
    return Hypothesis(std::move(node), _num_tokens + 1, std::move(state), std::move(coverage));
}


// getters
std::vector<tokenId> Hypothesis::get_tokens() const {
    std::vector<tokenId> tokens;
    tokens.reserve(_num_tokens);
    for (const stepNode* node = _latest.get(); node; node = node->parent.get()){
        tokens.push_back(node->token);
    }
    std::reverse(tokens.begin(), tokens.end());
    return tokens;
}


std::vector<float> Hypothesis::get_log_probs() const {
    std::vector<float> log_probs;
    log_probs.reserve(_num_tokens);
    for (const stepNode* node = _latest.get(); node; node = node->parent.get()){
        log_probs.push_back(node->log_prob);
    }
    std::reverse(log_probs.begin(), log_probs.end());
    return log_probs;
}


std::vector<attnDist> Hypothesis::get_attn_dists() const {
    std::vector<attnDist> attn_dists;
    attn_dists.reserve(num_steps());
    for (const stepNode* node = _latest.get(); node && node->parent; node = node->parent.get()){
        attn_dists.push_back(*node->attn_dist);
    }
    std::reverse(attn_dists.begin(), attn_dists.end());
    return attn_dists;
}


std::vector<pGen> Hypothesis::get_p_gens() const {
    std::vector<pGen> p_gens;
    p_gens.reserve(num_steps());
    for (const stepNode* node = _latest.get(); node && node->parent; node = node->parent.get()){
        p_gens.push_back(node->p_gen);
    }
    std::reverse(p_gens.begin(), p_gens.end());
    return p_gens;
}


std::vector<const attnDist*> Hypothesis::attn_history() const {
    std::vector<const attnDist*> attn_dists;
    attn_dists.reserve(num_steps());
    for (const stepNode* node = _latest.get(); node && node->parent; node = node->parent.get()){
        attn_dists.push_back(node->attn_dist.get());
    }
    std::reverse(attn_dists.begin(), attn_dists.end());
    return attn_dists;
}


// scoring
bool Hypothesis::has_unknown_token(tokenId stop_token_id, tokenId unknown_token_threshold) const {
    return scoring::has_unknown_token(get_tokens(), stop_token_id, unknown_token_threshold);
}


double Hypothesis::avg_log_prob(tokenId stop_token_id, tokenId unknown_token_threshold) const {
    return scoring::avg_log_prob(get_tokens(), get_log_probs(), 
                                 stop_token_id, unknown_token_threshold);
}


double Hypothesis::repeated_n_gram_loss(size_t n) const {
    return scoring::repeated_n_gram_loss(get_tokens(), n);
}


double Hypothesis::cov_loss() const {
    if (num_steps() == 0){
        throw malformedHypothesisError("coverage loss requested before any decoding step");
    }
    return scoring::coverage_loss(attn_history());
}


double Hypothesis::avg_top_attn() const {
    return scoring::avg_top_attention(get_attn_dists());
}


double Hypothesis::smart_avg_log_prob(const LexicalSets& lexical_sets, float pronoun_penalty) const {
    return scoring::smart_avg_log_prob(get_tokens(), get_log_probs(), lexical_sets, pronoun_penalty);
}


double Hypothesis::score(const ScoringInfo& scoring_info) const {
    auto tokens = get_tokens();
    if (scoring::has_unknown_token(tokens, scoring_info.stop_token_id, 
                                   scoring_info.unknown_token_threshold)){
        return DISQUALIFIED_SCORE;
    }

    double smart_log_prob = scoring::smart_avg_log_prob(tokens, get_log_probs(), 
                                                        scoring_info.lexical_sets,
                                                        scoring_info.pronoun_penalty);
    double n_gram_loss = scoring::repeated_n_gram_loss(tokens, scoring_info.disallowed_n);
    // a hypothesis without decoding steps has nothing to cover yet
    double coverage_loss = scoring::coverage_loss(attn_history());

    VLOG(6) << "[Hypothesis/score]: smart log prob: " << smart_log_prob
            << ", n-gram loss: " << n_gram_loss
            << ", coverage loss: " << coverage_loss;
    return smart_log_prob - n_gram_loss - coverage_loss;
}

    } // namespace beam
} // namespace summ
