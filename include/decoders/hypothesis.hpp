#ifndef _SUMM_BEAM_HYPOTHESIS
#define _SUMM_BEAM_HYPOTHESIS

#include <memory>
#include <vector>
#include <optional>
#include "decoders/decoding_types.hpp"
#include "decoders/scoring.hpp"

namespace summ {
    namespace beam {

/*
One candidate output sequence during the search. A Hypothesis is a value:
extend() returns a new one and never touches the parent. The per-step
history (token, log prob, attention, p_gen) is kept as a chain of shared
nodes so that the 2*beam_size children of a hypothesis share its prefix
instead of copying it on every step.
*/
class Hypothesis{
private:
    struct stepNode{
        tokenId token;
        float log_prob;
        std::shared_ptr<const attnDist> attn_dist; // null for the start token
        pGen p_gen;
        std::shared_ptr<const stepNode> parent;
    };
    typedef std::shared_ptr<const stepNode> nodePtr;

    nodePtr _latest;
    size_t _num_tokens;
    decoderState _state;
    std::shared_ptr<const coverageVec> _coverage;

    Hypothesis(nodePtr latest, size_t num_tokens, 
               decoderState state, std::shared_ptr<const coverageVec> coverage);

    // attention of every step, oldest first, pointing into the shared nodes
    std::vector<const attnDist*> attn_history() const;

public:
    // root hypothesis: start token with log prob 0, no attention history
    Hypothesis(tokenId start_token, decoderState state, coverageVec coverage);

    // full history, checked against the length invariants
    Hypothesis(const std::vector<tokenId>& tokens,
               const std::vector<float>& log_probs,
               decoderState state,
               const std::vector<attnDist>& attn_dists,
               const std::vector<pGen>& p_gens,
               coverageVec coverage);

    Hypothesis extend(tokenId token, float log_prob, decoderState state,
                      attnDist attn_dist, pGen p_gen, coverageVec coverage) const;

    // same, for children of one parent sharing the step's attention and coverage
    Hypothesis extend(tokenId token, float log_prob, decoderState state,
                      std::shared_ptr<const attnDist> attn_dist, pGen p_gen,
                      std::shared_ptr<const coverageVec> coverage) const;

    // getters
    tokenId latest_token() const {return _latest->token;}
    size_t size() const {return _num_tokens;}
    size_t num_steps() const {return _num_tokens - 1;}
    const decoderState& get_state() const {return _state;}
    const coverageVec& get_coverage() const {return *_coverage;}
    std::vector<tokenId> get_tokens() const;
    std::vector<float> get_log_probs() const;
    std::vector<attnDist> get_attn_dists() const;
    std::vector<pGen> get_p_gens() const;

    // scoring
    bool has_unknown_token(tokenId stop_token_id, tokenId unknown_token_threshold) const;
    double avg_log_prob(tokenId stop_token_id, tokenId unknown_token_threshold) const;
    double repeated_n_gram_loss(size_t n = 3) const;
    double cov_loss() const;
    double avg_top_attn() const;
    double smart_avg_log_prob(const LexicalSets& lexical_sets, float pronoun_penalty = 0.8) const;
    double score(const ScoringInfo& scoring_info) const;
};

    } // namespace beam
} // namespace summ

#endif // _SUMM_BEAM_HYPOTHESIS
