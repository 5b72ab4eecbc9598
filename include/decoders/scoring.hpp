#ifndef _SUMM_BEAM_SCORING
#define _SUMM_BEAM_SCORING

#include <vector>
#include <utility>
#include <unordered_set>
#include "decoders/decoding_types.hpp"

namespace summ {

// a hypothesis holding an unknown token always loses against a valid one
constexpr double DISQUALIFIED_SCORE     = -1e6;
constexpr double REPEATED_NGRAM_PENALTY = 1e6;

enum scoringMode {
    PLAIN = 1, // average log prob per token
    SMART = 2  // sentence start weighting, pronoun/repetition/coverage penalties
};


struct LexicalSets{
    std::unordered_set<tokenId> start_sent_ids;  // start token and sentence ending punctuation
    std::unordered_set<tokenId> stopword_ids;
    std::unordered_set<tokenId> pronoun_ids;
};


struct ScoringInfo{
    tokenId stop_token_id = 3;
    tokenId unknown_token_threshold = 4; // ids below this are reserved/unknown
    scoringMode mode = SMART;
    LexicalSets lexical_sets{};
    size_t disallowed_n = 3;
    float pronoun_penalty = 0.8;

    // setters
    void set_mode(scoringMode new_mode){mode = new_mode;}
    void set_lexical_sets(LexicalSets new_sets){lexical_sets = std::move(new_sets);}
};


namespace scoring {

/*
Pure scoring functions over the raw sequences of a hypothesis. The
Hypothesis methods forward here; keeping them free makes them easy to
check on hand written sequences.
*/

bool has_unknown_token(const std::vector<tokenId>& tokens, 
                       tokenId stop_token_id, 
                       tokenId unknown_token_threshold);

// sum(log_probs) / tokens.size(); the start token counts in the denominator
double avg_log_prob(const std::vector<tokenId>& tokens,
                    const std::vector<float>& log_probs,
                    tokenId stop_token_id,
                    tokenId unknown_token_threshold);

// REPEATED_NGRAM_PENALTY as soon as one n-gram shows up twice, 0 otherwise
double repeated_n_gram_loss(const std::vector<tokenId>& tokens, size_t n = 3);

// mean over steps of sum(min(attn_t, coverage_t)); 0 when there are no steps
double coverage_loss(const std::vector<attnDist>& attn_dists);

// same, over attention held elsewhere (e.g. shared by a hypothesis chain), oldest first
double coverage_loss(const std::vector<const attnDist*>& attn_dists);

// mean of the max attention weight of each step, throws on zero steps
double avg_top_attention(const std::vector<attnDist>& attn_dists);

// throws degenerateScoringError when no position gets a sentence start weight
double smart_avg_log_prob(const std::vector<tokenId>& tokens,
                          const std::vector<float>& log_probs,
                          const LexicalSets& lexical_sets,
                          float pronoun_penalty = 0.8);

} // namespace scoring
} // namespace summ

#endif // _SUMM_BEAM_SCORING
