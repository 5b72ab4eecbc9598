#ifndef _SUMM_BEAM_DECODE_STEP
#define _SUMM_BEAM_DECODE_STEP

#include <vector>
#include <functional>
#include "decoders/decoding_types.hpp"

namespace summ {
    namespace models {

// one entry per live hypothesis
struct DecodeStepQuery{
    std::vector<tokenId> latest_tokens;      // temporary OOV ids already mapped to [UNK]
    std::vector<decoderState> states;
    std::vector<coverageVec> prev_coverage;
    size_t num_candidates = 0;               // top-k to return per hypothesis

    size_t size() const {return latest_tokens.size();}
};


struct DecodeStepOutput{
    std::vector<std::vector<tokenId>> topk_ids;
    std::vector<std::vector<float>> topk_log_probs;
    std::vector<decoderState> new_states;
    std::vector<attnDist> attn_dists;
    std::vector<pGen> p_gens;
    std::vector<coverageVec> new_coverages;

    /*
    throws modelOutputError unless every field has one entry per hypothesis,
    each hypothesis has at least num_candidates candidates and all attention
    and coverage vectors are attn_length long
    */
    void validate(size_t num_hyps, size_t num_candidates, size_t attn_length) const;
};


/*
The single capability the search needs from a model. Any callable with this
shape will do; exceptions thrown by it reach the caller of the search as they are.
*/
typedef std::function<DecodeStepOutput(const DecodeStepQuery&)> decodeStepFn;

    } // namespace models
} // namespace summ

#endif // _SUMM_BEAM_DECODE_STEP
