#ifndef _SUMM_BEAM_BEAM_SEARCH_DECODER
#define _SUMM_BEAM_BEAM_SEARCH_DECODER

#include <vector>
#include "decoders/hypothesis.hpp"
#include "decoders/hyp_ranking.hpp"
#include "decoders/decoding_config.hpp"
#include "models/decode_step.hpp"

namespace summ {
    namespace beam {

struct DecodingResult{
    Hypothesis best_hyp;
    double score;
    size_t steps = 0;
    size_t num_results = 0;          // finished hypotheses collected
    bool used_live_fallback = false; // no stop token was emitted, live hypotheses were ranked instead
};


class beamSearchDecoder{

private:
    DecodingConfig _config;

public:
    explicit beamSearchDecoder(DecodingConfig config);

    // top level: runs the search for one input to completion
    DecodingResult decode(const DecodingInput& input, 
                          const models::decodeStepFn& decode_step) const;

    const DecodingConfig& get_config() const {return _config;}

    // main steps
    std::vector<Hypothesis> init_hypotheses(const DecodingInput& input) const;
    models::DecodeStepQuery build_query(const std::vector<Hypothesis>& hyps, 
                                        const DecodingInput& input) const;
    std::vector<Hypothesis> expand_hypotheses(const std::vector<Hypothesis>& hyps,
                                              const models::DecodeStepOutput& step_output,
                                              size_t num_orig_hyps) const;

    /*
    Walks the ranked children once. Stop-token children go to results (only
    once steps >= min_dec_steps), unknown-token children are dropped and the
    rest become the next live set. Returns the next live set.
    */
    std::vector<Hypothesis> select_hypotheses(const std::vector<scoredHypothesis>& ranked,
                                              int steps,
                                              std::vector<Hypothesis>& results) const;
};

    } // namespace beam
} // namespace summ

#endif // _SUMM_BEAM_BEAM_SEARCH_DECODER
