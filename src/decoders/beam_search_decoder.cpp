#include <glog/logging.h>
#include "decoders/beam_search_decoder.hpp"
#include "utils/errors.hpp"


namespace summ {
    namespace beam {

// constructors
beamSearchDecoder::beamSearchDecoder(DecodingConfig config) : _config(std::move(config)){
    _config.validate();
    DLOG(INFO) << "[beamSearchDecoder/constructor]: instance created with beam size " 
               << _config.beam_size << ", decoder steps [" << _config.min_dec_steps 
               << ", " << _config.max_dec_steps << "]";
}


// main steps
std::vector<Hypothesis> beamSearchDecoder::init_hypotheses(const DecodingInput& input) const {
    // every beam slot starts out identical
    std::vector<Hypothesis> hyps;
    hyps.reserve(_config.beam_size);
    for (int i = 0; i < _config.beam_size; ++i){
        hyps.emplace_back(_config.start_token_id, input.initial_state, 
                          coverageVec(input.attn_length, 0.f));
    }
    return hyps;
}


models::DecodeStepQuery beamSearchDecoder::build_query(const std::vector<Hypothesis>& hyps, 
                                                       const DecodingInput& input) const {
    models::DecodeStepQuery query;
    query.num_candidates = _config.num_candidates();
    query.latest_tokens.reserve(hyps.size());
    query.states.reserve(hyps.size());
    query.prev_coverage.reserve(hyps.size());

    for (const auto& hyp : hyps){
        // the model only knows the fixed vocabulary, article specific ids go back to [UNK]
        tokenId latest_token = hyp.latest_token();
        auto it = input.oov_id_map.find(latest_token);
        if (it != input.oov_id_map.end()){
            VLOG(5) << "[beamSearchDecoder/build_query]: mapping temporary id " << latest_token 
                    << " to " << it->second;
            latest_token = it->second;
        }
        query.latest_tokens.push_back(latest_token);
        query.states.push_back(hyp.get_state());
        query.prev_coverage.push_back(hyp.get_coverage());
    }
    return query;
}


std::vector<Hypothesis> beamSearchDecoder::expand_hypotheses(const std::vector<Hypothesis>& hyps,
                                                             const models::DecodeStepOutput& step_output,
                                                             size_t num_orig_hyps) const {
    size_t num_candidates = _config.num_candidates();
    std::vector<Hypothesis> all_hyps;
    all_hyps.reserve(num_orig_hyps * num_candidates);

    for (size_t i = 0; i < num_orig_hyps; ++i){
        // the children of one hypothesis share its new state, attention and coverage
        auto attn_dist = std::make_shared<const attnDist>(step_output.attn_dists[i]);
        auto coverage  = std::make_shared<const coverageVec>(step_output.new_coverages[i]);
        for (size_t j = 0; j < num_candidates; ++j){
            all_hyps.push_back(hyps[i].extend(step_output.topk_ids[i][j],
                                              step_output.topk_log_probs[i][j],
                                              step_output.new_states[i],
                                              attn_dist,
                                              step_output.p_gens[i],
                                              coverage));
        }
    }
    return all_hyps;
}


std::vector<Hypothesis> beamSearchDecoder::select_hypotheses(const std::vector<scoredHypothesis>& ranked,
                                                             int steps,
                                                             std::vector<Hypothesis>& results) const {
    const auto& scoring_info = _config.scoring_info;
    std::vector<Hypothesis> hyps;
    size_t beam_size   = static_cast<size_t>(_config.beam_size);
    size_t max_results = _config.max_results();

    for (const auto& [hyp, score] : ranked){
        tokenId latest_token = hyp.latest_token();
        if (latest_token == scoring_info.stop_token_id){
            // too short sequences are never accepted
            if (steps >= _config.min_dec_steps){
                VLOG(5) << "[beamSearchDecoder/select_hypotheses]: finished hypothesis of length " 
                        << hyp.size() << ", score: " << score;
                results.push_back(hyp);
            }
        }
        else if (latest_token >= scoring_info.unknown_token_threshold){
            hyps.push_back(hyp);
        }
        else{
            VLOG(6) << "[beamSearchDecoder/select_hypotheses]: dropping reserved token " << latest_token;
        }

        if (hyps.size() == beam_size || results.size() == max_results){
            break;
        }
    }
    return hyps;
}


// decoding interface
DecodingResult beamSearchDecoder::decode(const DecodingInput& input, 
                                         const models::decodeStepFn& decode_step) const {
    if (!decode_step){
        throw invalidConfigError("no decode step was provided");
    }

    std::vector<Hypothesis> hyps = init_hypotheses(input);
    std::vector<Hypothesis> results;
    size_t num_degenerate = 0;
    int steps = 0;

    while (steps < _config.max_dec_steps && results.size() < _config.max_results()){
        if (hyps.empty()){
            LOG(WARNING) << "[beamSearchDecoder/decode]: every candidate was dropped at step " 
                         << steps << ". Stopping early.";
            break;
        }

        auto query = build_query(hyps, input);
        models::DecodeStepOutput step_output = decode_step(query);
        step_output.validate(hyps.size(), query.num_candidates, input.attn_length);

        // all slots are identical on the first step, expanding more than one would duplicate beams
        size_t num_orig_hyps = (steps == 0) ? 1 : hyps.size();
        auto all_hyps = expand_hypotheses(hyps, step_output, num_orig_hyps);
        auto ranked = sort_hyps(all_hyps, _config.scoring_info, &num_degenerate);
        hyps = select_hypotheses(ranked, steps, results);

        VLOG(4) << "[beamSearchDecoder/decode]: step " << steps 
                << ", candidates: " << ranked.size()
                << ", live: " << hyps.size() 
                << ", results: " << results.size();
        ++steps;
    }

    if (num_degenerate > 0){
        LOG(WARNING) << "[beamSearchDecoder/decode]: " << num_degenerate 
                     << " candidates had no weighted token after a sentence start and were ranked last";
    }

    bool used_live_fallback = false;
    if (results.empty()){
        VLOG(3) << "[beamSearchDecoder/decode]: no stop token within " << steps 
                << " steps, ranking the live hypotheses";
        results = hyps;
        used_live_fallback = true;
    }

    auto best = best_hypothesis(results, _config.scoring_info);
    VLOG(3) << "[beamSearchDecoder/decode]: finished after " << steps << " steps"
            << ", results: " << results.size()
            << ", best length: " << best.hyp.size()
            << ", best score: " << best.score;
    return DecodingResult{best.hyp, best.score, static_cast<size_t>(steps), 
                          used_live_fallback ? 0 : results.size(), used_live_fallback};
}

    } // namespace beam
} // namespace summ
