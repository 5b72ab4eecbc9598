#include <algorithm>
#include <cmath>
#include <glog/logging.h>
#include "decoders/hyp_ranking.hpp"
#include "utils/errors.hpp"


namespace summ {
    namespace beam {

namespace {

double raw_score(const Hypothesis& hyp, const ScoringInfo& scoring_info, size_t* num_degenerate){
    switch (scoring_info.mode){
        case SMART:
            try{
                return hyp.score(scoring_info);
            }
            catch (const degenerateScoringError& e){
                /*
                nothing after any sentence start carries weight (e.g. "[START] the").
                The hypothesis has to stay comparable with the others, so it is
                ranked like a disqualified one.
                */
                VLOG(5) << "[hyp_ranking/score_hypothesis]: " << e.what() 
                        << ". Ranking hypothesis ending in " << hyp.latest_token() << " last.";
                if (num_degenerate){
                    ++(*num_degenerate);
                }
                return DISQUALIFIED_SCORE;
            }
        case PLAIN:
            return hyp.avg_log_prob(scoring_info.stop_token_id, scoring_info.unknown_token_threshold);
        default:
            throw invalidConfigError("unknown scoring mode");
    }
}

double checked_score(const Hypothesis& hyp, const ScoringInfo& scoring_info, size_t* num_degenerate){
    double score = raw_score(hyp, scoring_info, num_degenerate);
    // NaN breaks the ordering of sort_hyps, -inf would tie with every other -inf
    if (!std::isfinite(score)){
        VLOG(5) << "[hyp_ranking/score_hypothesis]: non finite score " << score
                << " for hypothesis ending in " << hyp.latest_token();
        return DISQUALIFIED_SCORE;
    }
    return score;
}

} // namespace


double score_hypothesis(const Hypothesis& hyp, const ScoringInfo& scoring_info){
    return checked_score(hyp, scoring_info, nullptr);
}


std::vector<scoredHypothesis> sort_hyps(const std::vector<Hypothesis>& hyps, 
                                        const ScoringInfo& scoring_info,
                                        size_t* num_degenerate){
    std::vector<scoredHypothesis> scored_hyps;
    scored_hyps.reserve(hyps.size());
    for (const auto& hyp : hyps){
        scored_hyps.push_back({hyp, checked_score(hyp, scoring_info, num_degenerate)});
    }

    std::stable_sort(scored_hyps.begin(), scored_hyps.end(), 
        [](const scoredHypothesis& left, const scoredHypothesis& right){
            return left.score > right.score;
        });
    return scored_hyps;
}


scoredHypothesis best_hypothesis(const std::vector<Hypothesis>& hyps, 
                                 const ScoringInfo& scoring_info){
    if (hyps.empty()){
        throw searchExhaustedError("no hypotheses to rank");
    }
    auto ranked = sort_hyps(hyps, scoring_info);
    return ranked.front();
}

    } // namespace beam
} // namespace summ
