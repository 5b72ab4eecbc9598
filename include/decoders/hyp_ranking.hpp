#ifndef _SUMM_BEAM_HYP_RANKING
#define _SUMM_BEAM_HYP_RANKING

#include <vector>
#include "decoders/hypothesis.hpp"
#include "decoders/scoring.hpp"

namespace summ {
    namespace beam {

struct scoredHypothesis{
    Hypothesis hyp;
    double score;
};


/*
Score under the active mode: score() for SMART, avg_log_prob() for PLAIN.
Degenerate smart scores and non finite results come back as DISQUALIFIED_SCORE.
*/
double score_hypothesis(const Hypothesis& hyp, const ScoringInfo& scoring_info);

/*
Stable sort, best first. Hypotheses with equal scores keep their input
order. Each score is computed once. When num_degenerate is given, it is
incremented for every hypothesis whose smart weights summed to zero.
*/
std::vector<scoredHypothesis> sort_hyps(const std::vector<Hypothesis>& hyps, 
                                        const ScoringInfo& scoring_info,
                                        size_t* num_degenerate = nullptr);

// sort_hyps(hyps)[0]; throws searchExhaustedError on an empty set
scoredHypothesis best_hypothesis(const std::vector<Hypothesis>& hyps, 
                                 const ScoringInfo& scoring_info);

    } // namespace beam
} // namespace summ

#endif // _SUMM_BEAM_HYP_RANKING
