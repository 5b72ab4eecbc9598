#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <vector>
#include "decoders/scoring.hpp"
#include "decoders/hyp_ranking.hpp"
#include "utils/errors.hpp"

using namespace summ;
using namespace summ::beam;


class scoringTest : public testing::Test{
protected:
    scoringTest(){
        lexical_sets.start_sent_ids = {2, 5}; // [START] and "."
        lexical_sets.stopword_ids   = {20};
        lexical_sets.pronoun_ids    = {30};

        scoring_info.stop_token_id = 3;
        scoring_info.unknown_token_threshold = 4;
        scoring_info.lexical_sets = lexical_sets;
    };

    LexicalSets lexical_sets;
    ScoringInfo scoring_info;

    Hypothesis make_hyp(const std::vector<tokenId>& tokens, const std::vector<float>& log_probs, int tag = 0){
        size_t num_steps = tokens.size() - 1;
        std::vector<attnDist> attn_dists;
        for (size_t i = 0; i < num_steps; ++i){
            // one hot attention on a new position each step, so no coverage loss
            attnDist attn(num_steps, 0.f);
            attn[i] = 1.f;
            attn_dists.push_back(attn);
        }
        return Hypothesis(tokens, log_probs, decoderState(tag), attn_dists, 
                          std::vector<pGen>(num_steps), coverageVec(num_steps, 1.f));
    }
};


TEST_F(scoringTest, weights_positions_after_the_sentence_start){
    // weights 1/6, 1/7, 1/8 on positions 1..3
    double score = scoring::smart_avg_log_prob({2, 10, 11, 12}, {0.f, -1.f, -2.f, -3.f}, lexical_sets);
    EXPECT_NEAR(score, -1.601027397260274, 1e-9);
}


TEST_F(scoringTest, window_covers_four_following_tokens){
    double score = scoring::smart_avg_log_prob({2, 10, 11, 12, 13, 14, 15}, 
                                               {0.f, -1.f, -1.f, -1.f, -1.f, -1.f, -1.f}, lexical_sets);
    EXPECT_NEAR(score, -0.8928571428571428, 1e-9);
}


TEST_F(scoringTest, pronouns_are_penalized){
    LexicalSets sets;
    sets.start_sent_ids = {2};
    sets.pronoun_ids = {10};
    double score = scoring::smart_avg_log_prob({2, 10, 11}, {0.f, -1.f, -1.f}, sets);
    EXPECT_NEAR(score, -1.0576923076923075, 1e-6);

    // a larger penalty only lowers the score
    double harsher = scoring::smart_avg_log_prob({2, 10, 11}, {0.f, -1.f, -1.f}, sets, 2.f);
    EXPECT_LT(harsher, score);
}


TEST_F(scoringTest, stopwords_get_no_weight){
    // only position 2 keeps a weight, the sentence start term is its log prob
    double score = scoring::smart_avg_log_prob({2, 20, 11}, {0.f, -1.f, -2.f}, lexical_sets);
    EXPECT_NEAR(score, -1.25, 1e-9);
}


TEST_F(scoringTest, later_sentence_start_overwrites_weights){
    // position 3 is weighted 1/6 from the "." at position 2, not 1/8 from [START]
    double score = scoring::smart_avg_log_prob({2, 10, 5, 11}, {0.f, -1.f, -2.f, -3.f}, lexical_sets);
    EXPECT_NEAR(score, -1.625, 1e-9);
}


TEST_F(scoringTest, no_weighted_position_is_a_scoring_error){
    EXPECT_THROW(scoring::smart_avg_log_prob({2, 20}, {0.f, -1.f}, lexical_sets), degenerateScoringError);
    EXPECT_THROW(scoring::smart_avg_log_prob({2}, {0.f}, lexical_sets), degenerateScoringError);
    EXPECT_THROW(scoring::smart_avg_log_prob({10, 11}, {0.f, -1.f}, lexical_sets), degenerateScoringError);
}


TEST_F(scoringTest, coverage_loss_without_steps_is_zero){
    EXPECT_DOUBLE_EQ(scoring::coverage_loss(std::vector<attnDist>{}), 0.);
}


TEST_F(scoringTest, coverage_loss_rejects_ragged_attention){
    EXPECT_THROW(scoring::coverage_loss({attnDist{1.f, 0.f}, attnDist{1.f}}), malformedHypothesisError);
}


TEST_F(scoringTest, sort_hyps_orders_best_first){
    scoring_info.set_mode(PLAIN);
    std::vector<Hypothesis> hyps{
        make_hyp({2, 10, 11}, {0.f, -3.f, -3.f}, 0),
        make_hyp({2, 10, 12}, {0.f, -1.f, -1.f}, 1),
        make_hyp({2, 10, 13}, {0.f, -2.f, -2.f}, 2)
    };
    auto ranked = sort_hyps(hyps, scoring_info);
    ASSERT_EQ(ranked.size(), 3u);
    EXPECT_EQ(ranked[0].hyp.latest_token(), 12);
    EXPECT_EQ(ranked[1].hyp.latest_token(), 13);
    EXPECT_EQ(ranked[2].hyp.latest_token(), 11);
    EXPECT_DOUBLE_EQ(ranked[0].score, -2. / 3.);
}


TEST_F(scoringTest, sort_hyps_is_stable_for_equal_scores){
    for (auto mode : {PLAIN, SMART}){
        scoring_info.set_mode(mode);
        std::vector<Hypothesis> hyps;
        for (int tag = 0; tag < 6; ++tag){
            hyps.push_back(make_hyp({2, 10, 11}, {0.f, -1.f, -1.f}, tag));
        }
        auto ranked = sort_hyps(hyps, scoring_info);
        for (int tag = 0; tag < 6; ++tag){
            EXPECT_EQ(std::any_cast<int>(ranked[tag].hyp.get_state()), tag);
        }
    }
}


TEST_F(scoringTest, disqualified_hypotheses_rank_last){
    scoring_info.set_mode(SMART);
    std::vector<Hypothesis> hyps{
        make_hyp({2, 1, 11}, {0.f, 0.f, 0.f}, 0),       // interior unknown token
        make_hyp({2, 10, 11}, {0.f, -5.f, -5.f}, 1)
    };
    auto ranked = sort_hyps(hyps, scoring_info);
    EXPECT_EQ(std::any_cast<int>(ranked[0].hyp.get_state()), 1);
    EXPECT_DOUBLE_EQ(ranked[1].score, DISQUALIFIED_SCORE);
}


TEST_F(scoringTest, degenerate_smart_score_ranks_like_disqualified){
    scoring_info.set_mode(SMART);
    std::vector<Hypothesis> hyps{
        make_hyp({2, 20}, {0.f, -0.1f}, 0),             // only a stopword after [START]
        make_hyp({2, 10}, {0.f, -5.f}, 1)
    };
    auto ranked = sort_hyps(hyps, scoring_info);
    EXPECT_EQ(std::any_cast<int>(ranked[0].hyp.get_state()), 1);
    EXPECT_DOUBLE_EQ(ranked[1].score, DISQUALIFIED_SCORE);
    // asked directly, the hypothesis reports the problem
    EXPECT_THROW(hyps[0].score(scoring_info), degenerateScoringError);
}


TEST_F(scoringTest, plain_and_smart_modes_can_disagree){
    // the pronoun only matters to the smart score
    std::vector<Hypothesis> hyps{
        make_hyp({2, 30, 11}, {0.f, -1.f, -1.f}, 0),
        make_hyp({2, 10, 11}, {0.f, -1.2f, -1.f}, 1)
    };
    scoring_info.set_mode(PLAIN);
    EXPECT_EQ(std::any_cast<int>(best_hypothesis(hyps, scoring_info).hyp.get_state()), 0);
    scoring_info.set_mode(SMART);
    EXPECT_EQ(std::any_cast<int>(best_hypothesis(hyps, scoring_info).hyp.get_state()), 1);
}


TEST_F(scoringTest, best_of_nothing_is_an_error){
    EXPECT_THROW(best_hypothesis({}, scoring_info), searchExhaustedError);
}


TEST_F(scoringTest, infinite_log_prob_on_unweighted_position_is_not_nan){
    const float neg_inf = -std::numeric_limits<float>::infinity();
    // the stopword at position 1 carries no weight, only the mean sees -inf
    double score = scoring::smart_avg_log_prob({2, 20, 11}, {0.f, neg_inf, -1.f}, lexical_sets);
    EXPECT_FALSE(std::isnan(score));
    EXPECT_TRUE(std::isinf(score));
    EXPECT_LT(score, 0.);
}


TEST_F(scoringTest, non_finite_scores_rank_last){
    const float neg_inf = -std::numeric_limits<float>::infinity();
    scoring_info.set_mode(SMART);
    std::vector<Hypothesis> hyps{
        make_hyp({2, 10, 11}, {0.f, -5.f, -5.f}, 0),
        make_hyp({2, 20, 12}, {0.f, neg_inf, -1.f}, 1),
        make_hyp({2, 10, 13}, {0.f, -1.f, -1.f}, 2)
    };
    auto ranked = sort_hyps(hyps, scoring_info);
    ASSERT_EQ(ranked.size(), 3u);
    EXPECT_EQ(std::any_cast<int>(ranked[0].hyp.get_state()), 2);
    EXPECT_EQ(std::any_cast<int>(ranked[1].hyp.get_state()), 0);
    EXPECT_EQ(std::any_cast<int>(ranked[2].hyp.get_state()), 1);
    EXPECT_DOUBLE_EQ(ranked[2].score, DISQUALIFIED_SCORE);
    EXPECT_DOUBLE_EQ(score_hypothesis(hyps[1], scoring_info), DISQUALIFIED_SCORE);
}


TEST_F(scoringTest, sort_hyps_counts_degenerate_smart_scores){
    scoring_info.set_mode(SMART);
    std::vector<Hypothesis> hyps{
        make_hyp({2, 20}, {0.f, -0.1f}, 0),
        make_hyp({2, 10}, {0.f, -5.f}, 1),
        make_hyp({2, 20}, {0.f, -0.2f}, 2)
    };
    size_t num_degenerate = 0;
    sort_hyps(hyps, scoring_info, &num_degenerate);
    EXPECT_EQ(num_degenerate, 2u);

    // unknown tokens are disqualified, not degenerate
    num_degenerate = 0;
    sort_hyps({make_hyp({2, 1, 11}, {0.f, 0.f, 0.f})}, scoring_info, &num_degenerate);
    EXPECT_EQ(num_degenerate, 0u);
}
