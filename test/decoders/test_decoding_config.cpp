#include <gtest/gtest.h>
#include "decoders/decoding_config.hpp"
#include "utils/errors.hpp"

using namespace summ;
using namespace summ::beam;


class decodingConfigTest : public testing::Test{
protected:
    decodingConfigTest(){};
    DecodingConfig config{};
};


TEST_F(decodingConfigTest, defaults_are_valid){
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.num_candidates(), 8u);
    EXPECT_EQ(config.max_results(), 16u);
    EXPECT_EQ(config.scoring_info.mode, SMART);
}


TEST_F(decodingConfigTest, reads_key_value_overrides){
    EXPECT_TRUE(config.set_from_string("beam_size=6"));
    EXPECT_TRUE(config.set_from_string("max_dec_steps=120"));
    EXPECT_TRUE(config.set_from_string("min_dec_steps=10"));
    EXPECT_TRUE(config.set_from_string("scoring=plain"));
    EXPECT_TRUE(config.set_from_string("threshold=5"));
    EXPECT_TRUE(config.set_from_string("pronoun_penalty=1.5"));

    EXPECT_EQ(config.beam_size, 6);
    EXPECT_EQ(config.max_dec_steps, 120);
    EXPECT_EQ(config.min_dec_steps, 10);
    EXPECT_EQ(config.scoring_info.mode, PLAIN);
    EXPECT_EQ(config.scoring_info.unknown_token_threshold, 5);
    EXPECT_FLOAT_EQ(config.scoring_info.pronoun_penalty, 1.5f);
}


TEST_F(decodingConfigTest, rejects_malformed_overrides){
    EXPECT_FALSE(config.set_from_string("beam_size"));
    EXPECT_FALSE(config.set_from_string("beam_size=wide"));
    EXPECT_FALSE(config.set_from_string("scoring=fancy"));
    EXPECT_FALSE(config.set_from_string("temperature=0.7"));
    EXPECT_EQ(config.beam_size, 4);
}


TEST_F(decodingConfigTest, validation_catches_bad_step_limits){
    config.set_dec_steps(50, 10);
    EXPECT_THROW(config.validate(), invalidConfigError);
    config.set_dec_steps(-1, 10);
    EXPECT_THROW(config.validate(), invalidConfigError);
    config.set_dec_steps(0, 0);
    EXPECT_THROW(config.validate(), invalidConfigError);
    config.set_dec_steps(10, 10);
    EXPECT_NO_THROW(config.validate());
}
