#ifndef _SUMM_BEAM_DECODING_CONFIG
#define _SUMM_BEAM_DECODING_CONFIG

#include <string>
#include <unordered_map>
#include "decoders/decoding_types.hpp"
#include "decoders/scoring.hpp"

namespace summ {
    namespace beam {

/*
All the tunables of one search. Passed by value to the decoder, nothing is
read from global state, so differently configured decoders can run side
by side.
*/
struct DecodingConfig{
    int beam_size = 4;
    int max_dec_steps = 100;
    int min_dec_steps = 35;        // stop tokens before this step are dropped
    int results_factor = 4;        // stop once results_factor * beam_size hypotheses finished
    tokenId start_token_id = 2;
    tokenId unknown_token_id = 1;  // what temporary OOV ids are mapped to before querying the model
    ScoringInfo scoring_info{};    // stop token, unknown threshold, mode, lexical sets

    // getters
    size_t num_candidates() const {return 2 * static_cast<size_t>(beam_size);}
    size_t max_results() const {return static_cast<size_t>(results_factor) * beam_size;}
    tokenId stop_token_id() const {return scoring_info.stop_token_id;}

    // setters
    void set_beam_size(int new_beam_size){beam_size = new_beam_size;}
    void set_dec_steps(int new_min, int new_max){min_dec_steps = new_min; max_dec_steps = new_max;}
    void set_scoring_mode(scoringMode new_mode){scoring_info.mode = new_mode;}

    // throws invalidConfigError
    void validate() const;

    /*
    key=value overrides coming from the command line: beam_size, max_dec_steps,
    min_dec_steps, scoring (plain|smart), threshold, pronoun_penalty.
    Returns false on an unknown key or a value that does not parse.
    */
    bool set_from_string(const std::string& key_value);
};


// what changes from one input to the next
struct DecodingInput{
    decoderState initial_state;
    size_t attn_length = 0;                                // number of input positions
    std::unordered_map<tokenId, tokenId> oov_id_map{};     // article specific id -> unknown_token_id
};

    } // namespace beam
} // namespace summ

#endif // _SUMM_BEAM_DECODING_CONFIG
