#ifndef _SUMM_BEAM_DECODE_SESSION
#define _SUMM_BEAM_DECODE_SESSION

#include <vector>
#include <optional>
#include "decoders/beam_search_decoder.hpp"

namespace summ {
    namespace beam {

struct sessionStats{
    size_t num_decoded = 0;
    size_t num_failed  = 0;
    std::vector<double> scores;
    double total_seconds = 0.;

    std::optional<double> mean_score() const;
};


/*
Decodes inputs one after the other with the same configuration. A failing
input (model error, malformed output) is logged and counted and the session
carries on with the next one.
*/
class decodeSession{

private:
    beamSearchDecoder _decoder;
    sessionStats _stats;

public:
    explicit decodeSession(DecodingConfig config);
    ~decodeSession();

    std::optional<DecodingResult> decode_next(const DecodingInput& input,
                                              const models::decodeStepFn& decode_step);

    // getters
    const sessionStats& get_stats() const {return _stats;}
    const beamSearchDecoder& get_decoder() const {return _decoder;}
};

    } // namespace beam
} // namespace summ

#endif // _SUMM_BEAM_DECODE_SESSION
