#ifndef _SUMM_BEAM_DECODING_TYPES
#define _SUMM_BEAM_DECODING_TYPES

#include <any>
#include <vector>
#include <optional>

namespace summ {

typedef int tokenId;
typedef std::vector<float> attnDist;      // one weight per input position
typedef std::vector<float> coverageVec;   // running sum of attention distributions
typedef std::optional<float> pGen;        // empty when the model has no copy mechanism

/*
The decoder state is opaque to the search. Whatever the model puts in here
(a tensor, an LSTM tuple, a plain vector in tests) is handed back to it on
the next step untouched.
*/
typedef std::any decoderState;

} // namespace summ

#endif // _SUMM_BEAM_DECODING_TYPES
