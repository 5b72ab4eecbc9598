#ifndef _SUMM_BEAM_ERRORS
#define _SUMM_BEAM_ERRORS

#include <stdexcept>
#include <string>

namespace summ{

/*
Hard failures of the decoding core. Soft disqualification of a hypothesis
(unknown tokens) is not an error, it is a sentinel score.
*/

// sequence lengths of a hypothesis do not line up, or a per-step
// quantity was requested from a hypothesis with no decoding steps
class malformedHypothesisError : public std::runtime_error{
public:
    explicit malformedHypothesisError(const std::string& what)
        : std::runtime_error("malformed hypothesis: " + what){}
};

// zero-sum sentence start weights in the smart score
class degenerateScoringError : public std::runtime_error{
public:
    explicit degenerateScoringError(const std::string& what)
        : std::runtime_error("degenerate scoring input: " + what){}
};

class invalidConfigError : public std::runtime_error{
public:
    explicit invalidConfigError(const std::string& what)
        : std::runtime_error("invalid decoding config: " + what){}
};

// the decode step returned tensors/vectors that do not match the query
class modelOutputError : public std::runtime_error{
public:
    explicit modelOutputError(const std::string& what)
        : std::runtime_error("invalid decode step output: " + what){}
};

// the search ran out of hypotheses before producing anything to rank
class searchExhaustedError : public std::runtime_error{
public:
    explicit searchExhaustedError(const std::string& what)
        : std::runtime_error(what){}
};

} // namespace summ

#endif // _SUMM_BEAM_ERRORS
