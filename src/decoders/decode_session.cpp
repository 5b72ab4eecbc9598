#include <chrono>
#include <numeric>
#include <glog/logging.h>
#include "decoders/decode_session.hpp"


namespace summ {
    namespace beam {

std::optional<double> sessionStats::mean_score() const {
    if (scores.empty()){
        return std::nullopt;
    }
    return std::accumulate(scores.begin(), scores.end(), 0.) / static_cast<double>(scores.size());
}


decodeSession::decodeSession(DecodingConfig config) : _decoder(std::move(config)){
    LOG(INFO) << "[decodeSession/constructor]: session created with beam size " 
              << _decoder.get_config().beam_size;
}


decodeSession::~decodeSession(){
    DLOG(INFO) << "[decodeSession/destructor]: decoded " << _stats.num_decoded 
               << ", failed " << _stats.num_failed;
}


std::optional<DecodingResult> decodeSession::decode_next(const DecodingInput& input,
                                                         const models::decodeStepFn& decode_step){
    auto t_start = std::chrono::steady_clock::now();
    try{
        DecodingResult result = _decoder.decode(input, decode_step);
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - t_start;

        _stats.scores.push_back(result.score);
        _stats.total_seconds += elapsed.count();
        ++_stats.num_decoded;

        LOG(INFO) << "[decodeSession/decode_next]: time to decode one example: " 
                  << elapsed.count() << "s";
        LOG(INFO) << "[decodeSession/decode_next]: mean score: " << _stats.mean_score().value();
        return result;
    }
    catch (const std::exception& e){
        // the failure only concerns this input
        ++_stats.num_failed;
        LOG(ERROR) << "[decodeSession/decode_next]: decoding input " 
                   << (_stats.num_decoded + _stats.num_failed) << " failed: " << e.what();
        return std::nullopt;
    }
}

    } // namespace beam
} // namespace summ
