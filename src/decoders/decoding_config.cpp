#include <sstream>
#include <stdexcept>
#include <string>
#include <glog/logging.h>
#include "decoders/decoding_config.hpp"
#include "utils/errors.hpp"


namespace summ {
    namespace beam {

void DecodingConfig::validate() const {
    std::ostringstream oss;
    if (beam_size < 1){
        oss << "beam_size must be positive, got " << beam_size;
    }
    else if (max_dec_steps < 1){
        oss << "max_dec_steps must be positive, got " << max_dec_steps;
    }
    else if (min_dec_steps < 0 || min_dec_steps > max_dec_steps){
        oss << "min_dec_steps must lie in [0, " << max_dec_steps << "], got " << min_dec_steps;
    }
    else if (results_factor < 1){
        oss << "results_factor must be positive, got " << results_factor;
    }
    else if (scoring_info.disallowed_n == 0){
        oss << "disallowed_n must be positive";
    }
    else{
        return;
    }
    throw invalidConfigError(oss.str());
}


bool DecodingConfig::set_from_string(const std::string& key_value){
    auto separator = key_value.find('=');
    if (separator == std::string::npos){
        LOG(WARNING) << "[DecodingConfig/set_from_string]: expected key=value, got " << key_value;
        return false;
    }
    std::string key   = key_value.substr(0, separator);
    std::string value = key_value.substr(separator + 1);

    try{
        if (key == "beam_size")              beam_size = std::stoi(value);
        else if (key == "max_dec_steps")     max_dec_steps = std::stoi(value);
        else if (key == "min_dec_steps")     min_dec_steps = std::stoi(value);
        else if (key == "threshold")         scoring_info.unknown_token_threshold = std::stoi(value);
        else if (key == "pronoun_penalty")   scoring_info.pronoun_penalty = std::stof(value);
        else if (key == "scoring"){
            if (value == "plain")            scoring_info.mode = PLAIN;
            else if (value == "smart")       scoring_info.mode = SMART;
            else{
                LOG(WARNING) << "[DecodingConfig/set_from_string]: unknown scoring mode " << value;
                return false;
            }
        }
        else{
            LOG(WARNING) << "[DecodingConfig/set_from_string]: unknown key " << key;
            return false;
        }
    }
    catch (const std::logic_error& e){ // std::invalid_argument, std::out_of_range
        LOG(WARNING) << "[DecodingConfig/set_from_string]: could not parse " << value 
                     << " for " << key << ": " << e.what();
        return false;
    }

    VLOG(1) << "[DecodingConfig/set_from_string]: " << key << " set to " << value;
    return true;
}

    } // namespace beam
} // namespace summ
