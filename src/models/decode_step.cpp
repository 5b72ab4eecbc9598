#include <sstream>
#include "models/decode_step.hpp"
#include "utils/errors.hpp"


namespace summ {
    namespace models {

void DecodeStepOutput::validate(size_t num_hyps, size_t num_candidates, size_t attn_length) const {
    auto check_size = [num_hyps](size_t actual, const char* field){
        if (actual != num_hyps){
            std::ostringstream oss;
            oss << field << " has " << actual << " entries for " << num_hyps << " hypotheses";
            throw modelOutputError(oss.str());
        }
    };
    check_size(topk_ids.size(), "topk_ids");
    check_size(topk_log_probs.size(), "topk_log_probs");
    check_size(new_states.size(), "new_states");
    check_size(attn_dists.size(), "attn_dists");
    check_size(p_gens.size(), "p_gens");
    check_size(new_coverages.size(), "new_coverages");

    for (size_t i = 0; i < num_hyps; ++i){
        if (topk_ids[i].size() < num_candidates || 
            topk_log_probs[i].size() != topk_ids[i].size()){
            std::ostringstream oss;
            oss << "hypothesis " << i << " has " << topk_ids[i].size() << " ids and " 
                << topk_log_probs[i].size() << " log probs, expected " << num_candidates;
            throw modelOutputError(oss.str());
        }
        if (attn_dists[i].size() != attn_length || new_coverages[i].size() != attn_length){
            std::ostringstream oss;
            oss << "hypothesis " << i << " attention/coverage length " << attn_dists[i].size() 
                << "/" << new_coverages[i].size() << ", expected " << attn_length;
            throw modelOutputError(oss.str());
        }
    }
}

    } // namespace models
} // namespace summ
