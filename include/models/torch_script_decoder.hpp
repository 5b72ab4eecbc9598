#ifndef _SUMM_BEAM_TORCH_SCRIPT_DECODER
#define _SUMM_BEAM_TORCH_SCRIPT_DECODER

#include <torch/script.h>
#include <glog/logging.h>
#include <optional>
#include <string>
#include "decoders/decoding_config.hpp"
#include "models/decode_step.hpp"
#include "utils/vocab.hpp"

namespace summ {
    namespace models {

/*
Runs an attentional encoder-decoder exported with TorchScript. The module is
expected to provide two methods:

    run_encoder(enc_ids: [1, L] int64) -> (enc_states [1, L, H], dec_in_state [1, S])
    decode_onestep(latest_tokens: [B] int64, enc_states, enc_ids_extended: [1, L] int64,
                   max_oovs: int, dec_states: [B, S], prev_coverage: [B, L], k: int)
        -> (topk_ids [B, k], topk_log_probs [B, k], new_states [B, S],
            attn_dists [B, L], p_gens [B] or None, new_coverage [B, L])

The decoder state of a hypothesis is its row of dec_states, kept as a
torch::Tensor inside the opaque state handle.
*/
class torchScriptDecoder{
public:
    // encoder side of one article, shared by every step of its search
    struct encodedArticle{
        torch::Tensor enc_states;
        torch::Tensor enc_ids_extended;
        int64_t max_oovs = 0;
        beam::DecodingInput input;
    };

private:
    torch::TensorOptions _tensor_options;
    torch::jit::script::Module _model;
    std::string _model_path;
    bool _is_loaded = false;

public:
    torchScriptDecoder();
    ~torchScriptDecoder();

    bool load_model(const std::string& file_path);
    // takes an already built module, origin is only used for logging
    bool set_model(torch::jit::script::Module module, const std::string& origin);
    bool is_loaded() const {return _is_loaded;}

    std::optional<encodedArticle> encode(const vocab::articleIds& article, tokenId unknown_token_id);

    DecodeStepOutput decode_onestep(const encodedArticle& article, const DecodeStepQuery& query);

    // binds an encoded article, the result satisfies decodeStepFn
    decodeStepFn as_decode_step(const encodedArticle& article);

private:
    torch::Tensor ids_to_tensor(const std::vector<tokenId>& ids) const;
    torch::Tensor rows_to_tensor(const std::vector<std::vector<float>>& rows) const;
    static std::vector<std::vector<float>> tensor_to_rows(const torch::Tensor& tensor);
    static std::vector<std::vector<tokenId>> tensor_to_id_rows(const torch::Tensor& tensor);
};

    } // namespace models
} // namespace summ

#endif // _SUMM_BEAM_TORCH_SCRIPT_DECODER
