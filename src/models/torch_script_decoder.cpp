#include <stdexcept>
#include "models/torch_script_decoder.hpp"


namespace summ {
    namespace models {

torchScriptDecoder::torchScriptDecoder(){
    _tensor_options = torch::TensorOptions()
                                .dtype(torch::kFloat32)
                                .device(torch::kCPU)
                                .requires_grad(false);
    DLOG(INFO) << "[torchScriptDecoder/constructor]: instance created";
}


torchScriptDecoder::~torchScriptDecoder(){
    DLOG(INFO) << "[torchScriptDecoder/destructor]: instance destroyed";
}


bool torchScriptDecoder::load_model(const std::string& file_path){
    _is_loaded = false;
    torch::jit::script::Module module;
    try{
        module = torch::jit::load(file_path);
    }
    catch (const c10::Error& e){
        LOG(WARNING) << "[torchScriptDecoder/load_model]: Error loading the model from "
                     << file_path << ": " << e.what_without_backtrace();
        return false;
    }
    return set_model(std::move(module), file_path);
}


bool torchScriptDecoder::set_model(torch::jit::script::Module module, const std::string& origin){
    _is_loaded = false;
    if (!module.find_method("run_encoder") || !module.find_method("decode_onestep")){
        LOG(WARNING) << "[torchScriptDecoder/set_model]: " << origin 
                     << " does not export run_encoder and decode_onestep";
        return false;
    }
    _model = std::move(module);
    _model.eval();
    _model_path = origin;
    _is_loaded = true;
    LOG(INFO) << "[torchScriptDecoder/set_model]: Model has been loaded sucessfully from " << origin;
    return true;
}


std::optional<torchScriptDecoder::encodedArticle> torchScriptDecoder::encode(const vocab::articleIds& article, 
                                                                             tokenId unknown_token_id){
    if (!_is_loaded){
        LOG(WARNING) << "[torchScriptDecoder/encode]: no model is loaded";
        return std::nullopt;
    }
    if (article.ids.empty()){
        LOG(WARNING) << "[torchScriptDecoder/encode]: article is empty";
        return std::nullopt;
    }

    torch::NoGradGuard no_grad;
    auto enc_ids = ids_to_tensor(article.ids).unsqueeze(0);
    std::vector<torch::jit::IValue> inputs{enc_ids};
    auto output = _model.get_method("run_encoder")(inputs);
    if (!output.isTuple() || output.toTuple()->elements().size() != 2){
        LOG(WARNING) << "[torchScriptDecoder/encode]: run_encoder must return a tuple of two elements";
        return std::nullopt;
    }
    auto elements = output.toTuple()->elements();

    encodedArticle encoded;
    encoded.enc_states       = elements[0].toTensor();
    encoded.enc_ids_extended = ids_to_tensor(article.ids_extended).unsqueeze(0);
    encoded.max_oovs         = static_cast<int64_t>(article.oov_words.size());

    encoded.input.initial_state = decoderState(elements[1].toTensor().squeeze(0));
    encoded.input.attn_length   = article.ids.size();
    encoded.input.oov_id_map    = vocab::make_oov_map(article, unknown_token_id);

    VLOG(3) << "[torchScriptDecoder/encode]: encoded " << article.ids.size() << " tokens with "
            << encoded.max_oovs << " article OOVs, encoder states: " << encoded.enc_states.sizes();
    return encoded;
}


DecodeStepOutput torchScriptDecoder::decode_onestep(const encodedArticle& article, const DecodeStepQuery& query){
    if (!_is_loaded){
        throw std::runtime_error("decode_onestep called before a model was loaded");
    }

    torch::NoGradGuard no_grad;
    std::vector<torch::Tensor> states;
    states.reserve(query.size());
    for (const auto& state : query.states){
        states.push_back(std::any_cast<torch::Tensor>(state)); // std::bad_any_cast for foreign states
    }

    std::vector<torch::jit::IValue> inputs{
        ids_to_tensor(query.latest_tokens),
        article.enc_states,
        article.enc_ids_extended,
        article.max_oovs,
        torch::stack(states),
        rows_to_tensor(query.prev_coverage),
        static_cast<int64_t>(query.num_candidates)
    };
    auto output = _model.get_method("decode_onestep")(inputs);
    if (!output.isTuple() || output.toTuple()->elements().size() != 6){
        throw std::runtime_error("decode_onestep must return a tuple of six elements");
    }
    auto elements = output.toTuple()->elements();

    DecodeStepOutput step_output;
    step_output.topk_ids       = tensor_to_id_rows(elements[0].toTensor());
    step_output.topk_log_probs = tensor_to_rows(elements[1].toTensor());
    step_output.attn_dists     = tensor_to_rows(elements[3].toTensor());
    step_output.new_coverages  = tensor_to_rows(elements[5].toTensor());

    auto new_states = elements[2].toTensor();
    for (int64_t i = 0; i < new_states.size(0); ++i){
        step_output.new_states.emplace_back(new_states[i].clone());
    }

    if (elements[4].isNone()){ // no pointer-generator
        step_output.p_gens.assign(query.size(), std::nullopt);
    }
    else{
        auto p_gens = elements[4].toTensor().to(torch::kFloat32).reshape({-1}).contiguous();
        for (int64_t i = 0; i < p_gens.numel(); ++i){
            step_output.p_gens.emplace_back(p_gens[i].item<float>());
        }
    }

    VLOG(5) << "[torchScriptDecoder/decode_onestep]: decoded " << query.size() << " hypotheses";
    return step_output;
}


decodeStepFn torchScriptDecoder::as_decode_step(const encodedArticle& article){
    return [this, article](const DecodeStepQuery& query){
        return decode_onestep(article, query);
    };
}


// conversions
torch::Tensor torchScriptDecoder::ids_to_tensor(const std::vector<tokenId>& ids) const {
    std::vector<int64_t> ids_64(ids.begin(), ids.end());
    return torch::tensor(ids_64, torch::TensorOptions().dtype(torch::kInt64));
}


torch::Tensor torchScriptDecoder::rows_to_tensor(const std::vector<std::vector<float>>& rows) const {
    int64_t num_rows = static_cast<int64_t>(rows.size());
    int64_t row_size = rows.empty() ? 0 : static_cast<int64_t>(rows.front().size());
    auto tensor = torch::zeros({num_rows, row_size}, _tensor_options);
    auto accessor = tensor.accessor<float, 2>();
    for (int64_t i = 0; i < num_rows; ++i){
        if (static_cast<int64_t>(rows[i].size()) != row_size){
            throw std::invalid_argument("rows of different lengths cannot be stacked");
        }
        for (int64_t j = 0; j < row_size; ++j){
            accessor[i][j] = rows[i][j];
        }
    }
    return tensor;
}


std::vector<std::vector<float>> torchScriptDecoder::tensor_to_rows(const torch::Tensor& tensor){
    auto contiguous = tensor.to(torch::kFloat32).contiguous();
    std::vector<std::vector<float>> rows;
    for (int64_t i = 0; i < contiguous.size(0); ++i){
        auto row = contiguous[i];
        rows.emplace_back(row.data_ptr<float>(), row.data_ptr<float>() + row.numel());
    }
    return rows;
}


std::vector<std::vector<tokenId>> torchScriptDecoder::tensor_to_id_rows(const torch::Tensor& tensor){
    auto contiguous = tensor.to(torch::kInt64).contiguous();
    std::vector<std::vector<tokenId>> rows;
    for (int64_t i = 0; i < contiguous.size(0); ++i){
        auto row = contiguous[i];
        const int64_t* data = row.data_ptr<int64_t>();
        rows.emplace_back(data, data + row.numel());
    }
    return rows;
}

    } // namespace models
} // namespace summ
