// common/llm/llama_adapter.cpp
#include "common/llm/llama_adapter.h"
#include "core/types/errors.h"
#include "common/utils/logging.h"
#include <cstdint>

namespace researchflow {

LlamaAdapter::LlamaAdapter(const Config& config)
    : config_(config),
      model_(nullptr, llama_model_free),
      ctx_(nullptr, llama_free),
      sampler_(nullptr, llama_sampler_free) {

    llama_backend_init();

    llama_model_params model_params = llama_model_default_params();
    model_params.n_gpu_layers = 99;

    llama_model* raw_model = llama_model_load_from_file(config_.model_path.c_str(), model_params);
    if (!raw_model) {
        throw InvalidInputError("Failed to load model: " + config_.model_path);
    }
    model_.reset(raw_model);

    llama_context_params ctx_params = llama_context_default_params();
    ctx_params.n_ctx = config_.n_ctx;
    ctx_params.n_threads = config_.n_threads;
    ctx_params.n_threads_batch = config_.n_threads;

    llama_context* raw_ctx = llama_init_from_model(model_.get(), ctx_params);
    if (!raw_ctx) {
        throw ServiceError("Failed to create llama context");
    }
    ctx_.reset(raw_ctx);

    auto smpl_params = llama_sampler_chain_default_params();
    llama_sampler* raw_sampler = llama_sampler_chain_init(smpl_params);
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_min_p(config_.min_p, 1));
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_temp(config_.temperature));
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_dist(LLAMA_DEFAULT_SEED));
    sampler_.reset(raw_sampler);

    logging::get()->info("Loaded model {} (n_ctx={}, threads={})", config_.model_path, config_.n_ctx, config_.n_threads);
}

LlamaAdapter::~LlamaAdapter() = default;

std::vector<llama_token> LlamaAdapter::tokenize(const std::string& text, bool add_bos) {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    int32_t n_tokens = llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                                      nullptr, 0, add_bos, true);
    // a negative count is the required buffer size
    if (n_tokens < 0) n_tokens = -n_tokens;
    if (n_tokens == 0) return {};

    std::vector<llama_token> tokens(n_tokens);
    if (llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                       tokens.data(), n_tokens, add_bos, true) < 0) {
        return {};
    }
    return tokens;
}

std::string LlamaAdapter::detokenize(llama_token token) {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    char buf[256] = {0};
    int n = llama_token_to_piece(vocab, token, buf, sizeof(buf) - 1, 0, true);
    if (n < 0) return "";
    return std::string(buf, n);
}

std::string LlamaAdapter::complete(const std::string& prompt, std::stop_token stop) {
    if (!is_loaded()) {
        throw ServiceError("LLM unavailable: model not loaded");
    }
    std::lock_guard<std::mutex> lock(mutex_);

    // every completion is independent
    llama_memory_clear(llama_get_memory(ctx_.get()), true);
    llama_sampler_reset(sampler_.get());

    auto tokens = tokenize(prompt, true);
    if (tokens.empty()) {
        throw InvalidInputError("Tokenization failed");
    }
    if (static_cast<int>(tokens.size()) >= config_.n_ctx) {
        throw InvalidInputError("Prompt of " + std::to_string(tokens.size()) + " tokens exceeds context size");
    }

    llama_batch batch = llama_batch_get_one(tokens.data(), static_cast<int32_t>(tokens.size()));
    if (llama_decode(ctx_.get(), batch)) {
        throw ServiceError("Prompt evaluation failed");
    }

    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    std::string response;
    for (int i = 0; i < config_.n_predict; ++i) {
        if (stop.stop_requested()) {
            throw CancelledError("LLM generation cancelled");
        }
        llama_token new_token = llama_sampler_sample(sampler_.get(), ctx_.get(), -1);
        if (llama_vocab_is_eog(vocab, new_token)) {
            break;
        }
        response += detokenize(new_token);

        batch = llama_batch_get_one(&new_token, 1);
        if (llama_decode(ctx_.get(), batch)) {
            logging::get()->warn("llama_decode failed after {} tokens; returning partial output", i + 1);
            break;
        }
    }
    return response;
}

bool LlamaAdapter::is_loaded() const {
    return model_ != nullptr && ctx_ != nullptr && sampler_ != nullptr;
}

} // namespace researchflow
