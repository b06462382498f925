// common/llm/llama_adapter.h
#ifndef RESEARCHFLOW_COMMON_LLM_LLAMA_ADAPTER_H
#define RESEARCHFLOW_COMMON_LLM_LLAMA_ADAPTER_H

#include "common/llm/llm_client.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <llama.h>

namespace researchflow {

// Local GGUF model through llama.cpp. One context shared by all callers;
// calls are serialized and each starts from an empty KV cache.
class LlamaAdapter : public LlmClient {
public:
    struct Config {
        std::string model_path;
        int n_ctx = 4096;
        int n_threads = 4;
        float temperature = 0.7f;
        float min_p = 0.05f;
        int n_predict = 1024;
    };

    explicit LlamaAdapter(const Config& config);
    ~LlamaAdapter() override;

    std::string complete(const std::string& prompt, std::stop_token stop = {}) override;
    bool is_loaded() const;

private:
    Config config_;
    std::unique_ptr<llama_model, decltype(&llama_model_free)> model_;
    std::unique_ptr<llama_context, decltype(&llama_free)> ctx_;
    std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)> sampler_;
    std::mutex mutex_;

    std::vector<llama_token> tokenize(const std::string& text, bool add_bos);
    std::string detokenize(llama_token token);
};

} // namespace researchflow

#endif // RESEARCHFLOW_COMMON_LLM_LLAMA_ADAPTER_H
