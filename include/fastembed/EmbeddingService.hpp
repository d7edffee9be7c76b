#pragma once
#include "fastembed/batch/BatchScheduler.hpp"
#include "fastembed/core/Options.hpp"
#include "fastembed/emb/Encoder.hpp"
#include "fastembed/emb/InferencePort.hpp"
#include "fastembed/emb/Normalizer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace fastembed {

class EmbeddingService {
public:
    static constexpr const char* kQueryPrefix = "query: ";
    static constexpr const char* kPassagePrefix = "passage: ";

    // Initializes the onnxruntime environment, resolves the model into the
    // cache (downloading on a miss) and opens an inference session.
    explicit EmbeddingService(InitOptions opts);

    // Runs on caller-supplied components; no runtime, network or cache access.
    EmbeddingService(std::shared_ptr<const Tokenizer> tokenizer,
                     std::shared_ptr<const InferencePort> inference,
                     size_t max_length,
                     size_t max_in_flight = 0);

    ~EmbeddingService() = default;

    EmbeddingService(const EmbeddingService&) = delete;
    EmbeddingService& operator=(const EmbeddingService&) = delete;

    std::vector<Embedding> embed(const std::vector<std::string>& inputs, int batch_size = 0) const;
    Embedding query_embed(const std::string& text) const;
    std::vector<Embedding> passage_embed(const std::vector<std::string>& inputs, int batch_size = 0) const;

    // Closes the session and tears down the process-wide onnxruntime
    // environment. Call once every service using the runtime is done; further
    // embed calls throw. Not safe to run concurrently with embed calls.
    void destroy();

    const std::string& model_path() const { return m_model_path; }
    size_t max_length() const { return m_encoder->max_len(); }

private:
    size_t m_max_in_flight = 0;
    std::string m_model_path;
    std::unique_ptr<Encoder> m_encoder;
    std::shared_ptr<const InferencePort> m_inference;
    bool m_uses_runtime = false;

    std::vector<Embedding> embed_chunk(const std::vector<std::string>& chunk) const;
};

} // namespace fastembed
