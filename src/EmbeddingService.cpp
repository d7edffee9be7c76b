#include "fastembed/EmbeddingService.hpp"
#include "fastembed/core/Errors.hpp"
#include "fastembed/emb/OnnxInference.hpp"
#include "fastembed/emb/WordPieceTokenizer.hpp"
#include "fastembed/store/ArtifactStore.hpp"

namespace fastembed {

EmbeddingService::EmbeddingService(InitOptions opts) {
    apply_defaults(opts);
    m_max_in_flight = opts.max_in_flight;

    ArtifactStore store(opts.cache_dir);
    ModelArtifact artifact = store.resolve(opts.model, opts.show_download_progress);
    m_model_path = artifact.local_path.string();

    auto tokenizer = std::make_shared<WordPieceTokenizer>();
    tokenizer->load_tokenizer_json(artifact.tokenizer_config.string());
    m_encoder = std::make_unique<Encoder>(std::move(tokenizer), opts.max_length);

    // the runtime comes up last; a failed session leaves it as it was found
    OrtRuntime& runtime = OrtRuntime::instance();
    const bool was_up = runtime.initialized();
    runtime.init(opts.onnx_path);
    try {
        m_inference = std::make_shared<OnnxInference>(artifact.weights_file, opts.execution_providers);
    } catch (const std::exception&) {
        if (!was_up) runtime.destroy();
        throw;
    }
    m_uses_runtime = true;
}

EmbeddingService::EmbeddingService(std::shared_ptr<const Tokenizer> tokenizer,
                                   std::shared_ptr<const InferencePort> inference,
                                   size_t max_length,
                                   size_t max_in_flight)
    : m_max_in_flight(max_in_flight),
      m_encoder(std::make_unique<Encoder>(std::move(tokenizer), max_length == 0 ? kDefaultMaxLength : max_length)),
      m_inference(std::move(inference)) {
    if (!m_inference) throw InferenceError("EmbeddingService: no inference backend");
}

std::vector<Embedding> EmbeddingService::embed_chunk(const std::vector<std::string>& chunk) const {
    if (!m_inference) throw InferenceError("EmbeddingService: used after destroy()");

    std::vector<EncodedSequence> seqs = m_encoder->encode(chunk);
    AssembledBatch batch = assemble_batch(seqs, m_encoder->max_len());
    TensorBuffer<float> hidden = m_inference->infer(batch);

    if (hidden.shape.empty() || hidden.shape[0] != (int64_t)chunk.size()) {
        throw ShapeError("inference returned a batch of " +
                         (hidden.shape.empty() ? std::string("?") : std::to_string(hidden.shape[0])) +
                         " for " + std::to_string(chunk.size()) + " inputs");
    }
    return pool_and_normalize(hidden);
}

std::vector<Embedding> EmbeddingService::embed(const std::vector<std::string>& inputs, int batch_size) const {
    BatchScheduler scheduler([this](const std::vector<std::string>& chunk) { return embed_chunk(chunk); });

    BatchOptions opts;
    opts.batch_size = batch_size;
    opts.max_in_flight = m_max_in_flight;
    return scheduler.run_all(inputs, opts);
}

Embedding EmbeddingService::query_embed(const std::string& text) const {
    std::vector<Embedding> out = embed_chunk({kQueryPrefix + text});
    return std::move(out.front());
}

std::vector<Embedding> EmbeddingService::passage_embed(const std::vector<std::string>& inputs, int batch_size) const {
    std::vector<std::string> prefixed;
    prefixed.reserve(inputs.size());
    for (const auto& s : inputs) prefixed.push_back(kPassagePrefix + s);
    return embed(prefixed, batch_size);
}

void EmbeddingService::destroy() {
    m_inference.reset();
    if (m_uses_runtime) {
        OrtRuntime::instance().destroy();
        m_uses_runtime = false;
    }
}

} // namespace fastembed
