#pragma once
#include "fastembed/emb/InferencePort.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

namespace fastembed {

// Process-wide onnxruntime environment. Built with ORT_API_MANUAL_INIT, so
// nothing in Ort:: is usable until init() has run.
class OrtRuntime {
public:
    static OrtRuntime& instance();

    // No-op when already initialized. A non-empty shared_library_path is
    // loaded (dlopen, LoadLibraryW on Windows) and used instead of the linked onnxruntime.
    void init(const std::string& shared_library_path = "");
    void destroy();

    bool initialized() const;
    Ort::Env& env();

private:
    OrtRuntime() = default;

    mutable std::mutex m_mu;
    std::unique_ptr<Ort::Env> m_env;
    void* m_lib = nullptr;
};

class OnnxInference final : public InferencePort {
public:
    // OrtRuntime must be initialized first.
    OnnxInference(const std::filesystem::path& model_path, const std::vector<std::string>& execution_providers);

    TensorBuffer<float> infer(const AssembledBatch& batch) const override;

private:
    std::unique_ptr<Ort::Session> m_session;

    std::string m_in_ids = "input_ids";
    std::string m_in_mask = "attention_mask";
    std::string m_in_type = "token_type_ids";
    bool m_has_type_ids = false;
    std::string m_out_name;
};

} // namespace fastembed
