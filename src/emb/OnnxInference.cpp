#include "fastembed/emb/OnnxInference.hpp"
#include "fastembed/core/Errors.hpp"

#include <sstream>
#include <unordered_map>

#ifdef _WIN32
#include <windows.h>
#else
#include <dlfcn.h>
#endif

namespace fastembed {

static void* open_library(const std::string& path, std::string& error) {
#ifdef _WIN32
    std::wstring wpath(path.begin(), path.end());
    HMODULE lib = LoadLibraryW(wpath.c_str());
    if (!lib) error = "LoadLibrary error " + std::to_string(GetLastError());
    return reinterpret_cast<void*>(lib);
#else
    void* lib = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!lib) {
        const char* why = dlerror();
        error = why ? why : "unknown error";
    }
    return lib;
#endif
}

static void* find_symbol(void* lib, const char* name) {
#ifdef _WIN32
    return reinterpret_cast<void*>(GetProcAddress(reinterpret_cast<HMODULE>(lib), name));
#else
    return dlsym(lib, name);
#endif
}

OrtRuntime& OrtRuntime::instance() {
    static OrtRuntime runtime;
    return runtime;
}

void OrtRuntime::init(const std::string& shared_library_path) {
    std::lock_guard<std::mutex> lock(m_mu);
    if (m_env) return;

    if (!shared_library_path.empty()) {
        // the library stays mapped for the life of the process
        if (!m_lib) {
            std::string why;
            m_lib = open_library(shared_library_path, why);
            if (!m_lib) {
                throw InferenceError("failed to load onnxruntime library " + shared_library_path + ": " + why);
            }
        }
        using GetApiBaseFn = const OrtApiBase* (*)();
        auto get_base = reinterpret_cast<GetApiBaseFn>(find_symbol(m_lib, "OrtGetApiBase"));
        if (!get_base) {
            throw InferenceError(shared_library_path + " does not export OrtGetApiBase");
        }
        const OrtApi* api = get_base()->GetApi(ORT_API_VERSION);
        if (!api) {
            throw InferenceError(shared_library_path + " does not support onnxruntime API version " +
                                 std::to_string(ORT_API_VERSION));
        }
        Ort::InitApi(api);
    } else {
        Ort::InitApi();
    }

    try {
        m_env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "fastembed");
    } catch (const Ort::Exception& e) {
        throw InferenceError(std::string("failed to create onnxruntime environment: ") + e.what());
    }
}

void OrtRuntime::destroy() {
    std::lock_guard<std::mutex> lock(m_mu);
    m_env.reset();
}

bool OrtRuntime::initialized() const {
    std::lock_guard<std::mutex> lock(m_mu);
    return m_env != nullptr;
}

Ort::Env& OrtRuntime::env() {
    std::lock_guard<std::mutex> lock(m_mu);
    if (!m_env) throw InferenceError("onnxruntime environment is not initialized");
    return *m_env;
}

static void append_providers(Ort::SessionOptions& opts, const std::vector<std::string>& providers) {
    for (const auto& p : providers) {
        if (p == "CPUExecutionProvider") continue; // always present
        if (p == "CUDAExecutionProvider") {
            OrtCUDAProviderOptions cuda{};
            opts.AppendExecutionProvider_CUDA(cuda);
        } else {
            opts.AppendExecutionProvider(p, std::unordered_map<std::string, std::string>{});
        }
    }
}

OnnxInference::OnnxInference(const std::filesystem::path& model_file, const std::vector<std::string>& execution_providers) {
    const std::string model_path = model_file.string();
    Ort::Env& env = OrtRuntime::instance().env();

    try {
        Ort::SessionOptions opts;
        opts.SetIntraOpNumThreads(1);
        opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
        append_providers(opts, execution_providers);

        // native path type matches ORTCHAR_T: wchar_t on Windows, char elsewhere
        m_session = std::make_unique<Ort::Session>(env, model_file.c_str(), opts);

        Ort::AllocatorWithDefaultOptions allocator;

        std::vector<std::string> inputs;
        for (size_t i = 0; i < m_session->GetInputCount(); ++i) {
            inputs.push_back(m_session->GetInputNameAllocated(i, allocator).get());
        }

        bool has_ids = false, has_mask = false;
        for (const auto& name : inputs) {
            if (name == m_in_ids) has_ids = true;
            else if (name == m_in_mask) has_mask = true;
            else if (name == m_in_type) m_has_type_ids = true;
        }
        if (!has_ids || !has_mask) {
            // unnamed exports keep the BERT order: ids, mask, type ids
            if (inputs.size() < 2) {
                throw InferenceError("model " + model_path + " declares " + std::to_string(inputs.size()) +
                                     " inputs, expected at least 2");
            }
            m_in_ids = inputs[0];
            m_in_mask = inputs[1];
            m_has_type_ids = inputs.size() >= 3;
            if (m_has_type_ids) m_in_type = inputs[2];
        }

        const size_t n_out = m_session->GetOutputCount();
        if (n_out == 0) throw InferenceError("model " + model_path + " has no outputs");
        m_out_name = m_session->GetOutputNameAllocated(0, allocator).get();
        for (size_t i = 1; i < n_out; ++i) {
            std::string name = m_session->GetOutputNameAllocated(i, allocator).get();
            if (name == "last_hidden_state") m_out_name = name;
        }
    } catch (const Ort::Exception& e) {
        throw InferenceError(std::string("failed to load ") + model_path + ": " + e.what());
    }
}

TensorBuffer<float> OnnxInference::infer(const AssembledBatch& batch) const {
    const size_t n = batch.batch_size();
    const size_t seq_len = batch.seq_len();

    if (batch.ids.shape.size() != 2 || !batch.ids.consistent() || !batch.mask.consistent() ||
        !batch.type_ids.consistent() || batch.mask.shape != batch.ids.shape ||
        batch.type_ids.shape != batch.ids.shape) {
        throw ShapeError("input tensors must share one [batch, seq_len] shape");
    }

    TensorBuffer<float> hidden;
    if (n == 0) {
        hidden.shape = {0, (int64_t)seq_len, 0};
        return hidden;
    }

    try {
        Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);
        const std::vector<int64_t>& shape = batch.ids.shape;

        // onnxruntime does not write through input tensors
        auto make_input = [&](const TensorBuffer<int64_t>& t) {
            return Ort::Value::CreateTensor<int64_t>(mem, const_cast<int64_t*>(t.data.data()), t.data.size(),
                                                     shape.data(), shape.size());
        };

        std::vector<const char*> in_names{m_in_ids.c_str(), m_in_mask.c_str()};
        std::vector<Ort::Value> in_vals;
        in_vals.push_back(make_input(batch.ids));
        in_vals.push_back(make_input(batch.mask));
        if (m_has_type_ids) {
            in_names.push_back(m_in_type.c_str());
            in_vals.push_back(make_input(batch.type_ids));
        }

        const char* out_names[1] = { m_out_name.c_str() };

        auto outs = m_session->Run(Ort::RunOptions{nullptr}, in_names.data(), in_vals.data(), in_vals.size(),
                                   out_names, 1);

        Ort::Value& out = outs[0];
        auto shp = out.GetTensorTypeAndShapeInfo().GetShape(); // [batch, seq_len, hidden]
        if (shp.size() != 3 || shp[0] != (int64_t)n || shp[1] != (int64_t)seq_len) {
            std::ostringstream oss;
            oss << "model output has shape [";
            for (size_t i = 0; i < shp.size(); ++i) oss << (i ? ", " : "") << shp[i];
            oss << "], expected [" << n << ", " << seq_len << ", hidden]";
            throw ShapeError(oss.str());
        }

        hidden.shape = shp;
        const float* data = out.GetTensorData<float>();
        hidden.data.assign(data, data + hidden.element_count());
    } catch (const Ort::Exception& e) {
        throw InferenceError(std::string("onnxruntime run failed: ") + e.what());
    }
    return hidden;
}

} // namespace fastembed
