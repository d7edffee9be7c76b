#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fastembed {

enum class EmbeddingModel {
    AllMiniLML6V2,
    BGEBaseEN,
    BGESmallEN,
};

struct ModelDescription {
    EmbeddingModel model;
    std::string name;   // archive / cache directory name
    size_t dim;         // hidden size of the last layer
    std::string description;
};

const std::vector<ModelDescription>& supported_models();
const ModelDescription& describe(EmbeddingModel model);
const std::string& model_name(EmbeddingModel model);
std::optional<EmbeddingModel> parse_model(const std::string& name);

constexpr size_t kDefaultMaxLength = 512;
constexpr const char* kDefaultCacheDir = "local_cache";

struct InitOptions {
    EmbeddingModel model = EmbeddingModel::BGESmallEN;
    std::vector<std::string> execution_providers; // passed through to onnxruntime; empty = CPU
    size_t max_length = kDefaultMaxLength;
    std::string cache_dir = kDefaultCacheDir;
    bool show_download_progress = true;
    std::string onnx_path;  // optional override of the onnxruntime shared library
    size_t max_in_flight = 0; // concurrent chunk workers, 0 = one per chunk
};

// Replaces zero/empty values with defaults. Never fails.
void apply_defaults(InitOptions& opts);

// Reads options from a JSON object. Missing keys keep their current value in `base`.
InitOptions load_options_json(const std::string& path, InitOptions base = {});

} // namespace fastembed
