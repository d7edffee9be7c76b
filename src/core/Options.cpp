#include "fastembed/core/Options.hpp"
#include "fastembed/core/Errors.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace fastembed {

const std::vector<ModelDescription>& supported_models() {
    static const std::vector<ModelDescription> models = {
        {EmbeddingModel::AllMiniLML6V2, "fast-all-MiniLM-L6-v2", 384,
         "Sentence Transformer model, MiniLM-L6-v2"},
        {EmbeddingModel::BGEBaseEN, "fast-bge-base-en", 768,
         "Base English model"},
        {EmbeddingModel::BGESmallEN, "fast-bge-small-en", 384,
         "Fast and default English model"},
    };
    return models;
}

const ModelDescription& describe(EmbeddingModel model) {
    for (const auto& m : supported_models()) {
        if (m.model == model) return m;
    }
    throw ConfigError("unknown embedding model");
}

const std::string& model_name(EmbeddingModel model) {
    return describe(model).name;
}

std::optional<EmbeddingModel> parse_model(const std::string& name) {
    for (const auto& m : supported_models()) {
        if (m.name == name) return m.model;
    }
    return std::nullopt;
}

void apply_defaults(InitOptions& opts) {
    if (opts.cache_dir.empty()) opts.cache_dir = kDefaultCacheDir;
    if (opts.max_length == 0) opts.max_length = kDefaultMaxLength;
}

static const json* find_typed(const json& j, const char* key, json::value_t type, const std::string& where) {
    if (!j.contains(key)) return nullptr;
    const json& v = j.at(key);
    // integers parse as unsigned when non-negative
    bool ok = v.type() == type ||
              (type == json::value_t::number_unsigned && v.is_number_integer() && v.get<long long>() >= 0);
    if (!ok) {
        throw ConfigError(where + "." + key + " has the wrong type");
    }
    return &v;
}

InitOptions load_options_json(const std::string& path, InitOptions base) {
    std::ifstream in(path);
    if (!in) throw ConfigError("failed to open config file: " + path);

    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        throw ConfigError(std::string("failed to parse JSON config: ") + e.what());
    }
    if (!j.is_object()) throw ConfigError(path + " must be an object");

    InitOptions opts = std::move(base);

    if (auto v = find_typed(j, "model", json::value_t::string, path)) {
        auto m = parse_model(v->get<std::string>());
        if (!m) throw ConfigError("unsupported model: " + v->get<std::string>());
        opts.model = *m;
    }
    if (auto v = find_typed(j, "execution_providers", json::value_t::array, path)) {
        std::vector<std::string> providers;
        for (size_t i = 0; i < v->size(); ++i) {
            if (!v->at(i).is_string()) {
                std::ostringstream oss;
                oss << path << ".execution_providers[" << i << "] must be a string";
                throw ConfigError(oss.str());
            }
            providers.push_back(v->at(i).get<std::string>());
        }
        opts.execution_providers = std::move(providers);
    }
    if (auto v = find_typed(j, "max_length", json::value_t::number_unsigned, path)) {
        opts.max_length = v->get<size_t>();
    }
    if (auto v = find_typed(j, "cache_dir", json::value_t::string, path)) {
        opts.cache_dir = v->get<std::string>();
    }
    if (auto v = find_typed(j, "show_download_progress", json::value_t::boolean, path)) {
        opts.show_download_progress = v->get<bool>();
    }
    if (auto v = find_typed(j, "onnx_path", json::value_t::string, path)) {
        opts.onnx_path = v->get<std::string>();
    }
    if (auto v = find_typed(j, "max_in_flight", json::value_t::number_unsigned, path)) {
        opts.max_in_flight = v->get<size_t>();
    }

    apply_defaults(opts);
    return opts;
}

} // namespace fastembed
