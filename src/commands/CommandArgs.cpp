#include "fastembed/commands/CommandArgs.hpp"
#include "fastembed/core/Errors.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace fastembed::commands {

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (argv[i] == key) return argv[i + 1];
    }
    return def;
}

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (argv[i] == key) return true;
    }
    return false;
}

size_t parse_count(const std::string& key, const std::string& value, size_t max) {
    long long v = -1;
    try {
        size_t pos = 0;
        v = std::stoll(value, &pos);
        if (pos != value.size()) v = -1;
    } catch (const std::exception&) {
        v = -1;
    }
    if (v < 0) throw ConfigError(key + " expects a non-negative integer, got '" + value + "'");
    if ((unsigned long long)v > max) {
        throw ConfigError(key + " must be at most " + std::to_string(max) + ", got " + value);
    }
    return (size_t)v;
}

static std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

InitOptions options_from_args(int argc, char** argv) {
    InitOptions opts;

    std::string config = get_arg(argc, argv, "--config", "");
    if (!config.empty()) opts = load_options_json(config, opts);

    std::string model = get_arg(argc, argv, "--model", "");
    if (!model.empty()) {
        auto m = parse_model(model);
        if (!m) throw ConfigError("unsupported model: " + model + " (see `fastembed models`)");
        opts.model = *m;
    }

    std::string cache = get_arg(argc, argv, "--cache", "");
    if (!cache.empty()) opts.cache_dir = cache;

    std::string max_len = get_arg(argc, argv, "--max_len", "");
    if (!max_len.empty()) opts.max_length = parse_count("--max_len", max_len);

    std::string workers = get_arg(argc, argv, "--workers", "");
    if (!workers.empty()) opts.max_in_flight = parse_count("--workers", workers);

    std::string providers = get_arg(argc, argv, "--providers", "");
    if (!providers.empty()) opts.execution_providers = split_csv(providers);

    std::string lib = get_arg(argc, argv, "--onnx_lib", "");
    if (!lib.empty()) opts.onnx_path = lib;

    if (has_flag(argc, argv, "--quiet")) opts.show_download_progress = false;

    apply_defaults(opts);
    return opts;
}

} // namespace fastembed::commands
