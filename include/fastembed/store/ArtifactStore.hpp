#pragma once
#include "fastembed/core/Options.hpp"
#include "fastembed/store/ArchiveSource.hpp"

#include <chrono>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>

namespace fastembed {

struct ModelArtifact {
    std::filesystem::path local_path;
    std::filesystem::path tokenizer_config; // tokenizer.json
    std::filesystem::path weights_file;     // *.onnx
};

// Owns <cache_dir>/<model>/. A directory is only ever created there by an
// atomic rename of a fully extracted staging directory.
class ArtifactStore {
public:
    static constexpr const char* kBaseUrl = "https://storage.googleapis.com/qdrant-fastembed";
    // staging dirs untouched this long belong to a download that died
    static constexpr std::chrono::hours kStaleStagingAge{24};

    explicit ArtifactStore(std::string cache_dir,
                           std::shared_ptr<ArchiveSource> source = std::make_shared<HttpArchiveSource>());

    // Returns the cached directory if present, otherwise downloads and unpacks it.
    ModelArtifact resolve(EmbeddingModel model, bool show_progress);
    ModelArtifact resolve(const std::string& model_name, bool show_progress);

    std::filesystem::path model_dir(const std::string& model_name) const;
    // <base_url>/<model>.tar.gz
    std::string download_url(const std::string& model_name) const;
    // Mirror of kBaseUrl; no trailing slash.
    void set_base_url(std::string base_url) { m_base_url = std::move(base_url); }

    // Removes .<model>.partial-* directories older than kStaleStagingAge.
    // Runs before every download; returns how many were removed.
    size_t sweep_stale_staging(const std::string& model_name);

    // Progress goes here; defaults to std::cerr.
    void set_progress_stream(std::ostream& out) { m_progress_out = &out; }

private:
    std::filesystem::path m_cache_dir;
    std::string m_base_url = kBaseUrl;
    std::shared_ptr<ArchiveSource> m_source;
    std::ostream* m_progress_out;
    std::mutex m_mu;

    void download(const std::string& model_name, bool show_progress);
    static ModelArtifact describe_dir(const std::filesystem::path& dir);
};

} // namespace fastembed
