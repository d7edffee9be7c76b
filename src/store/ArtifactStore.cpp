#include "fastembed/store/ArtifactStore.hpp"
#include "fastembed/core/Errors.hpp"
#include "fastembed/store/DownloadProgress.hpp"
#include "fastembed/store/TarGz.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <random>
#include <system_error>

namespace fs = std::filesystem;

namespace fastembed {

// unique across processes sharing a cache dir
static std::string staging_tag() {
    static std::atomic<uint64_t> counter{0};
    static const uint32_t process_salt = std::random_device{}();
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(process_salt) + "-" + std::to_string(now) + "-" + std::to_string(counter++);
}

static std::string staging_prefix(const std::string& model_name) {
    return "." + model_name + ".partial-";
}

ArtifactStore::ArtifactStore(std::string cache_dir, std::shared_ptr<ArchiveSource> source)
    : m_cache_dir(cache_dir.empty() ? std::string(kDefaultCacheDir) : std::move(cache_dir)),
      m_source(std::move(source)),
      m_progress_out(&std::cerr) {
    if (!m_source) throw DownloadError("ArtifactStore: no archive source");
}

fs::path ArtifactStore::model_dir(const std::string& model_name) const {
    return m_cache_dir / model_name;
}

std::string ArtifactStore::download_url(const std::string& model_name) const {
    return m_base_url + "/" + model_name + ".tar.gz";
}

ModelArtifact ArtifactStore::describe_dir(const fs::path& dir) {
    ModelArtifact a;
    a.local_path = dir;
    a.tokenizer_config = dir / "tokenizer.json";
    a.weights_file = dir / "model_optimized.onnx";

    std::error_code ec;
    if (!fs::exists(a.weights_file, ec) && fs::exists(dir / "model.onnx", ec)) {
        a.weights_file = dir / "model.onnx";
    }
    return a;
}

ModelArtifact ArtifactStore::resolve(EmbeddingModel model, bool show_progress) {
    return resolve(model_name(model), show_progress);
}

ModelArtifact ArtifactStore::resolve(const std::string& model_name, bool show_progress) {
    std::lock_guard<std::mutex> lock(m_mu);
    const fs::path dir = model_dir(model_name);

    std::error_code ec;
    bool present = fs::exists(dir, ec);
    if (ec) throw FilesystemError("cannot inspect " + dir.string() + ": " + ec.message());
    if (present) return describe_dir(dir);

    download(model_name, show_progress);
    return describe_dir(dir);
}

size_t ArtifactStore::sweep_stale_staging(const std::string& model_name) {
    std::error_code ec;
    if (!fs::is_directory(m_cache_dir, ec)) return 0;

    const std::string prefix = staging_prefix(model_name);
    const auto cutoff = fs::file_time_type::clock::now() - kStaleStagingAge;
    size_t removed = 0;

    for (fs::directory_iterator it(m_cache_dir, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.compare(0, prefix.size(), prefix) != 0) continue;

        std::error_code tec;
        auto mtime = fs::last_write_time(it->path(), tec);
        if (tec || mtime > cutoff) continue;

        std::error_code rec;
        fs::remove_all(it->path(), rec);
        if (rec) {
            std::cerr << "ArtifactStore: could not remove stale " << it->path() << ": " << rec.message() << "\n";
        } else {
            ++removed;
        }
    }
    if (ec) std::cerr << "ArtifactStore: could not scan " << m_cache_dir << ": " << ec.message() << "\n";
    return removed;
}

void ArtifactStore::download(const std::string& model_name, bool show_progress) {
    const fs::path dir = model_dir(model_name);
    sweep_stale_staging(model_name);
    const fs::path staging = m_cache_dir / (staging_prefix(model_name) + staging_tag());

    try {
        fs::create_directories(staging);
    } catch (const fs::filesystem_error& e) {
        throw FilesystemError(std::string("cannot create cache directory: ") + e.what());
    }

    const std::string url = download_url(model_name);
    if (show_progress) std::cerr << "ArtifactStore: downloading " << url << "\n";

    try {
        DownloadProgress progress("Downloading " + model_name, show_progress, *m_progress_out);
        TarGzExtractor extractor(staging);

        m_source->fetch(
            url,
            [&](uint64_t total) { progress.start(total); },
            [&](const char* data, size_t len) {
                progress.advance(len);
                extractor.write(data, len);
            });
        extractor.finish();
        progress.finish();

        // archives wrap their files in a top-level <model>/ folder
        fs::path root = staging;
        if (fs::is_directory(staging / model_name)) root = staging / model_name;

        std::error_code ec;
        fs::rename(root, dir, ec);
        if (ec) {
            if (!fs::exists(dir)) {
                throw FilesystemError("cannot move " + root.string() + " to " + dir.string() + ": " + ec.message());
            }
            // another process finished first; its copy is complete
        }
    } catch (const fs::filesystem_error& e) {
        std::error_code ignored;
        fs::remove_all(staging, ignored);
        throw FilesystemError(e.what());
    } catch (...) {
        std::error_code ignored;
        fs::remove_all(staging, ignored);
        throw;
    }

    std::error_code ec;
    fs::remove_all(staging, ec);
    if (ec) std::cerr << "ArtifactStore: could not remove " << staging << ": " << ec.message() << "\n";
}

} // namespace fastembed
