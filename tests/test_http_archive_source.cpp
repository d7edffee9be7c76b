/**
 * @file test_http_archive_source.cpp
 * @brief The cpp-httplib client against a local httplib::Server
 *
 * Covers status text on failures, redirects, Content-Length reporting and
 * a full ArtifactStore::resolve over plain HTTP on 127.0.0.1.
 */

#include <gtest/gtest.h>
#include "fastembed/store/ArchiveSource.hpp"
#include "fastembed/store/ArtifactStore.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <memory>
#include <sstream>
#include <thread>

#include <httplib.h>

using namespace fastembed;
using testutil::TempDir;

namespace fs = std::filesystem;

namespace {

const char* kModel = "fast-bge-small-en";

// Serves /models/<model>.tar.gz, a redirect to it, and a 500.
class LocalModelServer {
public:
    LocalModelServer() : m_archive(testutil::model_archive(kModel)) {
        const std::string file = std::string("/") + kModel + ".tar.gz";

        m_server.Get("/models" + file, [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(m_archive, "application/gzip");
        });
        m_server.Get("/moved" + file, [this, file](const httplib::Request&, httplib::Response& res) {
            res.set_redirect(base_url() + "/models" + file);
        });
        m_server.Get("/broken" + file, [](const httplib::Request&, httplib::Response& res) {
            res.status = 500;
        });

        m_port = m_server.bind_to_any_port("127.0.0.1");
        if (m_port > 0) {
            m_thread = std::thread([this] { m_server.listen_after_bind(); });
            for (int i = 0; i < 200 && !m_server.is_running(); ++i) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }
    }

    ~LocalModelServer() {
        m_server.stop();
        if (m_thread.joinable()) m_thread.join();
    }

    bool ok() const { return m_port > 0 && m_server.is_running(); }
    std::string base_url() const { return "http://127.0.0.1:" + std::to_string(m_port); }
    const std::string& archive() const { return m_archive; }

private:
    std::string m_archive;
    httplib::Server m_server;
    int m_port = -1;
    std::thread m_thread;
};

class HttpArchiveSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(m_server.ok()) << "local http server did not start";
    }

    std::unique_ptr<ArtifactStore> make_store(const std::string& prefix) {
        auto store = std::make_unique<ArtifactStore>(m_dir.path().string(), std::make_shared<HttpArchiveSource>());
        store->set_base_url(m_server.base_url() + prefix);
        store->set_progress_stream(m_progress);
        return store;
    }

    LocalModelServer m_server;
    TempDir m_dir;
    std::ostringstream m_progress;
};

} // namespace

TEST_F(HttpArchiveSourceTest, ResolvesModelOverHttp) {
    auto store = make_store("/models");
    ModelArtifact a = store->resolve(EmbeddingModel::BGESmallEN, true);

    EXPECT_TRUE(fs::is_regular_file(a.tokenizer_config));
    EXPECT_TRUE(fs::is_regular_file(a.weights_file));
    EXPECT_NE(m_progress.str().find("100"), std::string::npos);
}

TEST_F(HttpArchiveSourceTest, NotFoundReportsStatusAndReason) {
    auto store = make_store("/nowhere");
    try {
        store->resolve(EmbeddingModel::BGESmallEN, false);
        FAIL() << "expected DownloadError";
    } catch (const DownloadError& e) {
        EXPECT_NE(std::string(e.what()).find("404 Not Found"), std::string::npos) << e.what();
    }
    EXPECT_FALSE(fs::exists(m_dir.path() / kModel));
}

TEST_F(HttpArchiveSourceTest, ServerErrorReportsStatusAndReason) {
    auto store = make_store("/broken");
    try {
        store->resolve(EmbeddingModel::BGESmallEN, false);
        FAIL() << "expected DownloadError";
    } catch (const DownloadError& e) {
        EXPECT_NE(std::string(e.what()).find("500 Internal Server Error"), std::string::npos) << e.what();
    }
}

TEST_F(HttpArchiveSourceTest, FollowsRedirects) {
    auto store = make_store("/moved");
    ModelArtifact a = store->resolve(EmbeddingModel::BGESmallEN, false);
    EXPECT_TRUE(fs::is_regular_file(a.tokenizer_config));
}

TEST_F(HttpArchiveSourceTest, AdvertisedLengthReachesStartCallback) {
    HttpArchiveSource source;
    uint64_t advertised = 0;
    std::string body;
    source.fetch(
        m_server.base_url() + "/models/" + kModel + ".tar.gz",
        [&](uint64_t len) { advertised = len; },
        [&](const char* data, size_t len) { body.append(data, len); });

    EXPECT_EQ(advertised, m_server.archive().size());
    EXPECT_EQ(body, m_server.archive());
}

TEST_F(HttpArchiveSourceTest, CallbackErrorsPropagateUnchanged) {
    HttpArchiveSource source;
    EXPECT_THROW(source.fetch(
                     m_server.base_url() + "/models/" + kModel + ".tar.gz",
                     nullptr,
                     [](const char*, size_t) { throw ExtractError("bad archive"); }),
                 ExtractError);
}

TEST(HttpArchiveSourceErrorsTest, RefusedConnectionIsDownloadError) {
    HttpArchiveSource source;
    EXPECT_THROW(source.fetch("http://127.0.0.1:1/model.tar.gz", nullptr, [](const char*, size_t) {}),
                 DownloadError);
}

TEST(HttpArchiveSourceErrorsTest, MalformedUrlIsDownloadError) {
    HttpArchiveSource source;
    EXPECT_THROW(source.fetch("not a url", nullptr, [](const char*, size_t) {}), DownloadError);
}
