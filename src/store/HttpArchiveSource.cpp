#include "fastembed/store/ArchiveSource.hpp"
#include "fastembed/core/Errors.hpp"

#include <exception>

#include <httplib.h>

namespace fastembed {

static void split_url(const std::string& url, std::string& origin, std::string& path) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) throw DownloadError("malformed url: " + url);
    size_t slash = url.find('/', scheme_end + 3);
    if (slash == std::string::npos) {
        origin = url;
        path = "/";
    } else {
        origin = url.substr(0, slash);
        path = url.substr(slash);
    }
}

void HttpArchiveSource::fetch(const std::string& url, const StartFn& on_start, const DataFn& on_data) {
    std::string origin, path;
    split_url(url, origin, path);

    httplib::Client cli(origin);
    cli.set_follow_location(true);
    cli.set_connection_timeout(30, 0);
    cli.set_read_timeout(60, 0);

    int bad_status = 0;
    std::string bad_reason;
    std::exception_ptr callback_error;

    auto res = cli.Get(
        path,
        [&](const httplib::Response& r) {
            if (r.status < 200 || r.status > 299) {
                bad_status = r.status;
                bad_reason = r.reason.empty() ? httplib::status_message(r.status) : r.reason;
                return false;
            }
            uint64_t len = 0;
            if (r.has_header("Content-Length")) {
                try {
                    len = std::stoull(r.get_header_value("Content-Length"));
                } catch (const std::exception&) {
                    len = 0; // progress falls back to an open-ended count
                }
            }
            try {
                if (on_start) on_start(len);
            } catch (...) {
                callback_error = std::current_exception();
                return false;
            }
            return true;
        },
        [&](const char* data, size_t len) {
            try {
                on_data(data, len);
            } catch (...) {
                callback_error = std::current_exception();
                return false;
            }
            return true;
        });

    if (callback_error) std::rethrow_exception(callback_error);
    if (bad_status != 0) {
        throw DownloadError("model download failed: " + std::to_string(bad_status) + " " + bad_reason);
    }
    if (!res) {
        throw DownloadError("model download failed: " + url + ": " + httplib::to_string(res.error()));
    }
}

} // namespace fastembed
