#pragma once
#include <cstdint>
#include <functional>
#include <string>

namespace fastembed {

// Streams a remote resource. on_start gets the advertised body length
// (0 when unknown) before the first on_data call.
class ArchiveSource {
public:
    using StartFn = std::function<void(uint64_t content_length)>;
    using DataFn = std::function<void(const char* data, size_t len)>;

    virtual ~ArchiveSource() = default;

    // Throws DownloadError on transport failure or a non-2xx status. Exceptions
    // thrown by the callbacks propagate unchanged.
    virtual void fetch(const std::string& url, const StartFn& on_start, const DataFn& on_data) = 0;
};

// cpp-httplib client, follows redirects.
class HttpArchiveSource final : public ArchiveSource {
public:
    void fetch(const std::string& url, const StartFn& on_start, const DataFn& on_data) override;
};

} // namespace fastembed
