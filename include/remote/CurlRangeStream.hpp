#pragma once

#include "remote/Store.hpp"
#include "util/curlWrappers.hpp"

#include <curl/curl.h>
#include <optional>
#include <string>

namespace pfs::remote {

// One ranged HTTP GET driven through the curl multi interface. The transfer is
// paused whenever the local buffer is above HIGH_WATER and resumed on read(),
// so sequential reads share a single connection.
class CurlRangeStream final : public ByteStream {
public:
    CurlRangeStream(const std::string& url, int64_t offset, std::optional<int64_t> length,
                    const std::string& userAgent, long connectTimeoutSeconds);

    ~CurlRangeStream() override;

    CurlRangeStream(const CurlRangeStream&) = delete;
    CurlRangeStream& operator=(const CurlRangeStream&) = delete;

    std::size_t read(char* dst, std::size_t n) override;

    static constexpr std::size_t HIGH_WATER = 4 * 1024 * 1024;

private:
    static size_t onData(char* ptr, size_t size, size_t nmemb, void* userdata);

    void pump();
    [[nodiscard]] std::size_t available() const { return buffer_.size() - head_; }

    CURLM* multi_{nullptr};
    CURL* easy_{nullptr};
    util::SList headers_;
    std::string url_;
    std::string buffer_;
    std::size_t head_{0};
    int64_t skip_{0};                    // bytes to drop when the server ignored the Range header
    std::optional<int64_t> remaining_;   // bytes still wanted when a length was requested
    int64_t offset_;
    bool statusChecked_{false};
    bool paused_{false};
    bool done_{false};
    CURLcode result_{CURLE_OK};
};

}
