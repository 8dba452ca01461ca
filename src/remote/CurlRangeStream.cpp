#include "remote/CurlRangeStream.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cstring>
#include <fmt/format.h>

using namespace pfs::remote;
using namespace pfs::util;
using namespace pfs::logging;

CurlRangeStream::CurlRangeStream(const std::string& url, const int64_t offset, const std::optional<int64_t> length,
                                 const std::string& userAgent, const long connectTimeoutSeconds)
    : url_(url), remaining_(length), offset_(offset) {
    ensureCurlGlobalInit();

    multi_ = curl_multi_init();
    if (!multi_) throw RemoteError("curl_multi_init failed");

    CurlEasy easy;

    const std::string range = length
        ? fmt::format("Range: bytes={}-{}", offset, offset + *length - 1)
        : fmt::format("Range: bytes={}-", offset);
    headers_.add(range);

    curl_easy_setopt(easy, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(easy, CURLOPT_HTTPHEADER, headers_.get());
    curl_easy_setopt(easy, CURLOPT_USERAGENT, userAgent.c_str());
    curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT, connectTimeoutSeconds);
    curl_easy_setopt(easy, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &CurlRangeStream::onData);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, this);

    if (const CURLMcode mc = curl_multi_add_handle(multi_, easy); mc != CURLM_OK) {
        curl_multi_cleanup(multi_);
        throw RemoteError(fmt::format("curl_multi_add_handle failed: {}", curl_multi_strerror(mc)));
    }

    easy_ = easy.release();

    LogRegistry::cloud()->debug("[CurlRangeStream] Opened {} at offset {}{}", url_, offset,
                                length ? fmt::format(" (length {})", *length) : std::string{});
}

CurlRangeStream::~CurlRangeStream() {
    if (multi_ && easy_) curl_multi_remove_handle(multi_, easy_);
    if (easy_) curl_easy_cleanup(easy_);
    if (multi_) curl_multi_cleanup(multi_);
}

size_t CurlRangeStream::onData(char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* self = static_cast<CurlRangeStream*>(userdata);
    const size_t total = size * nmemb;

    if (!self->statusChecked_) {
        long code = 0;
        curl_easy_getinfo(self->easy_, CURLINFO_RESPONSE_CODE, &code);
        if (code == 200 && self->offset_ > 0) {
            LogRegistry::cloud()->debug("[CurlRangeStream] Server ignored Range, skipping {} bytes", self->offset_);
            self->skip_ = self->offset_;
        }
        self->statusChecked_ = true;
    }

    if (self->available() >= HIGH_WATER) {
        self->paused_ = true;
        return CURL_WRITEFUNC_PAUSE;
    }

    std::size_t start = 0;
    if (self->skip_ > 0) {
        start = static_cast<std::size_t>(std::min<int64_t>(self->skip_, static_cast<int64_t>(total)));
        self->skip_ -= static_cast<int64_t>(start);
    }

    std::size_t keep = total - start;
    if (self->remaining_) {
        keep = static_cast<std::size_t>(std::min<int64_t>(*self->remaining_, static_cast<int64_t>(keep)));
        *self->remaining_ -= static_cast<int64_t>(keep);
    }

    if (self->head_ > 0 && self->head_ * 2 >= self->buffer_.size()) {
        self->buffer_.erase(0, self->head_);
        self->head_ = 0;
    }

    self->buffer_.append(ptr + start, keep);
    return total;
}

void CurlRangeStream::pump() {
    while (!done_ && available() == 0) {
        if (paused_) {
            paused_ = false;
            curl_easy_pause(easy_, CURLPAUSE_CONT);
        }

        int running = 0;
        if (const CURLMcode mc = curl_multi_perform(multi_, &running); mc != CURLM_OK)
            throw RemoteError(fmt::format("curl_multi_perform failed: {}", curl_multi_strerror(mc)));

        int queued = 0;
        while (const CURLMsg* msg = curl_multi_info_read(multi_, &queued)) {
            if (msg->msg != CURLMSG_DONE) continue;
            result_ = msg->data.result;
            done_ = true;
        }

        if (remaining_ && *remaining_ <= 0) done_ = true;
        if (done_ || available() > 0 || paused_) continue;

        if (const CURLMcode mc = curl_multi_poll(multi_, nullptr, 0, 1000, nullptr); mc != CURLM_OK)
            throw RemoteError(fmt::format("curl_multi_poll failed: {}", curl_multi_strerror(mc)));
    }

    if (done_ && result_ != CURLE_OK && available() == 0) {
        long code = 0;
        curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &code);
        LogRegistry::cloud()->error("[CurlRangeStream] Download of {} failed: CURL={} HTTP={}",
                                    url_, curl_easy_strerror(result_), code);
        throw RemoteError(fmt::format("ranged download failed: {} (HTTP {})", curl_easy_strerror(result_), code), code);
    }
}

std::size_t CurlRangeStream::read(char* dst, const std::size_t n) {
    if (n == 0) return 0;

    pump();

    const std::size_t count = std::min(n, available());
    if (count == 0) return 0;

    std::memcpy(dst, buffer_.data() + head_, count);
    head_ += count;
    if (head_ == buffer_.size()) {
        buffer_.clear();
        head_ = 0;
    }
    return count;
}
