/*
 * bulkget/src/transfer/range_reader_curl.cpp
 *
 * Notes
 * - Ranged GET against the public virtual-host endpoint of the bucket
 *   (https://<bucket>.s3.amazonaws.com/<key>) using the libcurl easy API; requests are
 *   unsigned, which is what public buckets accept
 * - The status line is checked before the first body byte reaches the sink, so an error
 *   page or an ignored Range header is never written into the target file
 * - Stalled transfers are aborted by a low-speed limit rather than a total timeout;
 *   a 20 MiB chunk on a slow link can legitimately take minutes
 * - Errors map onto transient (NetworkError, Timeout, ServerError) or permanent codes so
 *   the ChunkFetcher retry policy can tell them apart
 *
 * Build
 * - Linked via CURL::libcurl; depends on spdlog for logging
 */

#include <bulkget/transfer/transfer.hpp>

#include <curl/curl.h>
#include <spdlog/logger.h>

#include <algorithm>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace bulkget::transfer {

namespace {

std::once_flag g_curlInit;

void ensureCurlGlobalInit() {
    std::call_once(g_curlInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::None;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
            err.code = ErrorCode::PermissionDenied;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

Error makeStatusError(long status) {
    const std::string msg = "HTTP status " + std::to_string(status);
    if (status == 408 || status == 429 || status >= 500)
        return Error{ErrorCode::ServerError, msg};
    if (status == 401 || status == 403)
        return Error{ErrorCode::PermissionDenied, msg};
    return Error{ErrorCode::InvalidArgument, msg};
}

// Write sink context for readRange
struct WriteContext {
    CURL* curl{nullptr};
    const ByteSink* sink{nullptr};
    bool fullObjectOk{false}; // 200 acceptable when the range covers the whole object
    bool statusChecked{false};
    long badStatus{0};
    std::optional<Error> sinkError;
};

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr || total == 0)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (!ctx->statusChecked) {
        long status = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
        ctx->statusChecked = true;
        if (status != 206 && !(status == 200 && ctx->fullObjectOk)) {
            ctx->badStatus = status;
            return 0; // abort => CURLE_WRITE_ERROR
        }
    }

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (*ctx->sink)(bytes);
    if (!r.ok()) {
        ctx->sinkError = r.error();
        return 0;
    }
    return total;
}

class CurlRangeReader final : public IRangeReader {
public:
    CurlRangeReader(LoggerPtr log, std::chrono::milliseconds stallTimeout)
        : log_(log ? std::move(log) : nullLogger()), stallTimeout_(stallTimeout) {
        ensureCurlGlobalInit();
    }

    Expected<void> readRange(const ObjectDescriptor& object, const ByteRange& range,
                             const ByteSink& sink) override {
        auto loc = parseObjectLocation(object.location);
        if (!loc) {
            return Error{ErrorCode::InvalidArgument, "unrecognized location: " + object.location};
        }
        if (range.end < range.start || range.end >= object.sizeBytes) {
            return Error{ErrorCode::InvalidArgument, "malformed range " +
                                                         std::to_string(range.start) + "-" +
                                                         std::to_string(range.end)};
        }

        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        const std::string url = loc->httpsUrl();
        const std::string rangeSpec = std::to_string(range.start) + "-" + std::to_string(range.end);

        WriteContext wctx;
        wctx.curl = curl;
        wctx.sink = &sink;
        wctx.fullObjectOk = range.start == 0 && range.end + 1 == object.sizeBytes;

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_RANGE, rangeSpec.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &wctx);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);

        // Timeouts: connect bound + stall detection
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 10000L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME,
                         static_cast<long>(std::max<std::int64_t>(1, stallTimeout_.count() / 1000)));

        // Robustness
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);

        CURLcode rc = curl_easy_perform(curl);
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        curl_easy_cleanup(curl);

        if (wctx.sinkError)
            return *wctx.sinkError;
        if (wctx.badStatus != 0) {
            log_->debug("range {} of {} rejected with HTTP {}", rangeSpec, url, wctx.badStatus);
            return makeStatusError(wctx.badStatus);
        }
        if (rc != CURLE_OK)
            return makeCurlError(rc, "readRange(GET " + rangeSpec + ")");
        if (status >= 400)
            return makeStatusError(status);
        return Expected<void>{};
    }

private:
    LoggerPtr log_;
    std::chrono::milliseconds stallTimeout_;
};

} // namespace

std::unique_ptr<IRangeReader> makeCurlRangeReader(LoggerPtr log,
                                                  std::chrono::milliseconds timeout) {
    return std::make_unique<CurlRangeReader>(std::move(log), timeout);
}

} // namespace bulkget::transfer
